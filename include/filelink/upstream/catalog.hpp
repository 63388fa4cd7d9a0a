// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_source.hpp>
#include <filelink/core/media.hpp>
#include <filelink/upstream/http_session.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace filelink::upstream {

// One stored file as listed in the catalog
struct CatalogEntry {
    std::uint64_t id{0};
    std::string code;                        // Access code clients must present
    std::string url;                         // Origin location of the bytes
    std::string name;
    std::string mime_type;
    std::optional<std::uint64_t> size;
    std::optional<core::MediaKind> media;
};

// Published files, loaded from a JSON document:
// { "files": [ { "id": 1, "code": "...", "url": "...", ... } ] }
class Catalog {
public:
    [[nodiscard]] static std::expected<Catalog, std::error_code> load(const std::string& path) noexcept;
    [[nodiscard]] static std::expected<Catalog, std::error_code> parse(std::string_view json) noexcept;

    [[nodiscard]] const CatalogEntry* find(std::uint64_t id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    void add(CatalogEntry entry);

private:
    std::unordered_map<std::uint64_t, CatalogEntry> entries_;
};

// FileResolver backed by a Catalog. Attributes the catalog leaves out are
// probed from the origin with a HEAD request.
class CatalogResolver final : public core::FileResolver {
public:
    CatalogResolver(Catalog catalog,
                    std::shared_ptr<HttpSession> session,
                    std::chrono::milliseconds probe_timeout);

    [[nodiscard]] std::expected<core::FileInfo, std::error_code>
    resolve(std::uint64_t id, std::stop_token stop) override;

    // Merge catalog data with an optional origin probe. Name falls back to
    // the media default name, then to the URL's last path segment.
    [[nodiscard]] static std::expected<core::FileInfo, std::error_code>
    complete(const CatalogEntry& entry,
             const HttpResponse* probe,
             std::chrono::system_clock::time_point now);

    [[nodiscard]] const Catalog& catalog() const noexcept { return catalog_; }

private:
    Catalog catalog_;
    std::shared_ptr<HttpSession> session_;
    std::chrono::milliseconds probe_timeout_;
};

} // namespace filelink::upstream
