// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/upstream/catalog.hpp>
#include <filelink/core/url.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace filelink::upstream {

using core::StreamErrc;
using core::make_error_code;

namespace {

std::expected<CatalogEntry, std::error_code> parse_entry(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id") || !j.contains("code") || !j.contains("url")) {
        return std::unexpected(make_error_code(StreamErrc::invalid_config));
    }

    CatalogEntry entry;
    entry.id = j.at("id").get<std::uint64_t>();
    entry.code = j.at("code").get<std::string>();
    entry.url = j.at("url").get<std::string>();

    if (entry.code.empty() || !core::Url::parse(entry.url)) {
        return std::unexpected(make_error_code(StreamErrc::invalid_config));
    }

    if (j.contains("name")) {
        entry.name = j["name"].get<std::string>();
    }
    if (j.contains("mime_type")) {
        entry.mime_type = j["mime_type"].get<std::string>();
    }
    if (j.contains("size")) {
        entry.size = j["size"].get<std::uint64_t>();
    }
    if (j.contains("media")) {
        entry.media = core::parse_media_kind(j["media"].get<std::string>());
        if (!entry.media) {
            return std::unexpected(make_error_code(StreamErrc::invalid_config));
        }
    }

    return entry;
}

} // namespace

//=============================================================================
// Catalog
//=============================================================================

std::expected<Catalog, std::error_code> Catalog::load(const std::string& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            spdlog::error("Cannot open catalog: {}", path);
            return std::unexpected(make_error_code(StreamErrc::invalid_config));
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return parse(contents.str());
    } catch (const std::exception& e) {
        spdlog::error("Cannot read catalog {}: {}", path, e.what());
        return std::unexpected(make_error_code(StreamErrc::invalid_config));
    }
}

std::expected<Catalog, std::error_code> Catalog::parse(std::string_view json) noexcept {
    try {
        auto doc = nlohmann::json::parse(json);
        if (!doc.contains("files") || !doc["files"].is_array()) {
            spdlog::error("Catalog has no \"files\" array");
            return std::unexpected(make_error_code(StreamErrc::invalid_config));
        }

        Catalog catalog;
        for (const auto& item : doc["files"]) {
            auto entry = parse_entry(item);
            if (!entry) {
                spdlog::error("Invalid catalog entry: {}", item.dump());
                return std::unexpected(entry.error());
            }
            if (catalog.find(entry->id)) {
                spdlog::error("Duplicate catalog id: {}", entry->id);
                return std::unexpected(make_error_code(StreamErrc::invalid_config));
            }
            catalog.add(std::move(*entry));
        }
        return catalog;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Catalog parse error: {}", e.what());
        return std::unexpected(make_error_code(StreamErrc::invalid_config));
    }
}

const CatalogEntry* Catalog::find(std::uint64_t id) const noexcept {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

void Catalog::add(CatalogEntry entry) {
    auto id = entry.id;
    entries_.insert_or_assign(id, std::move(entry));
}

//=============================================================================
// CatalogResolver
//=============================================================================

CatalogResolver::CatalogResolver(Catalog catalog,
                                 std::shared_ptr<HttpSession> session,
                                 std::chrono::milliseconds probe_timeout)
    : catalog_(std::move(catalog))
    , session_(std::move(session))
    , probe_timeout_(probe_timeout) {}

std::expected<core::FileInfo, std::error_code>
CatalogResolver::resolve(std::uint64_t id, std::stop_token stop) {
    const CatalogEntry* entry = catalog_.find(id);
    if (!entry) {
        return std::unexpected(make_error_code(StreamErrc::file_not_found));
    }

    const bool complete_entry = entry->size && !entry->mime_type.empty() && !entry->name.empty();
    if (complete_entry || !session_) {
        return complete(*entry, nullptr, std::chrono::system_clock::now());
    }

    auto probe = session_->head(entry->url, probe_timeout_, stop);
    if (!probe) {
        spdlog::warn("Origin probe failed - File: {}, Error: {}", id, probe.error().message());
        return std::unexpected(probe.error());
    }
    return complete(*entry, &*probe, std::chrono::system_clock::now());
}

std::expected<core::FileInfo, std::error_code>
CatalogResolver::complete(const CatalogEntry& entry,
                          const HttpResponse* probe,
                          std::chrono::system_clock::time_point now) {
    core::FileInfo info;
    info.handle.id = entry.id;
    info.handle.source = entry.url;
    info.access_code = entry.code;
    info.media = entry.media.value_or(core::MediaKind::document);

    if (entry.size) {
        info.handle.size = *entry.size;
    } else if (probe) {
        info.handle.size = probe->content_length;
    }

    info.name = entry.name;
    if (info.name.empty() && probe) {
        info.name = probe->filename;
    }
    if (info.name.empty() && info.media != core::MediaKind::document) {
        auto generated = core::default_file_name(info.media, now);
        if (generated) {
            info.name = std::move(*generated);
        }
    }
    if (info.name.empty()) {
        if (auto url = core::Url::parse(entry.url)) {
            info.name = url->filename();
        }
    }
    if (info.name.empty()) {
        return std::unexpected(make_error_code(StreamErrc::invalid_media));
    }

    info.mime_type = entry.mime_type;
    if (info.mime_type.empty() && probe) {
        info.mime_type = probe->content_type;
    }
    if (info.mime_type.empty()) {
        info.mime_type = core::guess_mime_type(info.name);
    }

    return info;
}

} // namespace filelink::upstream
