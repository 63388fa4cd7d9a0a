// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/server/message.hpp>
#include <algorithm>
#include <cctype>

namespace filelink::server {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::optional<std::string_view> Request::header(std::string_view name) const {
    auto it = headers.find(std::string(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::string_view Request::path() const noexcept {
    std::string_view t = target;
    auto pos = t.find_first_of("?#");
    return pos == std::string_view::npos ? t : t.substr(0, pos);
}

std::string_view Request::query() const noexcept {
    std::string_view t = target;
    auto pos = t.find('?');
    if (pos == std::string_view::npos) {
        return {};
    }
    t = t.substr(pos + 1);
    auto hash = t.find('#');
    return hash == std::string_view::npos ? t : t.substr(0, hash);
}

void Response::set(std::string name, std::string value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = std::move(value);
            return;
        }
    }
    headers.emplace_back(std::move(name), std::move(value));
}

std::optional<std::string_view> Response::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

} // namespace filelink::server
