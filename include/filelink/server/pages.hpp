// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace filelink::server {

// Fields shown on the player page
struct PlayerView {
    std::string file_name;
    std::uint64_t file_size{0};
    std::string mime_type;
    std::string file_url;  // Absolute download link
};

[[nodiscard]] std::string html_escape(std::string_view text);

// "12.34 MB"
[[nodiscard]] std::string format_size_mb(std::uint64_t bytes);

[[nodiscard]] std::string render_landing_page();
[[nodiscard]] std::string render_player_page(const PlayerView& view);

} // namespace filelink::server
