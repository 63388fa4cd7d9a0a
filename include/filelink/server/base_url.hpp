// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/server/message.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace filelink::server {

// Reads one environment variable; empty values count as unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

[[nodiscard]] std::optional<std::string> system_env(std::string_view name);

// Public URL of this deployment, decided once at startup from the hosting
// platform's environment, else http://<local-ip>:<port>
[[nodiscard]] std::string detect_base_url(std::uint16_t port, const EnvLookup& env = system_env);

// Address of the interface that routes to the internet, 127.0.0.1 if none
[[nodiscard]] std::string local_ip_address();

// Base URL as seen by the client of one request. Forwarding proxy headers
// win over Host, which wins over the startup value.
[[nodiscard]] std::string request_base_url(const Request& request, std::string_view fallback);

} // namespace filelink::server
