#pragma once

#include "core/remote_tab.hpp"
#include <QString>
#include <vector>

namespace tabsync::cli {

struct FormatOptions {
    bool includeGuids = false;
    bool includeHistory = false;
};

// Text output, one client per block:
//   Laptop [desktop] (2 tabs)
//     - Example <https://example.com/>
[[nodiscard]] QString format_clients_and_tabs(const std::vector<ClientAndTabs>& clients,
                                              const FormatOptions& options = {});

// JSON output:
// {
//   "clients": [{ "guid"?, "name", "modified", "type"?, "fxaDeviceId"?, "tabs": [ ... ] }]
// }
[[nodiscard]] QString format_clients_and_tabs_json(const std::vector<ClientAndTabs>& clients,
                                                   const FormatOptions& options = {});

// Same shapes for a bare tab list (local tabs): text lines, or { "tabs": [ ... ] }.
[[nodiscard]] QString format_tabs(const std::vector<RemoteTab>& tabs,
                                  const FormatOptions& options = {});
[[nodiscard]] QString format_tabs_json(const std::vector<RemoteTab>& tabs,
                                       const FormatOptions& options = {});

} // namespace tabsync::cli
