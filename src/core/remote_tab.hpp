#pragma once

#include "core/remote_client.hpp"
#include "core/types.hpp"
#include <QUrl>
#include <optional>
#include <string>
#include <vector>

namespace tabsync {

/**
 * RemoteTab - One open tab as reported by a device.
 *
 * A tab without client_guid belongs to this device ("local tab").
 * history is ordered most-recent first. icon is never persisted and is
 * ignored by equality.
 */
struct RemoteTab {
    std::optional<Guid> client_guid;
    QUrl url;
    std::string title;
    std::vector<QUrl> history;
    Timestamp last_used;
    std::optional<QUrl> icon;

    [[nodiscard]] bool is_local() const noexcept { return !client_guid.has_value(); }

    bool operator==(const RemoteTab& other) const {
        return client_guid == other.client_guid &&
               url == other.url &&
               title == other.title &&
               history == other.history &&
               last_used == other.last_used;
    }
};

/**
 * ClientAndTabs - A client paired with its tabs, most recently used first.
 *
 * Built on read; never persisted.
 */
struct ClientAndTabs {
    RemoteClient client;
    std::vector<RemoteTab> tabs;

    bool operator==(const ClientAndTabs& other) const {
        return client == other.client && tabs == other.tabs;
    }
};

[[nodiscard]] inline RemoteTab create_remote_tab(
    std::optional<Guid> client_guid,
    QUrl url,
    std::string title,
    Timestamp last_used,
    std::vector<QUrl> history = {}
) {
    return RemoteTab{
        .client_guid = std::move(client_guid),
        .url = std::move(url),
        .title = std::move(title),
        .history = std::move(history),
        .last_used = last_used,
        .icon = std::nullopt
    };
}

} // namespace tabsync
