#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace tabsync {

/**
 * RemoteClient - Another device participating in tab sync.
 *
 * guid is absent only transiently, before the record has been uploaded.
 * fxa_device_id links the client to an entry in the account's device
 * registry (remote_devices).
 */
struct RemoteClient {
    std::optional<Guid> guid;
    std::string name;
    Timestamp modified;
    std::optional<std::string> type;
    std::optional<std::string> formfactor;
    std::optional<std::string> os;
    std::optional<std::string> version;
    std::optional<std::string> fxa_device_id;

    bool operator==(const RemoteClient&) const = default;
};

/**
 * Create a client with only the required fields set.
 */
[[nodiscard]] inline RemoteClient create_remote_client(
    std::optional<Guid> guid,
    std::string name,
    Timestamp modified
) {
    return RemoteClient{
        .guid = std::move(guid),
        .name = std::move(name),
        .modified = modified
    };
}

} // namespace tabsync
