#pragma once

#include "core/remote_client.hpp"
#include "core/remote_tab.hpp"
#include "core/result.hpp"
#include "storage/codecs.hpp"
#include "storage/executor.hpp"
#include <optional>
#include <set>
#include <vector>

namespace tabsync::storage {

/**
 * RemoteClientsAndTabsStorage - What the tab sync engine reads and writes.
 *
 * Every call returns a future that completes once, with either a value or
 * the Error that aborted the operation. Writes are atomic: a failed write
 * leaves the store as it was.
 */
class RemoteClientsAndTabsStorage {
public:
    virtual ~RemoteClientsAndTabsStorage() = default;

    // Lifecycle
    [[nodiscard]] virtual Deferred<void> wipe_remote_tabs() = 0;
    [[nodiscard]] virtual Deferred<void> wipe_tabs() = 0;
    [[nodiscard]] virtual Deferred<void> delete_client(const Guid& guid) = 0;

    // Writers
    [[nodiscard]] virtual Deferred<int> replace_tabs(
        const std::optional<Guid>& client_guid,
        const std::vector<RemoteTab>& tabs) = 0;
    [[nodiscard]] virtual Deferred<int> replace_local_tabs(const std::vector<RemoteTab>& tabs) = 0;
    [[nodiscard]] virtual Deferred<int> upsert_clients(const std::vector<RemoteClient>& clients) = 0;
    [[nodiscard]] virtual Deferred<int> upsert_client(const RemoteClient& client) = 0;

    // Readers
    [[nodiscard]] virtual Deferred<std::optional<RemoteClient>> get_client(const Guid& guid) = 0;
    [[nodiscard]] virtual Deferred<std::optional<RemoteClient>> get_client_by_fxa_device_id(
        const std::string& fxa_device_id) = 0;
    [[nodiscard]] virtual Deferred<std::set<Guid>> get_client_guids() = 0;
    [[nodiscard]] virtual Deferred<std::vector<RemoteTab>> get_tabs_for_client(
        const std::optional<Guid>& guid) = 0;
    [[nodiscard]] virtual Deferred<std::vector<ClientAndTabs>> get_clients_and_tabs() = 0;
};

/**
 * ResettableSyncStorage - Storage that can drop all of its sync state.
 */
class ResettableSyncStorage {
public:
    virtual ~ResettableSyncStorage() = default;

    [[nodiscard]] virtual Deferred<void> reset_client() = 0;
    [[nodiscard]] virtual Deferred<void> clear() = 0;
};

/**
 * Attach to each client (in the given order) the tabs whose client_guid
 * matches its guid, keeping the tabs' relative order. Tabs without a
 * client_guid or whose client is not listed are dropped. Clients sharing
 * a guid each receive the same tabs.
 */
[[nodiscard]] std::vector<ClientAndTabs> join_clients_and_tabs(
    std::vector<RemoteClient> clients,
    std::vector<RemoteTab> tabs);

/**
 * RemoteClientsAndTabs - SQLite implementation of both interfaces.
 *
 * Holds no state beyond the executor reference; any number of instances
 * may share one Executor.
 */
class RemoteClientsAndTabs final : public RemoteClientsAndTabsStorage,
                                   public ResettableSyncStorage {
public:
    explicit RemoteClientsAndTabs(
        Executor& executor,
        DecodeFailurePolicy decode_policy = DecodeFailurePolicy::SkipRow)
        : executor_(executor), decode_policy_(decode_policy) {}

    Deferred<void> wipe_remote_tabs() override;
    Deferred<void> wipe_tabs() override;
    Deferred<void> delete_client(const Guid& guid) override;

    /**
     * Replace every tab whose client_guid IS `client_guid` (NULL when absent)
     * with `tabs`. Resolves to the number of rows actually inserted.
     * The tabs' own client_guid values are written as given.
     */
    Deferred<int> replace_tabs(
        const std::optional<Guid>& client_guid,
        const std::vector<RemoteTab>& tabs) override;
    Deferred<int> replace_local_tabs(const std::vector<RemoteTab>& tabs) override;

    /**
     * Update each client by guid, inserting it when no row matched.
     * Resolves to the number of clients processed.
     */
    Deferred<int> upsert_clients(const std::vector<RemoteClient>& clients) override;
    Deferred<int> upsert_client(const RemoteClient& client) override;

    Deferred<std::optional<RemoteClient>> get_client(const Guid& guid) override;
    Deferred<std::optional<RemoteClient>> get_client_by_fxa_device_id(
        const std::string& fxa_device_id) override;
    Deferred<std::set<Guid>> get_client_guids() override;
    Deferred<std::vector<RemoteTab>> get_tabs_for_client(const std::optional<Guid>& guid) override;

    /**
     * Clients registered in remote_devices, most recently modified first,
     * each with its tabs, most recently used first.
     */
    Deferred<std::vector<ClientAndTabs>> get_clients_and_tabs() override;

    // For this store a reset is the same as clear().
    Deferred<void> reset_client() override;
    Deferred<void> clear() override;

private:
    [[nodiscard]] Deferred<std::optional<RemoteClient>> first_client_where(
        const char* column, std::string value);

    Executor& executor_;
    DecodeFailurePolicy decode_policy_;
};

} // namespace tabsync::storage
