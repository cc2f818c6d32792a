#include "storage/remote_clients_and_tabs.hpp"
#include "core/logging.hpp"

#include <string>
#include <unordered_map>

namespace tabsync::storage {

namespace {

constexpr const char* INSERT_TAB_SQL = R"SQL(
    INSERT INTO tabs (client_guid, url, title, history, last_used)
    VALUES (?, ?, ?, ?, ?);
)SQL";

constexpr const char* UPDATE_CLIENT_SQL = R"SQL(
    UPDATE clients
    SET name = ?, modified = ?, type = ?, formfactor = ?, os = ?, version = ?, fxaDeviceId = ?
    WHERE guid = ?;
)SQL";

constexpr const char* INSERT_CLIENT_SQL = R"SQL(
    INSERT INTO clients (guid, name, modified, type, formfactor, os, version, fxaDeviceId)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)SQL";

[[nodiscard]] std::string select_clients(const char* where_and_order) {
    return std::string("SELECT ") + CLIENT_COLUMNS + " FROM clients " + where_and_order + ";";
}

[[nodiscard]] std::string select_tabs(const char* where_and_order) {
    return std::string("SELECT ") + TAB_COLUMNS + " FROM tabs " + where_and_order + ";";
}

[[nodiscard]] Value optional_guid(const std::optional<Guid>& guid) {
    return optional_text(guid);
}

[[nodiscard]] Args tab_insert_args(const RemoteTab& tab) {
    return {
        optional_guid(tab.client_guid),
        Value{tab.url.toString(QUrl::FullyEncoded).toStdString()},
        Value{tab.title},
        optional_text(encode_history(tab.history)),
        Value{tab.last_used.to_sql()}
    };
}

[[nodiscard]] Args client_update_args(const RemoteClient& client) {
    return {
        Value{client.name},
        Value{client.modified.to_sql()},
        optional_text(client.type),
        optional_text(client.formfactor),
        optional_text(client.os),
        optional_text(client.version),
        optional_text(client.fxa_device_id),
        optional_guid(client.guid)
    };
}

[[nodiscard]] Args client_insert_args(const RemoteClient& client) {
    return {
        optional_guid(client.guid),
        Value{client.name},
        Value{client.modified.to_sql()},
        optional_text(client.type),
        optional_text(client.formfactor),
        optional_text(client.os),
        optional_text(client.version),
        optional_text(client.fxa_device_id)
    };
}

// Reset, rebind and run a statement prepared earlier in the transaction.
[[nodiscard]] Result<void, Error> run_prepared(Statement& stmt, const Args& args) {
    auto reset_result = stmt.reset();
    if (reset_result.is_err()) {
        return reset_result;
    }
    auto bind_result = stmt.bind_all(args);
    if (bind_result.is_err()) {
        return bind_result;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace

std::vector<ClientAndTabs> join_clients_and_tabs(
    std::vector<RemoteClient> clients,
    std::vector<RemoteTab> tabs
) {
    std::unordered_map<Guid, std::vector<RemoteTab>> tabs_by_client;
    for (auto& tab : tabs) {
        if (!tab.client_guid) {
            continue;
        }
        auto& group = tabs_by_client[*tab.client_guid];
        group.push_back(std::move(tab));
    }

    std::vector<ClientAndTabs> joined;
    joined.reserve(clients.size());
    for (auto& client : clients) {
        std::vector<RemoteTab> client_tabs;
        if (client.guid) {
            auto it = tabs_by_client.find(*client.guid);
            // guid is not unique; every client row sharing it gets the group.
            if (it != tabs_by_client.end()) {
                client_tabs = it->second;
            }
        }
        joined.push_back(ClientAndTabs{std::move(client), std::move(client_tabs)});
    }
    return joined;
}

// ============================================================================
// Lifecycle
// ============================================================================

Deferred<void> RemoteClientsAndTabs::wipe_remote_tabs() {
    return executor_.run("DELETE FROM tabs WHERE client_guid IS NOT NULL;");
}

Deferred<void> RemoteClientsAndTabs::wipe_tabs() {
    return executor_.run("DELETE FROM tabs;");
}

Deferred<void> RemoteClientsAndTabs::delete_client(const Guid& guid) {
    return executor_.transaction([guid](Database& db) -> Result<void, Error> {
        const Args args{Value{guid}};
        return db.execute_change("DELETE FROM clients WHERE guid = ?;", args)
            .and_then([&]() {
                return db.execute_change("DELETE FROM tabs WHERE client_guid = ?;", args);
            });
    });
}

Deferred<void> RemoteClientsAndTabs::reset_client() {
    return clear();
}

Deferred<void> RemoteClientsAndTabs::clear() {
    return executor_.transaction([](Database& db) -> Result<void, Error> {
        return db.execute_change("DELETE FROM tabs WHERE client_guid IS NOT NULL;")
            .and_then([&]() { return db.execute_change("DELETE FROM clients;"); });
    });
}

// ============================================================================
// Writers
// ============================================================================

Deferred<int> RemoteClientsAndTabs::replace_tabs(
    const std::optional<Guid>& client_guid,
    const std::vector<RemoteTab>& tabs
) {
    return executor_.transaction([client_guid, tabs](Database& db) -> Result<int, Error> {
        // IS, not =, so that an absent guid matches the NULL local tabs.
        auto delete_result = db.execute_change("DELETE FROM tabs WHERE client_guid IS ?;",
                                               {optional_guid(client_guid)});
        if (delete_result.is_err()) {
            return Result<int, Error>::err(delete_result.unwrap_err());
        }

        auto stmt_result = db.prepare(INSERT_TAB_SQL);
        if (stmt_result.is_err()) {
            return Result<int, Error>::err(stmt_result.unwrap_err());
        }
        auto insert = std::move(stmt_result).unwrap();

        int inserted = 0;
        for (const auto& tab : tabs) {
            auto insert_result = run_prepared(insert, tab_insert_args(tab));
            if (insert_result.is_err()) {
                return Result<int, Error>::err(insert_result.unwrap_err());
            }

            // Zero when a trigger silently dropped the row.
            if (db.changes() != 1) {
                qCWarning(tabsyncStorageLog) << "Tab insert wrote no row; url ="
                                             << tab.url.toString();
            } else {
                ++inserted;
            }
        }

        qCDebug(tabsyncStorageLog) << "Replaced tabs for client"
                                   << (client_guid ? client_guid->c_str() : "<local>")
                                   << "inserted" << inserted << "of" << tabs.size();
        return Result<int, Error>::ok(inserted);
    });
}

Deferred<int> RemoteClientsAndTabs::replace_local_tabs(const std::vector<RemoteTab>& tabs) {
    return replace_tabs(std::nullopt, tabs);
}

Deferred<int> RemoteClientsAndTabs::upsert_clients(const std::vector<RemoteClient>& clients) {
    return executor_.transaction([clients](Database& db) -> Result<int, Error> {
        auto update_result = db.prepare(UPDATE_CLIENT_SQL);
        if (update_result.is_err()) {
            return Result<int, Error>::err(update_result.unwrap_err());
        }
        auto insert_result = db.prepare(INSERT_CLIENT_SQL);
        if (insert_result.is_err()) {
            return Result<int, Error>::err(insert_result.unwrap_err());
        }
        auto update = std::move(update_result).unwrap();
        auto insert = std::move(insert_result).unwrap();

        int processed = 0;
        for (const auto& client : clients) {
            auto updated = run_prepared(update, client_update_args(client));
            if (updated.is_err()) {
                return Result<int, Error>::err(updated.unwrap_err());
            }

            if (db.changes() == 0) {
                auto inserted = run_prepared(insert, client_insert_args(client));
                if (inserted.is_err()) {
                    return Result<int, Error>::err(inserted.unwrap_err());
                }
                if (db.changes() != 1) {
                    qCWarning(tabsyncStorageLog) << "Client insert wrote no row; guid ="
                                                 << client.guid.value_or("<none>").c_str();
                }
            }

            ++processed;
        }

        return Result<int, Error>::ok(processed);
    });
}

Deferred<int> RemoteClientsAndTabs::upsert_client(const RemoteClient& client) {
    return upsert_clients({client});
}

// ============================================================================
// Readers
// ============================================================================

Deferred<std::optional<RemoteClient>> RemoteClientsAndTabs::first_client_where(
    const char* column,
    std::string value
) {
    auto sql = select_clients((std::string("WHERE ") + column + " = ?").c_str());
    return executor_.with_connection(
        [sql = std::move(sql), value = std::move(value), policy = decode_policy_](Database& db)
            -> Result<std::optional<RemoteClient>, Error> {
            auto rows = read_rows<RemoteClient>(db, sql, {Value{value}}, decode_remote_client, policy);
            if (rows.is_err()) {
                return Result<std::optional<RemoteClient>, Error>::err(rows.unwrap_err());
            }
            auto& clients = rows.unwrap();
            if (clients.empty()) {
                return Result<std::optional<RemoteClient>, Error>::ok(std::nullopt);
            }
            return Result<std::optional<RemoteClient>, Error>::ok(std::move(clients.front()));
        });
}

Deferred<std::optional<RemoteClient>> RemoteClientsAndTabs::get_client(const Guid& guid) {
    return first_client_where("guid", guid);
}

Deferred<std::optional<RemoteClient>> RemoteClientsAndTabs::get_client_by_fxa_device_id(
    const std::string& fxa_device_id
) {
    return first_client_where("fxaDeviceId", fxa_device_id);
}

Deferred<std::set<Guid>> RemoteClientsAndTabs::get_client_guids() {
    return executor_.with_connection([](Database& db) -> Result<std::set<Guid>, Error> {
        std::set<Guid> guids;
        auto result = db.query("SELECT guid FROM clients WHERE guid IS NOT NULL;", {},
                               [&](Statement& stmt) { guids.insert(stmt.column_text(0)); });
        if (result.is_err()) {
            return Result<std::set<Guid>, Error>::err(result.unwrap_err());
        }
        return Result<std::set<Guid>, Error>::ok(std::move(guids));
    });
}

Deferred<std::vector<RemoteTab>> RemoteClientsAndTabs::get_tabs_for_client(
    const std::optional<Guid>& guid
) {
    if (guid) {
        return executor_.run_query<RemoteTab>(
            select_tabs("WHERE client_guid = ?"), {Value{*guid}}, decode_remote_tab, decode_policy_);
    }
    return executor_.run_query<RemoteTab>(
        select_tabs("WHERE client_guid IS NULL"), {}, decode_remote_tab, decode_policy_);
}

Deferred<std::vector<ClientAndTabs>> RemoteClientsAndTabs::get_clients_and_tabs() {
    return executor_.with_connection([policy = decode_policy_](Database& db)
            -> Result<std::vector<ClientAndTabs>, Error> {
        auto clients = read_rows<RemoteClient>(
            db,
            select_clients(
                "WHERE EXISTS (SELECT 1 FROM remote_devices rd WHERE rd.guid = fxaDeviceId) "
                "ORDER BY modified DESC"),
            {}, decode_remote_client, policy);
        if (clients.is_err()) {
            return Result<std::vector<ClientAndTabs>, Error>::err(clients.unwrap_err());
        }

        auto tabs = read_rows<RemoteTab>(
            db,
            select_tabs("WHERE client_guid IS NOT NULL ORDER BY client_guid DESC, last_used DESC"),
            {}, decode_remote_tab, policy);
        if (tabs.is_err()) {
            return Result<std::vector<ClientAndTabs>, Error>::err(tabs.unwrap_err());
        }

        return Result<std::vector<ClientAndTabs>, Error>::ok(
            join_clients_and_tabs(std::move(clients).unwrap(), std::move(tabs).unwrap()));
    });
}

} // namespace tabsync::storage
