#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace tabsync::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * All migrations in order.
 *
 * The tables deliberately carry no foreign keys: a tab may name a client
 * that has not arrived yet, and local tabs have no client at all.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "clients_and_tabs",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS clients (
                guid TEXT,
                name TEXT NOT NULL,
                modified INTEGER NOT NULL,
                type TEXT,
                formfactor TEXT,
                os TEXT,
                version TEXT,
                fxaDeviceId TEXT
            );

            CREATE TABLE IF NOT EXISTS tabs (
                client_guid TEXT,
                url TEXT NOT NULL,
                title TEXT NOT NULL,
                history TEXT,
                last_used INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS tabs;
            DROP TABLE IF EXISTS clients;
        )SQL"
    },
    {
        .version = 2,
        .name = "remote_devices",
        .up_sql = R"SQL(
            -- Account device registry, written by the account layer.
            -- Read here only as an existence filter for clients.
            CREATE TABLE IF NOT EXISTS remote_devices (
                guid TEXT PRIMARY KEY,
                name TEXT NOT NULL DEFAULT '',
                type TEXT,
                is_current_device INTEGER NOT NULL DEFAULT 0,
                date_created INTEGER NOT NULL DEFAULT 0,
                date_modified INTEGER NOT NULL DEFAULT 0,
                last_access_time INTEGER
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS remote_devices;
        )SQL"
    },
    {
        .version = 3,
        .name = "client_lookup_indexes",
        .up_sql = R"SQL(
            CREATE INDEX IF NOT EXISTS idx_tabs_client_guid ON tabs(client_guid);
            CREATE INDEX IF NOT EXISTS idx_clients_guid ON clients(guid);
            CREATE INDEX IF NOT EXISTS idx_clients_fxa_device ON clients(fxaDeviceId);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_clients_fxa_device;
            DROP INDEX IF EXISTS idx_clients_guid;
            DROP INDEX IF EXISTS idx_tabs_client_guid;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    /**
     * Migrate to a specific version.
     */
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Rollback the last migration.
     */
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Rollback to a specific version.
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    /**
     * Get the current schema version.
     */
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace tabsync::storage
