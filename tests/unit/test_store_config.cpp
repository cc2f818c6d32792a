#include <catch2/catch_test_macros.hpp>
#include "storage/store_config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace tabsync::storage;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* name) : name_(name) { qunsetenv(name_); }
    ~EnvGuard() { qunsetenv(name_); }
    const char* name_;
};

} // namespace

TEST_CASE("StoreConfig defaults", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);

    const auto config = StoreConfig::load(settings);

    REQUIRE(config.database_path == default_database_path());
    REQUIRE(config.decode_failure_policy == DecodeFailurePolicy::SkipRow);
    REQUIRE_FALSE(config.debug_logging);
    REQUIRE(config.log_file_path.isEmpty());
}

TEST_CASE("StoreConfig save/load", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("tabsync.ini"));

    StoreConfig written;
    written.database_path = dir.filePath(QStringLiteral("tabs.db"));
    written.decode_failure_policy = DecodeFailurePolicy::FailQuery;
    written.debug_logging = true;
    written.log_file_path = dir.filePath(QStringLiteral("logs/tabsync.log"));

    {
        QSettings settings(path, QSettings::IniFormat);
        written.save(settings);
        settings.sync();
    }

    QSettings settings(path, QSettings::IniFormat);
    const auto read = StoreConfig::load(settings);

    REQUIRE(read.database_path == written.database_path);
    REQUIRE(read.decode_failure_policy == DecodeFailurePolicy::FailQuery);
    REQUIRE(read.debug_logging);
    REQUIRE(read.log_file_path == written.log_file_path);
}

TEST_CASE("StoreConfig environment overrides", "[config]") {
    EnvGuard db_env("TABSYNC_DB_PATH");
    EnvGuard debug_env("TABSYNC_DEBUG_STORAGE");

    StoreConfig config;
    config.database_path = QStringLiteral("/from/settings.db");

    SECTION("No environment leaves settings alone") {
        config.apply_environment();
        REQUIRE(config.database_path == QStringLiteral("/from/settings.db"));
        REQUIRE_FALSE(config.debug_logging);
    }

    SECTION("Environment wins") {
        qputenv("TABSYNC_DB_PATH", "/from/env.db");
        qputenv("TABSYNC_DEBUG_STORAGE", "1");
        config.apply_environment();
        REQUIRE(config.database_path == QStringLiteral("/from/env.db"));
        REQUIRE(config.debug_logging);
    }

    SECTION("TABSYNC_DEBUG_STORAGE=0 turns debug off") {
        config.debug_logging = true;
        qputenv("TABSYNC_DEBUG_STORAGE", "0");
        config.apply_environment();
        REQUIRE_FALSE(config.debug_logging);
    }
}

TEST_CASE("Decode failure policy parsing", "[config]") {
    REQUIRE(parse_decode_failure_policy(QStringLiteral("fail")) == DecodeFailurePolicy::FailQuery);
    REQUIRE(parse_decode_failure_policy(QStringLiteral(" FAIL ")) == DecodeFailurePolicy::FailQuery);
    REQUIRE(parse_decode_failure_policy(QStringLiteral("skip")) == DecodeFailurePolicy::SkipRow);
    REQUIRE(parse_decode_failure_policy(QStringLiteral("whatever")) == DecodeFailurePolicy::SkipRow);
    REQUIRE(to_string(DecodeFailurePolicy::FailQuery) == QStringLiteral("fail"));
}
