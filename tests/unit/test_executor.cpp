#include <catch2/catch_test_macros.hpp>
#include "storage/executor.hpp"

#include <QThread>
#include <stdexcept>

using namespace tabsync;
using namespace tabsync::storage;

namespace {

int count_rows(Database& db) {
    auto stmt = db.prepare("SELECT COUNT(*) FROM items;").unwrap();
    REQUIRE(stmt.step().unwrap());
    return stmt.column_int(0);
}

Result<std::string, Error> decode_label(const Statement& row) {
    if (row.column_is_null(0)) {
        return Result<std::string, Error>::err(Error::decode("items.label is NULL"));
    }
    return Result<std::string, Error>::ok(row.column_text(0));
}

} // namespace

TEST_CASE("Executor runs work off the calling thread", "[executor]") {
    auto db = Database::open_memory().unwrap();
    Executor executor(db);

    QThread* caller = QThread::currentThread();
    auto future = executor.with_connection([caller](Database&) {
        return Result<bool, Error>::ok(QThread::currentThread() != caller);
    });

    REQUIRE(future.result().unwrap());
}

TEST_CASE("Executor serializes work in submission order", "[executor]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(db.execute("CREATE TABLE items (label TEXT, seq INTEGER);").is_ok());
    Executor executor(db);

    std::vector<Deferred<void>> pending;
    for (int i = 0; i < 20; ++i) {
        pending.push_back(executor.run("INSERT INTO items (label, seq) VALUES (?, ?);",
                                       {Value{std::to_string(i)}, Value{int64_t{i}}}));
    }
    for (auto& f : pending) {
        REQUIRE(f.result().is_ok());
    }

    auto rows = executor.run_query<std::string>(
        "SELECT label FROM items ORDER BY rowid;", {}, decode_label,
        DecodeFailurePolicy::FailQuery).result();
    REQUIRE(rows.is_ok());
    REQUIRE(rows.unwrap().size() == 20);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(rows.unwrap()[static_cast<size_t>(i)] == std::to_string(i));
    }
}

TEST_CASE("Executor transaction is all-or-nothing", "[executor]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(db.execute("CREATE TABLE items (label TEXT NOT NULL);").is_ok());
    Executor executor(db);

    auto failed = executor.transaction([](Database& conn) -> Result<void, Error> {
        return conn.execute_change("INSERT INTO items VALUES ('kept?');")
            .and_then([&]() { return conn.execute_change("INSERT INTO items VALUES (NULL);"); });
    }).result();

    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ErrorKind::Statement);
    executor.wait_for_idle();
    REQUIRE(count_rows(db) == 0);

    auto committed = executor.transaction([](Database& conn) -> Result<int, Error> {
        auto r = conn.execute_change("INSERT INTO items VALUES ('a');");
        if (r.is_err()) return Result<int, Error>::err(r.unwrap_err());
        return Result<int, Error>::ok(conn.changes());
    }).result();

    REQUIRE(committed.unwrap() == 1);
    executor.wait_for_idle();
    REQUIRE(count_rows(db) == 1);
}

TEST_CASE("Executor run_query applies the decode failure policy", "[executor]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(db.execute("CREATE TABLE items (label TEXT);").is_ok());
    REQUIRE(db.execute("INSERT INTO items VALUES ('a'), (NULL), ('b');").is_ok());
    Executor executor(db);

    SECTION("SkipRow drops the bad row") {
        auto rows = executor.run_query<std::string>(
            "SELECT label FROM items ORDER BY rowid;", {}, decode_label,
            DecodeFailurePolicy::SkipRow).result();
        REQUIRE(rows.is_ok());
        REQUIRE(rows.unwrap() == std::vector<std::string>{"a", "b"});
    }

    SECTION("FailQuery surfaces the decode error") {
        auto rows = executor.run_query<std::string>(
            "SELECT label FROM items ORDER BY rowid;", {}, decode_label,
            DecodeFailurePolicy::FailQuery).result();
        REQUIRE(rows.is_err());
        REQUIRE(rows.unwrap_err().kind == ErrorKind::Decode);
    }
}

TEST_CASE("Executor reports statement errors through the future", "[executor]") {
    auto db = Database::open_memory().unwrap();
    Executor executor(db);

    auto result = executor.run("INSERT INTO missing_table VALUES (1);").result();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Statement);
}

TEST_CASE("Executor forwards exceptions to the waiting caller", "[executor]") {
    auto db = Database::open_memory().unwrap();
    Executor executor(db);

    auto future = executor.with_connection([](Database&) -> Result<int, Error> {
        throw std::runtime_error("unit of work blew up");
    });

    REQUIRE_THROWS_AS(future.waitForFinished(), std::runtime_error);
}

TEST_CASE("Executor transaction that throws leaves the connection usable", "[executor]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(db.execute("CREATE TABLE items (label TEXT NOT NULL);").is_ok());
    Executor executor(db);

    auto thrown = executor.transaction([](Database& conn) -> Result<void, Error> {
        auto r = conn.execute_change("INSERT INTO items VALUES ('discarded');");
        if (r.is_err()) return r;
        throw std::runtime_error("unit of work blew up mid-transaction");
    });
    REQUIRE_THROWS_AS(thrown.waitForFinished(), std::runtime_error);

    auto next = executor.transaction([](Database& conn) -> Result<void, Error> {
        return conn.execute_change("INSERT INTO items VALUES ('kept');");
    }).result();

    REQUIRE(next.is_ok());
    executor.wait_for_idle();
    REQUIRE(count_rows(db) == 1);
}
