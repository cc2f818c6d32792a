#include <catch2/catch_test_macros.hpp>
#include "storage/codecs.hpp"
#include "storage/database.hpp"

using namespace tabsync;
using namespace tabsync::storage;

namespace {

// Prepare `select` (which must return exactly one row) and decode it.
template<typename Decoder>
auto decode_single_row(Database& db, const std::string& select, Decoder decode) {
    auto stmt = db.prepare(select).unwrap();
    REQUIRE(stmt.step().unwrap());
    return decode(stmt);
}

} // namespace

TEST_CASE("decode_remote_client maps every column", "[codecs]") {
    auto db = Database::open_memory().unwrap();

    SECTION("All columns present") {
        auto result = decode_single_row(db,
            "SELECT 'guid-1', 'Laptop', 1700000000000, 'desktop', 'largetablet', "
            "'Linux', '120.0', 'device-1';",
            decode_remote_client);

        REQUIRE(result.is_ok());
        const auto& client = result.unwrap();
        REQUIRE(client.guid == std::optional<Guid>("guid-1"));
        REQUIRE(client.name == "Laptop");
        REQUIRE(client.modified == Timestamp(1700000000000ULL));
        REQUIRE(client.type == std::optional<std::string>("desktop"));
        REQUIRE(client.formfactor == std::optional<std::string>("largetablet"));
        REQUIRE(client.os == std::optional<std::string>("Linux"));
        REQUIRE(client.version == std::optional<std::string>("120.0"));
        REQUIRE(client.fxa_device_id == std::optional<std::string>("device-1"));
    }

    SECTION("Optional columns default to absent") {
        auto result = decode_single_row(db,
            "SELECT NULL, 'Phone', 5, NULL, NULL, NULL, NULL, NULL;",
            decode_remote_client);

        REQUIRE(result.is_ok());
        const auto& client = result.unwrap();
        REQUIRE_FALSE(client.guid.has_value());
        REQUIRE_FALSE(client.type.has_value());
        REQUIRE_FALSE(client.fxa_device_id.has_value());
    }

    SECTION("Missing name is a decode error") {
        auto result = decode_single_row(db,
            "SELECT 'g', NULL, 5, NULL, NULL, NULL, NULL, NULL;",
            decode_remote_client);

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Decode);
    }

    SECTION("Non-integer modified is a decode error") {
        auto result = decode_single_row(db,
            "SELECT 'g', 'Name', 'yesterday', NULL, NULL, NULL, NULL, NULL;",
            decode_remote_client);

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Decode);
    }

    SECTION("Timestamps above INT64_MAX survive storage") {
        const uint64_t big = 0xFFFFFFFFFFFFFFF0ULL;
        auto stmt = db.prepare(
            "SELECT 'g', 'Name', ?, NULL, NULL, NULL, NULL, NULL;").unwrap();
        REQUIRE(stmt.bind_int64(1, Timestamp(big).to_sql()).is_ok());
        REQUIRE(stmt.step().unwrap());

        auto result = decode_remote_client(stmt);
        REQUIRE(result.unwrap().modified.millis() == big);
    }
}

TEST_CASE("decode_remote_tab maps every column", "[codecs]") {
    auto db = Database::open_memory().unwrap();

    SECTION("Remote tab with history") {
        auto result = decode_single_row(db,
            "SELECT 'client-1', 'https://example.com/page', 'Example', "
            "'[\"https://example.com/prev\",\"https://example.com/first\"]', 42;",
            decode_remote_tab);

        REQUIRE(result.is_ok());
        const auto& tab = result.unwrap();
        REQUIRE(tab.client_guid == std::optional<Guid>("client-1"));
        REQUIRE(tab.url == QUrl("https://example.com/page"));
        REQUIRE(tab.title == "Example");
        REQUIRE(tab.history.size() == 2);
        REQUIRE(tab.history[0] == QUrl("https://example.com/prev"));
        REQUIRE(tab.last_used == Timestamp(42));
        REQUIRE_FALSE(tab.icon.has_value());
        REQUIRE_FALSE(tab.is_local());
    }

    SECTION("Local tab with malformed history degrades to empty history") {
        auto result = decode_single_row(db,
            "SELECT NULL, 'https://example.com/', 'Local', 'not json', 1;",
            decode_remote_tab);

        REQUIRE(result.is_ok());
        REQUIRE(result.unwrap().is_local());
        REQUIRE(result.unwrap().history.empty());
    }

    SECTION("Unparseable url is a decode error") {
        auto result = decode_single_row(db,
            "SELECT 'c', 'not a url', 'Broken', NULL, 1;",
            decode_remote_tab);

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Decode);
    }

    SECTION("Missing title is a decode error") {
        auto result = decode_single_row(db,
            "SELECT 'c', 'https://example.com/', NULL, NULL, 1;",
            decode_remote_tab);

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Decode);
    }
}

TEST_CASE("encode_history serializes absolute URLs in order", "[codecs][history]") {
    SECTION("Empty history encodes to an empty array") {
        REQUIRE(encode_history({}) == std::optional<std::string>("[]"));
    }

    SECTION("Invalid and empty entries are dropped") {
        const std::vector<QUrl> history{
            QUrl("https://a.example/"),
            QUrl(),
            QUrl("relative/path"),
            QUrl("https://b.example/x")
        };

        auto encoded = encode_history(history);
        REQUIRE(encoded.has_value());
        REQUIRE(*encoded == R"(["https://a.example/","https://b.example/x"])");
    }
}

TEST_CASE("decode_history tolerates bad input", "[codecs][history]") {
    SECTION("Absent input") {
        REQUIRE(decode_history(std::nullopt).empty());
    }

    SECTION("Not JSON") {
        REQUIRE(decode_history(std::string("{oops")).empty());
    }

    SECTION("Invalid UTF-8") {
        REQUIRE(decode_history(std::string("[\"https://a.example/\xff\xfe\"]")).empty());
    }

    SECTION("JSON object instead of array") {
        REQUIRE(decode_history(std::string(R"({"url":"https://a.example/"})")).empty());
    }

    SECTION("Array containing a non-string") {
        REQUIRE(decode_history(std::string(R"(["https://a.example/", 3])")).empty());
    }

    SECTION("Unparseable entries are dropped, the rest kept in order") {
        auto history = decode_history(std::string(
            R"(["https://a.example/", "", "no scheme", "https://b.example/"])"));
        REQUIRE(history.size() == 2);
        REQUIRE(history[0] == QUrl("https://a.example/"));
        REQUIRE(history[1] == QUrl("https://b.example/"));
    }
}

TEST_CASE("parse_absolute_url", "[codecs]") {
    REQUIRE(parse_absolute_url("https://example.com/").has_value());
    REQUIRE(parse_absolute_url("about:blank").has_value());
    REQUIRE_FALSE(parse_absolute_url("").has_value());
    REQUIRE_FALSE(parse_absolute_url("/just/a/path").has_value());
    REQUIRE_FALSE(parse_absolute_url("http://exa mple.com/").has_value());
}
