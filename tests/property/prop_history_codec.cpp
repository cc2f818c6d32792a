#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "storage/codecs.hpp"
#include "storage/remote_clients_and_tabs.hpp"

using namespace tabsync;
using namespace tabsync::storage;

namespace {

const std::string LOWER = "abcdefghijklmnopqrstuvwxyz";
const std::string ALNUM = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

rc::Gen<std::string> non_empty_of(const std::string& alphabet) {
    return rc::gen::nonEmpty(rc::gen::container<std::string>(rc::gen::elementOf(alphabet)));
}

// Absolute http(s) URLs that are already in canonical form, so parsing
// and re-serializing them is the identity.
rc::Gen<QUrl> absolute_url() {
    return rc::gen::apply(
        [](bool secure, const std::string& host, const std::vector<std::string>& segments) {
            std::string url = secure ? "https://" : "http://";
            url += host + ".example/";
            for (size_t i = 0; i < segments.size(); ++i) {
                if (i > 0) url += "/";
                url += segments[i];
            }
            return QUrl(QString::fromStdString(url));
        },
        rc::gen::arbitrary<bool>(),
        non_empty_of(LOWER),
        rc::gen::container<std::vector<std::string>>(non_empty_of(ALNUM)));
}

// Entries encode_history must drop.
rc::Gen<QUrl> unusable_url() {
    return rc::gen::element(QUrl(), QUrl(QStringLiteral("relative/path")), QUrl(QStringLiteral("/rooted")));
}

} // namespace

TEST_CASE("Property: history survives encode then decode", "[property][history]") {
    REQUIRE(rc::check("decode_history(encode_history(urls)) == urls",
        [] {
            const auto urls = *rc::gen::container<std::vector<QUrl>>(absolute_url());

            const auto encoded = encode_history(urls);
            RC_ASSERT(encoded.has_value());
            RC_ASSERT(decode_history(encoded) == urls);
        }
    ));
}

TEST_CASE("Property: encode_history drops exactly the unusable entries", "[property][history]") {
    REQUIRE(rc::check("mixed history keeps only absolute URLs, in order",
        [] {
            const auto entries = *rc::gen::container<std::vector<std::pair<bool, QUrl>>>(
                rc::gen::oneOf(
                    rc::gen::map(absolute_url(), [](QUrl u) { return std::make_pair(true, u); }),
                    rc::gen::map(unusable_url(), [](QUrl u) { return std::make_pair(false, u); })));

            std::vector<QUrl> mixed;
            std::vector<QUrl> expected;
            for (const auto& [usable, url] : entries) {
                mixed.push_back(url);
                if (usable) expected.push_back(url);
            }

            RC_ASSERT(decode_history(encode_history(mixed)) == expected);
        }
    ));
}

TEST_CASE("Property: join keeps every tab of a listed client", "[property][join]") {
    REQUIRE(rc::check("each client gets every tab carrying its guid, in input order",
        [] {
            const auto client_count = *rc::gen::inRange(0, 5);
            const auto owners = *rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 7));

            // Guids are drawn from a small range so clients may share one.
            std::vector<RemoteClient> clients;
            for (int i = 0; i < client_count; ++i) {
                const auto guid = *rc::gen::inRange(0, 4);
                clients.push_back(create_remote_client(
                    "C" + std::to_string(guid), "Client " + std::to_string(i), Timestamp(i)));
            }

            std::vector<RemoteTab> tabs;
            for (size_t i = 0; i < owners.size(); ++i) {
                tabs.push_back(create_remote_tab(
                    "C" + std::to_string(owners[i]),
                    QUrl(QStringLiteral("https://t.example/%1").arg(i)),
                    "Tab", Timestamp(i)));
            }

            const auto joined = join_clients_and_tabs(clients, tabs);
            RC_ASSERT(joined.size() == clients.size());

            for (size_t c = 0; c < joined.size(); ++c) {
                RC_ASSERT(joined[c].client == clients[c]);

                std::vector<RemoteTab> expected;
                for (const auto& tab : tabs) {
                    if (tab.client_guid == clients[c].guid) expected.push_back(tab);
                }
                RC_ASSERT(joined[c].tabs == expected);
            }
        }
    ));
}
