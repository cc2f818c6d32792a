#include "storage/codecs.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

namespace tabsync::storage {

namespace {

namespace client_col {
constexpr int guid = 0;
constexpr int name = 1;
constexpr int modified = 2;
constexpr int type = 3;
constexpr int formfactor = 4;
constexpr int os = 5;
constexpr int version = 6;
constexpr int fxa_device_id = 7;
} // namespace client_col

namespace tab_col {
constexpr int client_guid = 0;
constexpr int url = 1;
constexpr int title = 2;
constexpr int history = 3;
constexpr int last_used = 4;
} // namespace tab_col

[[nodiscard]] std::optional<std::string> text_or_absent(const Statement& row, int index) {
    if (row.column_type(index) != SQLITE_TEXT) {
        return std::nullopt;
    }
    return row.column_text(index);
}

[[nodiscard]] Error missing(const char* table, const char* column, const char* expected) {
    return Error::decode(std::string(table) + "." + column + " is missing or not " + expected);
}

} // namespace

Result<RemoteClient, Error> decode_remote_client(const Statement& row) {
    if (row.column_type(client_col::name) != SQLITE_TEXT) {
        return Result<RemoteClient, Error>::err(missing("clients", "name", "TEXT"));
    }
    if (row.column_type(client_col::modified) != SQLITE_INTEGER) {
        return Result<RemoteClient, Error>::err(missing("clients", "modified", "INTEGER"));
    }

    return Result<RemoteClient, Error>::ok(RemoteClient{
        .guid = text_or_absent(row, client_col::guid),
        .name = row.column_text(client_col::name),
        .modified = Timestamp::from_sql(row.column_int64(client_col::modified)),
        .type = text_or_absent(row, client_col::type),
        .formfactor = text_or_absent(row, client_col::formfactor),
        .os = text_or_absent(row, client_col::os),
        .version = text_or_absent(row, client_col::version),
        .fxa_device_id = text_or_absent(row, client_col::fxa_device_id)
    });
}

Result<RemoteTab, Error> decode_remote_tab(const Statement& row) {
    if (row.column_type(tab_col::url) != SQLITE_TEXT) {
        return Result<RemoteTab, Error>::err(missing("tabs", "url", "TEXT"));
    }
    auto url = parse_absolute_url(row.column_text(tab_col::url));
    if (!url) {
        return Result<RemoteTab, Error>::err(
            Error::decode("tabs.url is not an absolute URL: " + row.column_text(tab_col::url)));
    }
    if (row.column_type(tab_col::title) != SQLITE_TEXT) {
        return Result<RemoteTab, Error>::err(missing("tabs", "title", "TEXT"));
    }
    if (row.column_type(tab_col::last_used) != SQLITE_INTEGER) {
        return Result<RemoteTab, Error>::err(missing("tabs", "last_used", "INTEGER"));
    }

    return Result<RemoteTab, Error>::ok(RemoteTab{
        .client_guid = text_or_absent(row, tab_col::client_guid),
        .url = std::move(*url),
        .title = row.column_text(tab_col::title),
        .history = decode_history(text_or_absent(row, tab_col::history)),
        .last_used = Timestamp::from_sql(row.column_int64(tab_col::last_used)),
        .icon = std::nullopt
    });
}

std::optional<QUrl> parse_absolute_url(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    QUrl url(QString::fromStdString(text), QUrl::StrictMode);
    if (!url.isValid() || url.isRelative()) {
        return std::nullopt;
    }
    return url;
}

std::optional<std::string> encode_history(const std::vector<QUrl>& history) {
    QJsonArray entries;
    for (const auto& url : history) {
        if (url.isEmpty() || !url.isValid() || url.isRelative()) {
            continue;
        }
        entries.append(url.toString(QUrl::FullyEncoded));
    }

    const QByteArray json = QJsonDocument(entries).toJson(QJsonDocument::Compact);
    if (json.isEmpty()) {
        return std::nullopt;
    }
    return json.toStdString();
}

std::vector<QUrl> decode_history(const std::optional<std::string>& serialized) {
    if (!serialized) {
        return {};
    }

    // fromJson rejects malformed UTF-8 with a parse error.
    QJsonParseError error{};
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(*serialized), &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        return {};
    }

    const auto entries = doc.array();
    for (const auto& entry : entries) {
        if (!entry.isString()) {
            return {};
        }
    }

    std::vector<QUrl> history;
    history.reserve(static_cast<size_t>(entries.size()));
    for (const auto& entry : entries) {
        if (auto url = parse_absolute_url(entry.toString().toStdString())) {
            history.push_back(std::move(*url));
        }
    }
    return history;
}

} // namespace tabsync::storage
