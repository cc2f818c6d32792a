#include "cli/inspect_format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace tabsync::cli {

namespace {

[[nodiscard]] QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString render_tab_line(const RemoteTab& tab, int depth, const FormatOptions& options) {
    const auto indent = QString(depth * 2, QLatin1Char(' '));
    auto line = indent + QStringLiteral("- ") + qs(tab.title) + QStringLiteral(" <") +
                tab.url.toString() + QStringLiteral(">");
    if (options.includeHistory && !tab.history.empty()) {
        line += QStringLiteral(" (%1 back)").arg(tab.history.size());
    }
    return line;
}

[[nodiscard]] QString render_client_line(const RemoteClient& client, size_t tabCount,
                                         const FormatOptions& options) {
    auto line = qs(client.name);
    if (client.type) {
        line += QStringLiteral(" [") + qs(*client.type) + QStringLiteral("]");
    }
    if (options.includeGuids && client.guid) {
        line += QStringLiteral(" (") + qs(*client.guid) + QStringLiteral(")");
    }
    line += QStringLiteral(" (%1 %2)")
                .arg(tabCount)
                .arg(tabCount == 1 ? QStringLiteral("tab") : QStringLiteral("tabs"));
    return line;
}

[[nodiscard]] QJsonObject tab_to_json(const RemoteTab& tab, const FormatOptions& options) {
    QJsonObject obj;
    if (options.includeGuids && tab.client_guid) {
        obj.insert(QStringLiteral("clientGuid"), qs(*tab.client_guid));
    }
    obj.insert(QStringLiteral("title"), qs(tab.title));
    obj.insert(QStringLiteral("url"), tab.url.toString());
    // JSON numbers are doubles; timestamps are emitted as strings to stay exact.
    obj.insert(QStringLiteral("lastUsed"), QString::number(tab.last_used.millis()));
    if (options.includeHistory) {
        QJsonArray history;
        for (const auto& url : tab.history) {
            history.append(url.toString());
        }
        obj.insert(QStringLiteral("history"), history);
    }
    return obj;
}

[[nodiscard]] QJsonArray tabs_to_json(const std::vector<RemoteTab>& tabs, const FormatOptions& options) {
    QJsonArray arr;
    for (const auto& tab : tabs) {
        arr.append(tab_to_json(tab, options));
    }
    return arr;
}

void insert_optional(QJsonObject& obj, const QString& key, const std::optional<std::string>& value) {
    if (value) {
        obj.insert(key, qs(*value));
    }
}

} // namespace

QString format_clients_and_tabs(const std::vector<ClientAndTabs>& clients, const FormatOptions& options) {
    QStringList out;
    for (const auto& entry : clients) {
        out.append(render_client_line(entry.client, entry.tabs.size(), options));
        for (const auto& tab : entry.tabs) {
            out.append(render_tab_line(tab, 1, options));
        }
    }
    if (out.isEmpty()) {
        return QString{};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_clients_and_tabs_json(const std::vector<ClientAndTabs>& clients,
                                     const FormatOptions& options) {
    QJsonArray arr;
    for (const auto& entry : clients) {
        const auto& client = entry.client;
        QJsonObject obj;
        if (options.includeGuids) {
            insert_optional(obj, QStringLiteral("guid"), client.guid);
        }
        obj.insert(QStringLiteral("name"), qs(client.name));
        obj.insert(QStringLiteral("modified"), QString::number(client.modified.millis()));
        insert_optional(obj, QStringLiteral("type"), client.type);
        insert_optional(obj, QStringLiteral("formfactor"), client.formfactor);
        insert_optional(obj, QStringLiteral("os"), client.os);
        insert_optional(obj, QStringLiteral("version"), client.version);
        if (options.includeGuids) {
            insert_optional(obj, QStringLiteral("fxaDeviceId"), client.fxa_device_id);
        }
        obj.insert(QStringLiteral("tabs"), tabs_to_json(entry.tabs, options));
        arr.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("clients"), arr);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_tabs(const std::vector<RemoteTab>& tabs, const FormatOptions& options) {
    QStringList out;
    for (const auto& tab : tabs) {
        out.append(render_tab_line(tab, 0, options));
    }
    if (out.isEmpty()) {
        return QString{};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_tabs_json(const std::vector<RemoteTab>& tabs, const FormatOptions& options) {
    QJsonObject root;
    root.insert(QStringLiteral("tabs"), tabs_to_json(tabs, options));
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace tabsync::cli
