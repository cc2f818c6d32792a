#pragma once

#include "core/remote_client.hpp"
#include "core/remote_tab.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"
#include <QUrl>
#include <optional>
#include <string>
#include <vector>

namespace tabsync::storage {

/**
 * What a read does with a row that fails to decode.
 */
enum class DecodeFailurePolicy {
    SkipRow,   // log a warning and leave the row out
    FailQuery  // fail the whole read with the decode error
};

// Column lists the decoders below expect, in this order.
inline constexpr const char* CLIENT_COLUMNS =
    "guid, name, modified, type, formfactor, os, version, fxaDeviceId";
inline constexpr const char* TAB_COLUMNS =
    "client_guid, url, title, history, last_used";

/**
 * Map a row selected with CLIENT_COLUMNS to a RemoteClient.
 * name and modified are required; anything else that is not TEXT is absent.
 */
[[nodiscard]] Result<RemoteClient, Error> decode_remote_client(const Statement& row);

/**
 * Map a row selected with TAB_COLUMNS to a RemoteTab.
 * url must parse as an absolute URL; title and last_used are required.
 * A missing or malformed history decodes to an empty list.
 */
[[nodiscard]] Result<RemoteTab, Error> decode_remote_tab(const Statement& row);

/**
 * Parse an absolute URL; std::nullopt for empty, invalid or relative input.
 */
[[nodiscard]] std::optional<QUrl> parse_absolute_url(const std::string& text);

/**
 * Serialize history as a compact JSON array of URL strings.
 * Empty, invalid and relative URLs are dropped; order is kept.
 */
[[nodiscard]] std::optional<std::string> encode_history(const std::vector<QUrl>& history);

/**
 * Inverse of encode_history. Returns an empty list when the input is absent,
 * not UTF-8, or not a JSON array of strings; entries that do not parse as
 * absolute URLs are dropped.
 */
[[nodiscard]] std::vector<QUrl> decode_history(const std::optional<std::string>& serialized);

} // namespace tabsync::storage
