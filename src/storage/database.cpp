#include "storage/database.hpp"
#include "core/logging.hpp"

namespace tabsync::storage {

// ============================================================================
// Statement implementation
// ============================================================================

Error Statement::bind_error(const char* what, int rc) const {
    sqlite3* db = stmt_ ? sqlite3_db_handle(stmt_.get()) : nullptr;
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return Error{ErrorKind::Statement, std::string(what) + ": " + detail, rc};
}

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(bind_error("Failed to bind text", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(bind_error("Failed to bind int64", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(bind_error("Failed to bind null", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind(int index, const Value& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return bind_text(index, *text);
    }
    if (const auto* number = std::get_if<int64_t>(&value)) {
        return bind_int64(index, *number);
    }
    return bind_null(index);
}

Result<void, Error> Statement::bind_all(const Args& args) {
    int rc = sqlite3_clear_bindings(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(bind_error("Failed to clear bindings", rc));
    }
    for (size_t i = 0; i < args.size(); ++i) {
        auto result = bind(static_cast<int>(i) + 1, args[i]);
        if (result.is_err()) {
            return result;
        }
    }
    return Result<void, Error>::ok();
}

int Statement::column_type(int index) const {
    return sqlite3_column_type(stmt_.get(), index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_text(index);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    return Result<bool, Error>::err(bind_error("Step failed", rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(bind_error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : "Unknown error";
        if (db) sqlite3_close(db);
        return Result<Database, Error>::err(Error{ErrorKind::Statement, error, rc});
    }

    Database opened(db);

    // WAL lets readers proceed while the sync writer holds a transaction.
    // In-memory databases report "memory" and keep working.
    auto wal = opened.execute("PRAGMA journal_mode = WAL;");
    if (wal.is_err()) {
        qCWarning(tabsyncStorageLog) << "Could not enable WAL for" << path.c_str()
                                     << ":" << wal.unwrap_err().message.c_str();
    }

    return Result<Database, Error>::ok(std::move(opened));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error::closed());
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{ErrorKind::Statement, last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error::closed());
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{ErrorKind::Statement, error, rc});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::execute_change(const std::string& sql, const Args& args) {
    auto stmt_result = prepare(sql);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
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

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

void Database::abandon_transaction(const Error& cause) {
    qCWarning(tabsyncStorageLog) << "Transaction failed, rolling back:"
                                 << cause.message.c_str();
    // A failed COMMIT may already have ended the transaction.
    if (sqlite3_get_autocommit(db_) != 0) {
        return;
    }
    auto rollback_result = rollback();
    if (rollback_result.is_err()) {
        qCWarning(tabsyncStorageLog) << "Rollback failed:"
                                     << rollback_result.unwrap_err().message.c_str();
    }
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace tabsync::storage
