#pragma once

#include "core/logging.hpp"
#include "core/result.hpp"
#include "storage/codecs.hpp"
#include "storage/database.hpp"
#include <QFuture>
#include <QPromise>
#include <QThreadPool>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tabsync::storage {

/**
 * Deferred<T> - Completes exactly once with a value or an Error.
 */
template<typename T>
using Deferred = QFuture<Result<T, Error>>;

/**
 * Run `sql` and decode every row with `decode` (Statement -> Result<T>).
 *
 * Rows that fail to decode are skipped with a warning, or fail the read,
 * depending on `policy`.
 */
template<typename T, typename Decoder>
[[nodiscard]] Result<std::vector<T>, Error> read_rows(
    Database& db,
    const std::string& sql,
    const Args& args,
    Decoder&& decode,
    DecodeFailurePolicy policy
) {
    std::vector<T> rows;
    std::optional<Error> decode_failure;

    auto query_result = db.query(sql, args, [&](Statement& stmt) {
        if (decode_failure) return;

        auto decoded = decode(stmt);
        if (decoded.is_ok()) {
            rows.push_back(std::move(decoded).unwrap());
            return;
        }
        if (policy == DecodeFailurePolicy::FailQuery) {
            decode_failure = decoded.unwrap_err();
            return;
        }
        qCWarning(tabsyncStorageLog) << "Skipping row:" << decoded.unwrap_err().message.c_str();
    });

    if (query_result.is_err()) {
        return Result<std::vector<T>, Error>::err(query_result.unwrap_err());
    }
    if (decode_failure) {
        return Result<std::vector<T>, Error>::err(std::move(*decode_failure));
    }
    return Result<std::vector<T>, Error>::ok(std::move(rows));
}

/**
 * Executor - Runs units of work against one shared Database.
 *
 * All work is queued on a single worker thread in submission order, so
 * write transactions never interleave and the calling thread never waits
 * on SQLite. The Database is borrowed and must outlive the Executor; the
 * destructor waits for queued work to finish.
 *
 * Units of work receive the Database& and return a Result.
 */
class Executor {
public:
    explicit Executor(Database& db);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    /**
     * Run a single statement that returns no rows.
     */
    [[nodiscard]] Deferred<void> run(std::string sql, Args args = {});

    /**
     * Run a query and decode its rows.
     */
    template<typename T, typename Decoder>
    [[nodiscard]] Deferred<std::vector<T>> run_query(
        std::string sql,
        Args args,
        Decoder decode,
        DecodeFailurePolicy policy
    ) {
        return submit([sql = std::move(sql), args = std::move(args), decode, policy](Database& db) {
            return read_rows<T>(db, sql, args, decode, policy);
        });
    }

    /**
     * Run `work(db)` inside BEGIN ... COMMIT; any error rolls it all back.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F work) -> QFuture<std::invoke_result_t<F&, Database&>> {
        return submit([work = std::move(work)](Database& db) mutable {
            return db.transaction([&]() { return work(db); });
        });
    }

    /**
     * Run `work(db)` on the connection without a transaction, for
     * multi-statement reads.
     */
    template<typename F>
    [[nodiscard]] auto with_connection(F work) -> QFuture<std::invoke_result_t<F&, Database&>> {
        return submit(std::move(work));
    }

    /**
     * Block until every queued unit of work has finished.
     */
    void wait_for_idle();

private:
    template<typename F>
    [[nodiscard]] auto submit(F work) -> QFuture<std::invoke_result_t<F&, Database&>> {
        using R = std::invoke_result_t<F&, Database&>;

        auto promise = std::make_shared<QPromise<R>>();
        promise->start();
        auto future = promise->future();

        pool_.start([this, promise, work = std::move(work)]() mutable {
            try {
                promise->addResult(work(db_));
            } catch (...) {
                promise->setException(std::current_exception());
            }
            promise->finish();
        });

        return future;
    }

    Database& db_;
    QThreadPool pool_;
};

} // namespace tabsync::storage
