#include "storage/executor.hpp"

namespace tabsync::storage {

Executor::Executor(Database& db) : db_(db) {
    pool_.setMaxThreadCount(1);
    pool_.setExpiryTimeout(-1);
}

Executor::~Executor() {
    pool_.waitForDone();
}

Deferred<void> Executor::run(std::string sql, Args args) {
    return submit([sql = std::move(sql), args = std::move(args)](Database& db) {
        qCDebug(tabsyncStorageLog) << "run:" << sql.c_str();
        return db.execute_change(sql, args);
    });
}

void Executor::wait_for_idle() {
    pool_.waitForDone();
}

} // namespace tabsync::storage
