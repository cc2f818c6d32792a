#include "core/types.hpp"

#include <limits>
#include <type_traits>

// Timestamp is header-only; these checks pin down its storage contract.

namespace tabsync {

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(sizeof(Timestamp) == sizeof(uint64_t), "Timestamp should be a bare uint64_t");

static_assert(Timestamp::from_sql(Timestamp(std::numeric_limits<uint64_t>::max()).to_sql()).millis()
                  == std::numeric_limits<uint64_t>::max(),
              "Timestamps above INT64_MAX must survive SQLite storage");
static_assert(Timestamp(0).to_sql() == 0, "The epoch is stored as 0");

} // namespace tabsync
