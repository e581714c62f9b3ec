#include "task/task_state.hpp"
#include <cstdint>
#include "store/store_error.hpp"

namespace datastore::task {

namespace {

constexpr uint8_t RECORD_VERSION = 1;
constexpr uint8_t ASSIGNED_BIT = 0x01;
constexpr uint8_t PAUSED_BIT = 0x02;

} // namespace

std::string encode(const TaskState& state) {
    uint8_t flags = 0;
    if (state.is_assigned) flags |= ASSIGNED_BIT;
    if (state.is_paused) flags |= PAUSED_BIT;

    std::string record(2, '\0');
    record[0] = static_cast<char>(RECORD_VERSION);
    record[1] = static_cast<char>(flags);
    return record;
}

TaskState decode(const std::string& record) {
    if (record.size() != 2 || static_cast<uint8_t>(record[0]) != RECORD_VERSION) {
        throw store::StoreError("Task registry: Corrupt task record");
    }

    const auto flags = static_cast<uint8_t>(record[1]);
    if (flags & ~(ASSIGNED_BIT | PAUSED_BIT)) {
        throw store::StoreError("Task registry: Corrupt task record flags");
    }

    TaskState state;
    state.is_assigned = (flags & ASSIGNED_BIT) != 0;
    state.is_paused = (flags & PAUSED_BIT) != 0;
    return state;
}

} // namespace datastore::task
