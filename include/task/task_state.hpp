#ifndef DATASTORE_TASK_STATE_HPP
#define DATASTORE_TASK_STATE_HPP

#include <string>

namespace datastore::task {

struct TaskState {
    bool is_assigned{false};
    bool is_paused{false};

    bool operator==(const TaskState& other) const {
        return is_assigned == other.is_assigned && is_paused == other.is_paused;
    }
    bool operator!=(const TaskState& other) const { return !(*this == other); }
};

// Two-byte record: format version, flag bits
std::string encode(const TaskState& state);
// Throws store::StoreError on a record it cannot read
TaskState decode(const std::string& record);

} // namespace datastore::task

#endif // DATASTORE_TASK_STATE_HPP
