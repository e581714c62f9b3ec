#ifndef DATASTORE_TASK_ERROR_HPP
#define DATASTORE_TASK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace datastore::task {

// Requested transition is redundant with the current state
class ConflictError : public std::runtime_error {
public:
    ConflictError(const std::string& task_id, const std::string& message)
        : std::runtime_error("Task " + task_id + " " + message), task_id_(task_id) {}

    const std::string& task_id() const { return task_id_; }

private:
    std::string task_id_;
};

} // namespace datastore::task

#endif // DATASTORE_TASK_ERROR_HPP
