#ifndef DATASTORE_TASK_REGISTRY_HPP
#define DATASTORE_TASK_REGISTRY_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include "store/expiring_store.hpp"
#include "task/task_error.hpp"
#include "task/task_state.hpp"

namespace datastore {
namespace task {

// Task records kept in an ExpiringStore. A task exists exactly as long as its
// record does: deleting the record is how a task is completed or aborted.
//
// Every write re-extends the record to a full task TTL.
class TaskRegistry {
public:
  using Mutator = std::function<TaskState(const TaskState&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TaskRegistry(store::ExpiringStore& store, std::chrono::milliseconds task_ttl);


  // ---- TASK LIFECYCLE ----
  // Inserts a fresh unassigned, running task and returns its id
  std::string create_task();
  // Throws store::NotFoundError if the task is gone
  TaskState read(const std::string& task_id);
  // Read-modify-write; the mutator may throw ConflictError to veto the change
  TaskState update(const std::string& task_id, const Mutator& mutator);
  // Throws store::NotFoundError if the task is gone
  void remove(const std::string& task_id);
  // Removes the record if present; returns whether it was
  bool discard(const std::string& task_id);


  // ---- STATE TRANSITIONS ----
  // Each throws ConflictError when the task is already in the requested state
  TaskState pause(const std::string& task_id);
  TaskState resume(const std::string& task_id);
  TaskState assign(const std::string& task_id);
  // Drops the assignment so another transfer may claim the task
  TaskState release(const std::string& task_id);


  // ---- GETTERS ----
  std::chrono::milliseconds task_ttl() const { return task_ttl_; }

private:
  // ---- PARAMETERS ----
  static constexpr int MAX_ID_ATTEMPTS = 8;

  store::ExpiringStore& store_;
  std::chrono::milliseconds task_ttl_;
  // Serializes read-modify-write against removal
  std::mutex mutex_;
};

} // namespace task
} // namespace datastore

#endif // DATASTORE_TASK_REGISTRY_HPP
