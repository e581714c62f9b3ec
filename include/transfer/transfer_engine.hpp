#ifndef DATASTORE_TRANSFER_ENGINE_HPP
#define DATASTORE_TRANSFER_ENGINE_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "task/task_registry.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_job.hpp"
#include "transfer/transfer_outcome.hpp"
#include "util/waiter.hpp"

namespace datastore {
namespace transfer {

struct TransferSettings {
  std::size_t chunk_size{10000};
  // Sleep between polls while a task is paused
  std::chrono::milliseconds poll_interval{2000};
};

// Cooperative chunk loop. Before every chunk it re-reads the task record:
// a missing record stops the transfer as aborted, a paused one makes it
// wait one poll interval without touching the data.
class TransferEngine {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferEngine(task::TaskRegistry& registry, TransferSettings settings);

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;


  // ---- TRANSFER EXECUTION ----
  // Marks the task as assigned to an engine. Throws task::ConflictError if it
  // already is, store::NotFoundError if the task is gone.
  void claim(const std::string& task_id);
  // Drives a claimed task to its end. Source and sink failures run the job's
  // abort cleanup and are rethrown as TransferError.
  TransferOutcome run_claimed(const std::string& task_id, TransferJob& job);
  // claim() followed by run_claimed()
  TransferOutcome run(const std::string& task_id, TransferJob& job);


  // ---- SHUTDOWN ----
  // Wakes paused loops; every running loop returns INTERRUPTED at its next poll
  void shutdown();
  bool is_shutdown() const { return waiter_.stopped(); }

  const TransferSettings& settings() const { return settings_; }

private:
  // ---- PARAMETERS ----
  task::TaskRegistry& registry_;
  TransferSettings settings_;
  util::Waiter waiter_;


  // ---- LOOP ----
  TransferOutcome poll_loop(const std::string& task_id, TransferJob& job);
};

} // namespace transfer
} // namespace datastore

#endif // DATASTORE_TRANSFER_ENGINE_HPP
