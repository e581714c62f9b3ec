#ifndef DATASTORE_TRANSFER_SCHEDULER_HPP
#define DATASTORE_TRANSFER_SCHEDULER_HPP

#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "transfer/transfer_engine.hpp"

namespace datastore {
namespace transfer {

// Runs each transfer on its own thread so control commands are never blocked
// by an in-flight transfer.
class TransferScheduler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TransferScheduler(TransferEngine& engine);
  ~TransferScheduler();

  TransferScheduler(const TransferScheduler&) = delete;
  TransferScheduler& operator=(const TransferScheduler&) = delete;


  // ---- TRANSFER CONTROL ----
  // Claims the task synchronously, then runs the job in the background.
  // Claim failures (conflict, missing task) are thrown from here.
  void start(const std::string& task_id, std::unique_ptr<TransferJob> job);
  // Blocks until the transfer ends; rethrows its failure. The outcome of a
  // transfer that already ended is kept until the first wait() collects it.
  TransferOutcome wait(const std::string& task_id);
  // Interrupts every transfer and joins the threads
  void shutdown();


  // ---- QUERY ----
  // Only running transfers are tracked
  bool is_tracked(const std::string& task_id) const;
  // Progress of a tracked transfer, nullopt if unknown
  std::optional<std::size_t> transferred(const std::string& task_id) const;
  std::vector<std::string> tracked() const;

private:
  struct Transfer {
    std::unique_ptr<TransferJob> job;
    std::shared_future<TransferOutcome> result;
    std::unique_ptr<std::thread> thread;
  };

  // ---- HELPER METHODS ----
  // Runs on the transfer thread once the job is done
  void retire(const std::string& task_id, std::promise<TransferOutcome>& promise,
              TransferOutcome outcome, std::exception_ptr failure);
  void join_retired();

  // ---- PARAMETERS ----
  TransferEngine& engine_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Transfer>> transfers_;
  std::map<std::string, std::shared_future<TransferOutcome>> finished_;
  std::vector<std::unique_ptr<std::thread>> retired_;
  bool shutting_down_{false};
};

} // namespace transfer
} // namespace datastore

#endif // DATASTORE_TRANSFER_SCHEDULER_HPP
