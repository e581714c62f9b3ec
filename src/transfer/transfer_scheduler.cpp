#include "transfer/transfer_scheduler.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include "store/store_error.hpp"
#include "task/task_error.hpp"

namespace datastore {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferScheduler::TransferScheduler(TransferEngine& engine)
  : engine_(engine) {
  BOOST_LOG_TRIVIAL(debug) << "Transfer scheduler: Initialized";
}

TransferScheduler::~TransferScheduler() {
  shutdown();
}


//==============================================
// TRANSFER CONTROL
//==============================================

void TransferScheduler::start(const std::string& task_id, std::unique_ptr<TransferJob> job) {
  if (!job) {
    throw std::invalid_argument("Transfer scheduler: Job must not be null");
  }

  join_retired();

  std::lock_guard<std::mutex> lock(mutex_);
  if (shutting_down_) {
    throw std::runtime_error("Transfer scheduler: Shutting down, not accepting transfers");
  }
  if (transfers_.count(task_id) != 0) {
    throw task::ConflictError(task_id, "already has a transfer");
  }

  engine_.claim(task_id);
  finished_.erase(task_id);

  auto promise = std::make_shared<std::promise<TransferOutcome>>();
  auto transfer = std::make_shared<Transfer>();
  transfer->result = promise->get_future().share();
  transfer->job = std::move(job);

  TransferJob* job_ptr = transfer->job.get();
  transfer->thread = std::make_unique<std::thread>([this, task_id, job_ptr, promise]() {
    TransferOutcome outcome = TransferOutcome::ABORTED;
    std::exception_ptr failure;
    try {
      outcome = engine_.run_claimed(task_id, *job_ptr);
    }
    catch (...) {
      // Delivered to wait()
      failure = std::current_exception();
    }
    retire(task_id, *promise, outcome, failure);
  });

  transfers_.emplace(task_id, std::move(transfer));
  BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Started " << job_ptr->name() << " for task " << task_id;
}

TransferOutcome TransferScheduler::wait(const std::string& task_id) {
  std::shared_future<TransferOutcome> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto running = transfers_.find(task_id);
    if (running != transfers_.end()) {
      result = running->second->result;
    }
    else {
      auto done = finished_.find(task_id);
      if (done == finished_.end()) {
        throw store::NotFoundError(task_id);
      }
      result = done->second;
    }
  }

  // The promise is set only after retire() has moved the entry to finished_
  result.wait();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_.erase(task_id);
  }
  join_retired();

  return result.get();
}

void TransferScheduler::shutdown() {
  std::map<std::string, std::shared_ptr<Transfer>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_ && transfers_.empty() && retired_.empty()) {
      return;
    }
    shutting_down_ = true;
    pending.swap(transfers_);
    finished_.clear();
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Shutting down " << pending.size() << " transfers";
  engine_.shutdown();

  for (auto& [task_id, transfer] : pending) {
    if (transfer->thread && transfer->thread->joinable()) {
      transfer->thread->join();
    }
    try {
      BOOST_LOG_TRIVIAL(info) << "Transfer scheduler: Task " << task_id << " ended "
                              << to_string(transfer->result.get());
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Transfer scheduler: Task " << task_id << " failed: " << e.what();
    }
  }
  join_retired();
}


//==============================================
// HELPER METHODS
//==============================================

void TransferScheduler::retire(const std::string& task_id, std::promise<TransferOutcome>& promise,
                               TransferOutcome outcome, std::exception_ptr failure) {
  std::unique_ptr<TransferJob> job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Absent when shutdown() already took the entry; it joins the thread itself
    auto it = transfers_.find(task_id);
    if (it != transfers_.end()) {
      job = std::move(it->second->job);
      retired_.push_back(std::move(it->second->thread));
      finished_[task_id] = it->second->result;
      transfers_.erase(it);
    }

    if (failure) {
      promise.set_exception(failure);
    }
    else {
      promise.set_value(outcome);
    }
  }

  if (job) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer scheduler: Retired " << job->name() << " for task " << task_id;
  }
  // job is released here, closing its files
}

void TransferScheduler::join_retired() {
  std::vector<std::unique_ptr<std::thread>> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done.swap(retired_);
  }

  for (auto& thread : done) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
}


//==============================================
// QUERY
//==============================================

bool TransferScheduler::is_tracked(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_.count(task_id) != 0;
}

std::optional<std::size_t> TransferScheduler::transferred(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = transfers_.find(task_id);
  if (it == transfers_.end()) {
    return std::nullopt;
  }
  return it->second->job->transferred();
}

std::vector<std::string> TransferScheduler::tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  for (const auto& entry : transfers_) {
    ids.push_back(entry.first);
  }
  return ids;
}

} // namespace transfer
} // namespace datastore
