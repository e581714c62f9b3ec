#include "transfer/transfer_engine.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include "store/store_error.hpp"

namespace datastore {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferEngine::TransferEngine(task::TaskRegistry& registry, TransferSettings settings)
  : registry_(registry)
  , settings_(settings) {
  if (settings_.chunk_size == 0) {
    throw std::invalid_argument("Transfer engine: Chunk size must be positive");
  }
  if (settings_.poll_interval.count() <= 0) {
    throw std::invalid_argument("Transfer engine: Poll interval must be positive");
  }
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Chunk size " << settings_.chunk_size
                          << " bytes, poll interval " << settings_.poll_interval.count() << "ms";
}


//==============================================
// TRANSFER EXECUTION
//==============================================

void TransferEngine::claim(const std::string& task_id) {
  registry_.assign(task_id);
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Claimed task " << task_id;
}

TransferOutcome TransferEngine::run(const std::string& task_id, TransferJob& job) {
  claim(task_id);
  return run_claimed(task_id, job);
}

TransferOutcome TransferEngine::run_claimed(const std::string& task_id, TransferJob& job) {
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Starting " << job.name() << " for task " << task_id;

  TransferOutcome outcome = TransferOutcome::ABORTED;
  try {
    outcome = poll_loop(task_id, job);
  }
  catch (const TransferError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: " << job.name() << " for task " << task_id
                             << " failed: " << e.what();
    job.on_aborted();
    throw;
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: Task store failed during " << job.name()
                             << " for task " << task_id << ": " << e.what();
    job.on_aborted();
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: " << job.name() << " for task " << task_id
                             << " failed: " << e.what();
    job.on_aborted();
    throw TransferError(e.what());
  }

  // The record goes only after the data is final; a concurrent abort may
  // already have removed it
  if (outcome == TransferOutcome::COMPLETED) {
    registry_.discard(task_id);
  }
  // Interrupted data is already rolled back, so the task can run again later
  else if (outcome == TransferOutcome::INTERRUPTED) {
    try {
      registry_.release(task_id);
    }
    catch (const store::NotFoundError&) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Task " << task_id << " removed during shutdown";
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: " << job.name() << " for task " << task_id << " "
                          << to_string(outcome) << " after " << job.transferred() << " units";
  return outcome;
}


//==============================================
// SHUTDOWN
//==============================================

void TransferEngine::shutdown() {
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Shutting down";
  waiter_.stop();
}


//==============================================
// LOOP
//==============================================

TransferOutcome TransferEngine::poll_loop(const std::string& task_id, TransferJob& job) {
  while (true) {
    if (waiter_.stopped()) {
      job.on_aborted();
      return TransferOutcome::INTERRUPTED;
    }

    task::TaskState state;
    try {
      state = registry_.read(task_id);
    }
    catch (const store::NotFoundError&) {
      BOOST_LOG_TRIVIAL(info) << "Transfer engine: Task " << task_id << " is gone, stopping";
      job.on_aborted();
      return TransferOutcome::ABORTED;
    }

    if (state.is_paused) {
      BOOST_LOG_TRIVIAL(trace) << "Transfer engine: Task " << task_id << " paused";
      waiter_.wait_for(settings_.poll_interval);
      continue;
    }

    if (!job.process_chunk(settings_.chunk_size)) {
      job.on_completed();
      return TransferOutcome::COMPLETED;
    }
  }
}

} // namespace transfer
} // namespace datastore
