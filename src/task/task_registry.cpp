#include "task/task_registry.hpp"
#include <boost/log/trivial.hpp>
#include "task/task_id.hpp"

namespace datastore {
namespace task {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TaskRegistry::TaskRegistry(store::ExpiringStore& store, std::chrono::milliseconds task_ttl)
  : store_(store)
  , task_ttl_(task_ttl) {
  if (task_ttl_.count() <= 0) {
    throw store::InvalidTTLError("task TTL must be positive");
  }
  BOOST_LOG_TRIVIAL(info) << "Task registry: Initialized with task TTL " << task_ttl_.count() << "ms";
}


//==============================================
// TASK LIFECYCLE
//==============================================

std::string TaskRegistry::create_task() {
  std::lock_guard<std::mutex> lock(mutex_);

  for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
    std::string task_id = generate_task_id();
    if (store_.has(task_id)) {
      BOOST_LOG_TRIVIAL(warning) << "Task registry: Generated id already live, retrying";
      continue;
    }

    store_.set(task_id, encode(TaskState{}), task_ttl_);
    BOOST_LOG_TRIVIAL(info) << "Task registry: Created task " << task_id;
    return task_id;
  }

  BOOST_LOG_TRIVIAL(error) << "Task registry: Could not generate a unique task id";
  throw store::StoreError("Task registry: Could not generate a unique task id");
}

TaskState TaskRegistry::read(const std::string& task_id) {
  return decode(store_.get(task_id));
}

TaskState TaskRegistry::update(const std::string& task_id, const Mutator& mutator) {
  std::lock_guard<std::mutex> lock(mutex_);

  TaskState current = decode(store_.get(task_id));
  TaskState next = mutator(current);
  store_.set(task_id, encode(next), task_ttl_);

  BOOST_LOG_TRIVIAL(debug) << "Task registry: Task " << task_id
                           << " assigned=" << next.is_assigned << " paused=" << next.is_paused;
  return next;
}

void TaskRegistry::remove(const std::string& task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  store_.remove(task_id);
  BOOST_LOG_TRIVIAL(info) << "Task registry: Removed task " << task_id;
}

bool TaskRegistry::discard(const std::string& task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    store_.remove(task_id);
    BOOST_LOG_TRIVIAL(info) << "Task registry: Discarded task " << task_id;
    return true;
  }
  catch (const store::NotFoundError&) {
    BOOST_LOG_TRIVIAL(debug) << "Task registry: Task " << task_id << " already gone";
    return false;
  }
}


//==============================================
// STATE TRANSITIONS
//==============================================

TaskState TaskRegistry::pause(const std::string& task_id) {
  return update(task_id, [&task_id](TaskState state) {
    if (state.is_paused) {
      throw ConflictError(task_id, "is already paused");
    }
    state.is_paused = true;
    return state;
  });
}

TaskState TaskRegistry::resume(const std::string& task_id) {
  return update(task_id, [&task_id](TaskState state) {
    if (!state.is_paused) {
      throw ConflictError(task_id, "is already running");
    }
    state.is_paused = false;
    return state;
  });
}

TaskState TaskRegistry::assign(const std::string& task_id) {
  return update(task_id, [&task_id](TaskState state) {
    if (state.is_assigned) {
      throw ConflictError(task_id, "is already assigned");
    }
    state.is_assigned = true;
    return state;
  });
}

TaskState TaskRegistry::release(const std::string& task_id) {
  return update(task_id, [](TaskState state) {
    state.is_assigned = false;
    return state;
  });
}

} // namespace task
} // namespace datastore
