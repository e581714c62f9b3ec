#include "app/bootstrap.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>
#include "store/memory_store.hpp"
#include "store/store_factory.hpp"

namespace datastore {
namespace app {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Bootstrap::Bootstrap(const config::Config& config)
    : config_(config)
    , scratch_root_(std::filesystem::temp_directory_path() / "datastore") {

    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Initializing with " << config::to_string(config_.backend)
                            << " backend";

    try {
        // Store first (no dependencies)
        store_ = store::make_store(config_);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Store created";

        registry_ = std::make_unique<task::TaskRegistry>(
            *store_, std::chrono::duration_cast<std::chrono::milliseconds>(config_.default_ttl));
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Task registry created";

        transfer::TransferSettings settings;
        settings.chunk_size = config_.chunk_size;
        settings.poll_interval = config_.poll_interval;
        engine_ = std::make_unique<transfer::TransferEngine>(*registry_, settings);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Transfer engine created";

        scheduler_ = std::make_unique<transfer::TransferScheduler>(*engine_);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Transfer scheduler created";

        catalog_ = std::make_unique<catalog::FileCatalog>(config_.data_dir);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap: File catalog created";

        BOOST_LOG_TRIVIAL(info) << "Bootstrap: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to initialize components: " << e.what();
        throw;
    }
}

Bootstrap::~Bootstrap() {
    if (!shutdown()) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to shutdown cleanly in destructor";
    }
}


//==============================================
// LIFECYCLE
//==============================================

bool Bootstrap::start() {
    try {
        restore_snapshot();
        BOOST_LOG_TRIVIAL(info) << "Bootstrap: Started";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to start: " << e.what();
        return false;
    }
}

bool Bootstrap::shutdown() {
    if (!store_) {
        return true;
    }

    bool clean = true;
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Initiating shutdown sequence";

    // Running transfers end INTERRUPTED; their task records stay, unassigned
    if (scheduler_) {
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap: Shutting down transfer scheduler";
        scheduler_->shutdown();
    }

    try {
        persist_snapshot();
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to persist snapshot: " << e.what();
        clean = false;
    }

    catalog_.reset();
    scheduler_.reset();
    engine_.reset();
    registry_.reset();
    store_.reset();

    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Shutdown complete";
    return clean;
}


//==============================================
// SNAPSHOT
//==============================================

void Bootstrap::restore_snapshot() {
    auto* memory = dynamic_cast<store::MemoryStore*>(store_.get());
    if (memory == nullptr || config_.snapshot_path.empty()) {
        return;
    }

    std::error_code ec;
    if (!std::filesystem::exists(config_.snapshot_path, ec)) {
        BOOST_LOG_TRIVIAL(info) << "Bootstrap: No snapshot at " << config_.snapshot_path;
        return;
    }

    memory->restore(std::filesystem::path(config_.snapshot_path));
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Restored " << memory->size() << " tasks from "
                            << config_.snapshot_path;
}

void Bootstrap::persist_snapshot() {
    auto* memory = dynamic_cast<store::MemoryStore*>(store_.get());
    if (memory == nullptr || config_.snapshot_path.empty()) {
        return;
    }

    memory->persist(std::filesystem::path(config_.snapshot_path));
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Persisted snapshot to " << config_.snapshot_path;
}

} // namespace app
} // namespace datastore
