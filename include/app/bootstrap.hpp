#ifndef DATASTORE_APP_BOOTSTRAP_HPP
#define DATASTORE_APP_BOOTSTRAP_HPP

#include <filesystem>
#include <memory>
#include "catalog/file_catalog.hpp"
#include "config/config.hpp"
#include "store/expiring_store.hpp"
#include "task/task_registry.hpp"
#include "transfer/transfer_engine.hpp"
#include "transfer/transfer_scheduler.hpp"

namespace datastore {
namespace app {

class Bootstrap {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit Bootstrap(const config::Config& config);
    ~Bootstrap();

    Bootstrap(const Bootstrap&) = delete;
    Bootstrap& operator=(const Bootstrap&) = delete;


    // ---- LIFECYCLE ----
    // Restores the task snapshot when the memory store is in use
    bool start();
    // Stops transfers, persists the snapshot, tears components down
    bool shutdown();


    // ---- GETTERS ----
    const config::Config& get_config() const { return config_; }
    store::ExpiringStore& get_store() { return *store_; }
    task::TaskRegistry& get_registry() { return *registry_; }
    transfer::TransferScheduler& get_scheduler() { return *scheduler_; }
    catalog::FileCatalog& get_catalog() { return *catalog_; }
    // Parent of the per-download scratch directories
    const std::filesystem::path& get_scratch_root() const { return scratch_root_; }

private:
    // ---- PARAMETERS ----
    config::Config config_;
    std::filesystem::path scratch_root_;

    // System components, in construction order
    std::unique_ptr<store::ExpiringStore> store_;
    std::unique_ptr<task::TaskRegistry> registry_;
    std::unique_ptr<transfer::TransferEngine> engine_;
    std::unique_ptr<transfer::TransferScheduler> scheduler_;
    std::unique_ptr<catalog::FileCatalog> catalog_;


    // ---- SNAPSHOT ----
    void restore_snapshot();
    void persist_snapshot();
};

} // namespace app
} // namespace datastore

#endif // DATASTORE_APP_BOOTSTRAP_HPP
