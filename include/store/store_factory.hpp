#ifndef DATASTORE_STORE_FACTORY_HPP
#define DATASTORE_STORE_FACTORY_HPP

#include <memory>
#include "config/config.hpp"
#include "store/expiring_store.hpp"

namespace datastore::store {

// Builds the backend named by config.backend
std::unique_ptr<ExpiringStore> make_store(const config::Config& config);

} // namespace datastore::store

#endif // DATASTORE_STORE_FACTORY_HPP
