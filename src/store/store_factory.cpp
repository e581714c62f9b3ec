#include "store/store_factory.hpp"
#include <boost/log/trivial.hpp>
#include "store/memcached_store.hpp"
#include "store/memory_store.hpp"

namespace datastore::store {

std::unique_ptr<ExpiringStore> make_store(const config::Config& config) {
  BOOST_LOG_TRIVIAL(info) << "Store factory: Creating " << config::to_string(config.backend) << " store";

  switch (config.backend) {
    case config::Backend::Memory:
      return std::make_unique<MemoryStore>();
    case config::Backend::Memcached:
      return std::make_unique<MemcachedStore>(config.host, config.port);
  }
  throw StoreError("Store factory: Unsupported backend");
}

} // namespace datastore::store
