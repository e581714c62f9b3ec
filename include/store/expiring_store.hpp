#ifndef DATASTORE_STORE_EXPIRING_STORE_HPP
#define DATASTORE_STORE_EXPIRING_STORE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "store/store_error.hpp"

namespace datastore {
namespace store {

using Ttl = std::optional<std::chrono::milliseconds>;

// Longest accepted TTL, a century; keeps expiry arithmetic inside the clock range
constexpr std::chrono::milliseconds MAX_TTL = std::chrono::hours(24 * 365 * 100);

// Key -> opaque value map whose entries may expire.
// get/remove throw NotFoundError for absent or expired keys;
// set throws InvalidTTLError for a non-positive TTL or one above MAX_TTL.
class ExpiringStore {
public:
  virtual ~ExpiringStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  virtual std::string get(const std::string& key) = 0;
  // An empty ttl stores a value that never expires
  virtual void set(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) = 0;
  virtual void remove(const std::string& key) = 0;
  // Removes every entry
  virtual void flush() = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool has(const std::string& key) = 0;
  // Number of live entries as of the last size-affecting operation
  virtual std::size_t size() = 0;
};

} // namespace store
} // namespace datastore

#endif // DATASTORE_STORE_EXPIRING_STORE_HPP
