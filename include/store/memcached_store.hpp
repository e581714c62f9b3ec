#ifndef DATASTORE_STORE_MEMCACHED_STORE_HPP
#define DATASTORE_STORE_MEMCACHED_STORE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio.hpp>
#include "store/expiring_store.hpp"

namespace datastore {
namespace store {

// ExpiringStore backed by a memcached server (text protocol).
// Expiry is enforced by the server; this class keeps no expiry state.
class MemcachedStore : public ExpiringStore {
public:
  // Largest relative expiration memcached accepts; longer TTLs are sent as UNIX times
  static constexpr int64_t MAX_RELATIVE_EXPIRY = 60 * 60 * 24 * 30;
  static constexpr std::size_t MAX_KEY_LENGTH = 250;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemcachedStore(const std::string& host, uint16_t port);
  ~MemcachedStore() override;

  MemcachedStore(const MemcachedStore&) = delete;
  MemcachedStore& operator=(const MemcachedStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  std::string get(const std::string& key) override;
  void set(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) override;
  void remove(const std::string& key) override;
  void flush() override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) override;
  // Server-reported curr_items
  std::size_t size() override;

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

private:
  // ---- PARAMETERS ----
  std::string host_;
  uint16_t port_;
  std::mutex mutex_;

  // Network components
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  boost::asio::streambuf input_buffer_;


  // ---- CONNECTION MANAGEMENT ----
  // Connects on first use and after a dropped connection
  void ensure_connected();
  void close_connection();


  // ---- PROTOCOL ----
  // Sends one request and returns the first response line without "\r\n"
  std::string request(const std::string& command, const std::string* payload = nullptr);
  std::string read_line();
  std::string read_block(std::size_t length);
  // Translates transport errors into ConnectionError and drops the socket
  template <typename Fn>
  auto with_connection(const std::string& operation, Fn&& fn) -> decltype(fn());

  static void validate_key(const std::string& key);
  static int64_t to_expiration(Ttl ttl);
};

} // namespace store
} // namespace datastore

#endif // DATASTORE_STORE_MEMCACHED_STORE_HPP
