#include "store/memcached_store.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>
#include <sstream>

namespace datastore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemcachedStore::MemcachedStore(const std::string& host, uint16_t port)
  : host_(host)
  , port_(port) {
  BOOST_LOG_TRIVIAL(info) << "Memcached store: Using server " << host_ << ":" << port_;
}

MemcachedStore::~MemcachedStore() {
  close_connection();
  BOOST_LOG_TRIVIAL(debug) << "Memcached store: Destroyed";
}

template <typename Fn>
auto MemcachedStore::with_connection(const std::string& operation, Fn&& fn) -> decltype(fn()) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    ensure_connected();
    return fn();
  }
  catch (const NotFoundError&) {
    throw;
  }
  catch (const StoreError&) {
    // Stream position is unknown after a protocol error
    close_connection();
    throw;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Memcached store: " << operation << " failed: " << e.what();
    close_connection();
    throw ConnectionError(operation + " on " + host_ + ":" + std::to_string(port_) + ": " + e.what());
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::string MemcachedStore::get(const std::string& key) {
  validate_key(key);

  return with_connection("get", [&]() -> std::string {
    std::string header = request("get " + key);
    if (header == "END") {
      BOOST_LOG_TRIVIAL(debug) << "Memcached store: Miss for key: " << key;
      throw NotFoundError(key);
    }

    // VALUE <key> <flags> <bytes>
    std::istringstream fields(header);
    std::string tag, returned_key;
    uint32_t flags = 0;
    std::size_t length = 0;
    if (!(fields >> tag >> returned_key >> flags >> length) || tag != "VALUE" || returned_key != key) {
      BOOST_LOG_TRIVIAL(error) << "Memcached store: Unexpected get response: " << header;
      throw StoreError("Memcached store: Unexpected get response: " + header);
    }

    std::string value = read_block(length);
    std::string trailer = read_line();
    if (trailer != "END") {
      throw StoreError("Memcached store: Missing END after value for key: " + key);
    }
    return value;
  });
}

void MemcachedStore::set(const std::string& key, const std::string& value, Ttl ttl) {
  validate_key(key);
  if (ttl && (ttl->count() <= 0 || *ttl > MAX_TTL)) {
    BOOST_LOG_TRIVIAL(error) << "Memcached store: Rejecting TTL " << ttl->count() << "ms for key: " << key;
    throw InvalidTTLError(std::to_string(ttl->count()) + "ms for key " + key);
  }

  const int64_t expiration = to_expiration(ttl);
  with_connection("set", [&]() {
    std::string reply = request("set " + key + " 0 " + std::to_string(expiration) + " " +
                                std::to_string(value.size()), &value);
    if (reply != "STORED") {
      BOOST_LOG_TRIVIAL(error) << "Memcached store: Set rejected for key " << key << ": " << reply;
      throw StoreError("Memcached store: Set rejected: " + reply);
    }
  });
  BOOST_LOG_TRIVIAL(debug) << "Memcached store: Stored key: " << key << " (exptime " << expiration << ")";
}

void MemcachedStore::remove(const std::string& key) {
  validate_key(key);

  with_connection("delete", [&]() {
    std::string reply = request("delete " + key);
    if (reply == "NOT_FOUND") {
      throw NotFoundError(key);
    }
    if (reply != "DELETED") {
      BOOST_LOG_TRIVIAL(error) << "Memcached store: Delete failed for key " << key << ": " << reply;
      throw StoreError("Memcached store: Delete failed: " + reply);
    }
  });
  BOOST_LOG_TRIVIAL(debug) << "Memcached store: Removed key: " << key;
}

void MemcachedStore::flush() {
  with_connection("flush_all", [&]() {
    std::string reply = request("flush_all");
    if (reply != "OK") {
      throw StoreError("Memcached store: flush_all failed: " + reply);
    }
  });
  BOOST_LOG_TRIVIAL(info) << "Memcached store: Flushed all entries";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool MemcachedStore::has(const std::string& key) {
  try {
    get(key);
    return true;
  }
  catch (const NotFoundError&) {
    return false;
  }
}

std::size_t MemcachedStore::size() {
  return with_connection("stats", [&]() -> std::size_t {
    std::string line = request("stats");
    std::size_t items = 0;

    // STAT <name> <value> lines terminated by END
    while (line != "END") {
      std::istringstream fields(line);
      std::string tag, name, value;
      if (!(fields >> tag >> name >> value) || tag != "STAT") {
        throw StoreError("Memcached store: Unexpected stats line: " + line);
      }
      if (name == "curr_items") {
        try {
          items = static_cast<std::size_t>(std::stoull(value));
        }
        catch (const std::exception&) {
          BOOST_LOG_TRIVIAL(error) << "Memcached store: Invalid curr_items value: " << value;
          throw StoreError("Memcached store: Invalid curr_items value: " + value);
        }
      }
      line = read_line();
    }
    return items;
  });
}


//==============================================
// CONNECTION MANAGEMENT
//==============================================

void MemcachedStore::ensure_connected() {
  if (socket_ && socket_->is_open()) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Memcached store: Connecting to " << host_ << ":" << port_;

  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host_, std::to_string(port_));

  socket_ = std::make_unique<boost::asio::ip::tcp::socket>(io_context_);
  boost::asio::connect(*socket_, endpoints);
  socket_->set_option(boost::asio::ip::tcp::no_delay(true));
  input_buffer_.consume(input_buffer_.size());

  BOOST_LOG_TRIVIAL(info) << "Memcached store: Connected to " << host_ << ":" << port_;
}

void MemcachedStore::close_connection() {
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Memcached store: Error closing socket: " << ec.message();
    }
  }
  socket_.reset();
  input_buffer_.consume(input_buffer_.size());
}


//==============================================
// PROTOCOL
//==============================================

std::string MemcachedStore::request(const std::string& command, const std::string* payload) {
  std::string message = command + "\r\n";
  if (payload) {
    message += *payload;
    message += "\r\n";
  }
  boost::asio::write(*socket_, boost::asio::buffer(message));

  std::string reply = read_line();
  if (reply == "ERROR" || reply.rfind("CLIENT_ERROR", 0) == 0 || reply.rfind("SERVER_ERROR", 0) == 0) {
    BOOST_LOG_TRIVIAL(error) << "Memcached store: Server rejected '" << command << "': " << reply;
    throw StoreError("Memcached store: " + reply);
  }
  return reply;
}

std::string MemcachedStore::read_line() {
  std::size_t length = boost::asio::read_until(*socket_, input_buffer_, "\r\n");

  auto begin = boost::asio::buffers_begin(input_buffer_.data());
  std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 2));
  input_buffer_.consume(length);
  return line;
}

std::string MemcachedStore::read_block(std::size_t length) {
  const std::size_t needed = length + 2;
  if (input_buffer_.size() < needed) {
    boost::asio::read(*socket_, input_buffer_,
                      boost::asio::transfer_exactly(needed - input_buffer_.size()));
  }

  auto begin = boost::asio::buffers_begin(input_buffer_.data());
  std::string block(begin, begin + static_cast<std::ptrdiff_t>(needed));
  input_buffer_.consume(needed);

  if (block.compare(length, 2, "\r\n") != 0) {
    throw StoreError("Memcached store: Malformed data block");
  }
  block.resize(length);
  return block;
}

void MemcachedStore::validate_key(const std::string& key) {
  if (key.empty() || key.size() > MAX_KEY_LENGTH) {
    throw StoreError("Memcached store: Key length must be between 1 and " +
                     std::to_string(MAX_KEY_LENGTH) + " bytes");
  }
  for (unsigned char c : key) {
    if (c <= 0x20 || c == 0x7f) {
      throw StoreError("Memcached store: Key contains whitespace or control characters");
    }
  }
}

int64_t MemcachedStore::to_expiration(Ttl ttl) {
  if (!ttl) {
    return 0;
  }

  // Round up, an exptime of 0 never expires
  const int64_t seconds = ttl->count() / 1000 + (ttl->count() % 1000 > 0 ? 1 : 0);
  if (seconds <= MAX_RELATIVE_EXPIRY) {
    return seconds;
  }

  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  return now + seconds;
}

} // namespace store
} // namespace datastore
