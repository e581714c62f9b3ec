#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "store/memcached_store.hpp"
#include "store/store_error.hpp"
#include "task/task_error.hpp"
#include "task/task_registry.hpp"

using namespace datastore::store;
using namespace std::chrono_literals;
using boost::asio::ip::tcp;

// Single-threaded memcached stand-in on a loopback ephemeral port.
// Serves one client connection at a time.
class FakeMemcached {
public:
  FakeMemcached()
    : acceptor_(io_context_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {
    thread_ = std::thread([this]() { serve(); });
  }

  ~FakeMemcached() {
    stop();
  }

  uint16_t port() const { return acceptor_.local_endpoint().port(); }

  void stop() {
    if (stopped_.exchange(true)) {
      return;
    }
    // Wake the blocking accept
    boost::asio::io_context wake_context;
    tcp::socket wake(wake_context);
    boost::system::error_code ec;
    wake.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port()), ec);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  // Close the connection right after the next reply
  void drop_after_next_reply() { drop_after_reply_ = true; }
  // Answer the next command with this line instead
  void fail_next(const std::string& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    forced_reply_ = reply;
  }

  int connections() const { return connections_.load(); }

  std::vector<std::string> commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
  }

  std::string exptime(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = exptimes_.find(key);
    return it == exptimes_.end() ? "" : it->second;
  }

private:
  boost::asio::io_context io_context_;
  tcp::acceptor acceptor_;
  std::thread thread_;
  std::atomic<bool> stopped_{false};
  std::atomic<bool> drop_after_reply_{false};
  std::atomic<int> connections_{0};

  mutable std::mutex mutex_;
  std::map<std::string, std::string> data_;
  std::map<std::string, std::string> exptimes_;
  std::vector<std::string> commands_;
  std::string forced_reply_;

  void serve() {
    while (!stopped_) {
      tcp::socket socket(io_context_);
      boost::system::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec || stopped_) {
        return;
      }
      ++connections_;
      session(socket);
    }
  }

  static std::string take(boost::asio::streambuf& buffer, std::size_t length) {
    auto begin = boost::asio::buffers_begin(buffer.data());
    std::string bytes(begin, begin + static_cast<std::ptrdiff_t>(length));
    buffer.consume(length);
    return bytes;
  }

  void session(tcp::socket& socket) {
    boost::asio::streambuf buffer;
    boost::system::error_code ec;

    while (true) {
      std::size_t length = boost::asio::read_until(socket, buffer, "\r\n", ec);
      if (ec) {
        return;
      }
      std::string line = take(buffer, length);
      line.resize(line.size() - 2);

      std::istringstream fields(line);
      std::string command, key;
      fields >> command >> key;

      std::string payload;
      if (command == "set") {
        std::string flags, exptime;
        std::size_t bytes = 0;
        fields >> flags >> exptime >> bytes;
        if (buffer.size() < bytes + 2) {
          boost::asio::read(socket, buffer, boost::asio::transfer_exactly(bytes + 2 - buffer.size()), ec);
          if (ec) {
            return;
          }
        }
        payload = take(buffer, bytes + 2).substr(0, bytes);
        std::lock_guard<std::mutex> lock(mutex_);
        exptimes_[key] = exptime;
      }

      const std::string reply = respond(line, command, key, payload);
      boost::asio::write(socket, boost::asio::buffer(reply), ec);
      if (ec) {
        return;
      }
      if (drop_after_reply_.exchange(false)) {
        socket.close(ec);
        return;
      }
    }
  }

  std::string respond(const std::string& line, const std::string& command,
                      const std::string& key, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    commands_.push_back(line);

    if (!forced_reply_.empty()) {
      std::string reply = forced_reply_ + "\r\n";
      forced_reply_.clear();
      return reply;
    }

    if (command == "get") {
      auto it = data_.find(key);
      if (it == data_.end()) {
        return "END\r\n";
      }
      return "VALUE " + key + " 0 " + std::to_string(it->second.size()) + "\r\n" + it->second + "\r\nEND\r\n";
    }
    if (command == "set") {
      data_[key] = payload;
      return "STORED\r\n";
    }
    if (command == "delete") {
      return data_.erase(key) ? "DELETED\r\n" : "NOT_FOUND\r\n";
    }
    if (command == "flush_all") {
      data_.clear();
      return "OK\r\n";
    }
    if (command == "stats") {
      return "STAT pid 1\r\nSTAT curr_items " + std::to_string(data_.size()) + "\r\nEND\r\n";
    }
    return "ERROR\r\n";
  }
};


class MemcachedStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<FakeMemcached> server;
  std::unique_ptr<MemcachedStore> store;

  void SetUp() override {
    server = std::make_unique<FakeMemcached>();
    store = std::make_unique<MemcachedStore>("127.0.0.1", server->port());
  }

  void TearDown() override {
    store.reset();
    server.reset();
  }
};

TEST_F(MemcachedStoreTest, SetAndGet) {
  store->set("task", "ab");
  store->set("binary", "line1\r\nline2");

  EXPECT_EQ(store->get("task"), "ab");
  EXPECT_EQ(store->get("binary"), "line1\r\nline2");
  EXPECT_TRUE(store->has("task"));
  EXPECT_EQ(server->connections(), 1);
}

TEST_F(MemcachedStoreTest, MissingKey) {
  EXPECT_THROW(store->get("absent"), NotFoundError);
  EXPECT_THROW(store->remove("absent"), NotFoundError);
  EXPECT_FALSE(store->has("absent"));

  // A miss is not a connection problem
  EXPECT_EQ(server->connections(), 1);
}

TEST_F(MemcachedStoreTest, RemoveDeletesKey) {
  store->set("key", "value");
  store->remove("key");
  EXPECT_THROW(store->get("key"), NotFoundError);
}

TEST_F(MemcachedStoreTest, TtlRoundsUpToSeconds) {
  store->set("no_ttl", "v");
  store->set("one_ms", "v", 1ms);
  store->set("fractional", "v", 1500ms);
  store->set("exact", "v", 60s);

  EXPECT_EQ(server->exptime("no_ttl"), "0");
  EXPECT_EQ(server->exptime("one_ms"), "1");
  EXPECT_EQ(server->exptime("fractional"), "2");
  EXPECT_EQ(server->exptime("exact"), "60");
}

TEST_F(MemcachedStoreTest, LongTtlSentAsUnixTime) {
  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();

  store->set("long", "v", std::chrono::hours(24 * 31));

  const int64_t exptime = std::stoll(server->exptime("long"));
  EXPECT_GE(exptime, now + 31 * 24 * 3600);
  EXPECT_LE(exptime, now + 31 * 24 * 3600 + 5);
}

TEST_F(MemcachedStoreTest, RejectsInvalidInput) {
  EXPECT_THROW(store->set("key", "v", 0ms), InvalidTTLError);
  EXPECT_THROW(store->set("key", "v", std::chrono::milliseconds::max()), InvalidTTLError);
  EXPECT_THROW(store->set("key", "v", MAX_TTL + 1ms), InvalidTTLError);
  EXPECT_THROW(store->set("has space", "v"), StoreError);
  EXPECT_THROW(store->get(std::string(MemcachedStore::MAX_KEY_LENGTH + 1, 'k')), StoreError);
  EXPECT_THROW(store->get(""), StoreError);

  EXPECT_TRUE(server->commands().empty());
}

TEST_F(MemcachedStoreTest, FlushAndSize) {
  store->set("a", "1");
  store->set("b", "2");
  EXPECT_EQ(store->size(), 2u);

  store->flush();
  EXPECT_EQ(store->size(), 0u);
  EXPECT_FALSE(store->has("a"));
}

TEST_F(MemcachedStoreTest, ReconnectsAfterDroppedConnection) {
  store->set("key", "value");
  server->drop_after_next_reply();
  EXPECT_EQ(store->get("key"), "value");

  EXPECT_THROW(store->get("key"), ConnectionError);
  EXPECT_EQ(store->get("key"), "value");
  EXPECT_EQ(server->connections(), 2);
}

TEST_F(MemcachedStoreTest, ServerErrorIsStoreError) {
  server->fail_next("SERVER_ERROR out of memory");

  try {
    store->set("key", "value");
    FAIL() << "Expected StoreError";
  }
  catch (const ConnectionError&) {
    FAIL() << "Server error must not be reported as a connection error";
  }
  catch (const StoreError& e) {
    EXPECT_NE(std::string(e.what()).find("SERVER_ERROR"), std::string::npos);
  }

  store->set("key", "value");
  EXPECT_EQ(store->get("key"), "value");
}

TEST_F(MemcachedStoreTest, MalformedStatsIsStoreError) {
  store->set("a", "1");
  server->fail_next("STAT curr_items many\r\nSTAT pid 1\r\nEND");

  try {
    store->size();
    FAIL() << "Expected StoreError";
  }
  catch (const ConnectionError&) {
    FAIL() << "A bad stats value must not be reported as a connection error";
  }
  catch (const StoreError& e) {
    EXPECT_NE(std::string(e.what()).find("curr_items"), std::string::npos);
  }

  // The unread stats lines went with the old connection
  EXPECT_EQ(store->get("a"), "1");
  EXPECT_EQ(store->size(), 1u);
  EXPECT_EQ(server->connections(), 2);
}

TEST(MemcachedStoreUnreachableTest, ThrowsConnectionError) {
  uint16_t port = 0;
  {
    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    port = acceptor.local_endpoint().port();
  }

  MemcachedStore store("127.0.0.1", port);
  EXPECT_THROW(store.set("key", "value"), ConnectionError);
  EXPECT_THROW(store.get("key"), ConnectionError);
}

TEST_F(MemcachedStoreTest, BacksTaskRegistry) {
  datastore::task::TaskRegistry registry(*store, 10s);

  const std::string task_id = registry.create_task();
  registry.pause(task_id);
  EXPECT_TRUE(registry.read(task_id).is_paused);
  EXPECT_THROW(registry.pause(task_id), datastore::task::ConflictError);

  registry.remove(task_id);
  EXPECT_THROW(registry.read(task_id), NotFoundError);
  EXPECT_EQ(server->exptime(task_id), "10");
}
