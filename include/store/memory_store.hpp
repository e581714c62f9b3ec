#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <list>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "store/expiring_store.hpp"

namespace datastore {
namespace store {

class MemoryStore : public ExpiringStore {
public:
  using Clock = std::chrono::system_clock;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryStore();
  ~MemoryStore() override;

  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  std::string get(const std::string& key) override;
  void set(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) override;
  void remove(const std::string& key) override;
  void flush() override;


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) override;
  std::size_t size() override;
  // Live keys in insertion order
  std::vector<std::string> keys();
  // Live (key, value) pairs in insertion order
  std::vector<std::pair<std::string, std::string>> items();


  // ---- PERSISTENCE ----
  // Writes every live entry with its absolute expiry
  void persist(std::ostream& output);
  void persist(const std::filesystem::path& file_path);
  // Replaces the current contents with a snapshot written by persist()
  void restore(std::istream& input);
  void restore(const std::filesystem::path& file_path);

private:
  struct Entry {
    std::string value;
    // Empty for entries that never expire
    std::optional<Clock::time_point> expires_at;
    std::list<std::string>::iterator position;
  };

  // ---- PARAMETERS ----
  std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  // Key insertion order
  std::list<std::string> order_;
  // Live-entry counter, only corrected when an expired entry is touched
  std::size_t live_count_{0};


  // ---- LAZY EXPIRY ----
  // Drops the entry if it has expired; returns the live entry or nullptr.
  // Caller must hold mutex_.
  Entry* find_live(const std::string& key, Clock::time_point now);
  void erase_entry(std::unordered_map<std::string, Entry>::iterator it);
  static bool is_expired(const Entry& entry, Clock::time_point now);
  void clear_locked();
};

} // namespace store
} // namespace datastore
