#include "store/memory_store.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include "util/byte_order.hpp"

namespace datastore {
namespace store {

namespace {

constexpr char SNAPSHOT_MAGIC[4] = {'D', 'S', 'T', 'S'};
constexpr uint8_t SNAPSHOT_VERSION = 1;
constexpr uint32_t MAX_FIELD_SIZE = 256u * 1024u * 1024u;

int64_t to_epoch_ms(MemoryStore::Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

MemoryStore::Clock::time_point from_epoch_ms(int64_t ms) {
  return MemoryStore::Clock::time_point(
    std::chrono::duration_cast<MemoryStore::Clock::duration>(std::chrono::milliseconds(ms)));
}

void write_field(std::ostream& output, const std::string& field) {
  util::ByteOrder::write<uint32_t>(output, static_cast<uint32_t>(field.size()));
  output.write(field.data(), static_cast<std::streamsize>(field.size()));
}

std::string read_field(std::istream& input) {
  uint32_t length = 0;
  if (!util::ByteOrder::read(input, length)) {
    throw StoreError("Store: Truncated snapshot (field length)");
  }
  if (length > MAX_FIELD_SIZE) {
    throw StoreError("Store: Snapshot field too large: " + std::to_string(length));
  }
  std::string field(length, '\0');
  if (length > 0 && !input.read(&field[0], length)) {
    throw StoreError("Store: Truncated snapshot (field data)");
  }
  return field;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemoryStore::MemoryStore() {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing in-memory store";
}

MemoryStore::~MemoryStore() {
  BOOST_LOG_TRIVIAL(debug) << "Store: In-memory store destroyed with " << entries_.size() << " entries";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::string MemoryStore::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  Entry* entry = find_live(key, Clock::now());
  if (!entry) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Key not found: " << key;
    throw NotFoundError(key);
  }
  return entry->value;
}

void MemoryStore::set(const std::string& key, const std::string& value, Ttl ttl) {
  if (ttl && (ttl->count() <= 0 || *ttl > MAX_TTL)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Rejecting TTL " << ttl->count() << "ms for key: " << key;
    throw InvalidTTLError(std::to_string(ttl->count()) + "ms for key " + key);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();

  std::optional<Clock::time_point> expires_at;
  if (ttl) {
    expires_at = now + *ttl;
  }

  // An expired predecessor counts as absent
  if (Entry* entry = find_live(key, now)) {
    entry->value = value;
    entry->expires_at = expires_at;
    BOOST_LOG_TRIVIAL(debug) << "Store: Replaced value for key: " << key;
    return;
  }

  order_.push_back(key);
  entries_.emplace(key, Entry{value, expires_at, std::prev(order_.end())});
  ++live_count_;
  BOOST_LOG_TRIVIAL(debug) << "Store: Stored key: " << key
                           << (ttl ? " with TTL " + std::to_string(ttl->count()) + "ms" : " without expiry");
}

void MemoryStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!find_live(key, Clock::now())) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Cannot remove missing key: " << key;
    throw NotFoundError(key);
  }
  erase_entry(entries_.find(key));
  BOOST_LOG_TRIVIAL(debug) << "Store: Removed key: " << key;
}

void MemoryStore::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  clear_locked();
  BOOST_LOG_TRIVIAL(info) << "Store: Flushed all entries";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool MemoryStore::has(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_live(key, Clock::now()) != nullptr;
}

std::size_t MemoryStore::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_count_;
}

std::vector<std::string> MemoryStore::keys() {
  std::vector<std::string> result;
  for (auto& item : items()) {
    result.push_back(std::move(item.first));
  }
  return result;
}

std::vector<std::pair<std::string, std::string>> MemoryStore::items() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();

  std::vector<std::pair<std::string, std::string>> result;
  result.reserve(entries_.size());

  auto it = order_.begin();
  while (it != order_.end()) {
    // Advance first, find_live may erase the current position
    const std::string key = *it++;
    if (Entry* entry = find_live(key, now)) {
      result.emplace_back(key, entry->value);
    }
  }
  return result;
}


//==============================================
// PERSISTENCE
//==============================================

void MemoryStore::persist(std::ostream& output) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();

  std::vector<const Entry*> live;
  std::vector<const std::string*> live_keys;
  for (const auto& key : order_) {
    const Entry& entry = entries_.at(key);
    if (!is_expired(entry, now)) {
      live.push_back(&entry);
      live_keys.push_back(&key);
    }
  }

  output.write(SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC));
  util::ByteOrder::write<uint8_t>(output, SNAPSHOT_VERSION);
  util::ByteOrder::write<uint64_t>(output, live.size());

  for (std::size_t i = 0; i < live.size(); ++i) {
    write_field(output, *live_keys[i]);
    write_field(output, live[i]->value);
    util::ByteOrder::write<uint8_t>(output, live[i]->expires_at ? 1 : 0);
    util::ByteOrder::write<int64_t>(output, live[i]->expires_at ? to_epoch_ms(*live[i]->expires_at) : 0);
  }

  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write snapshot";
    throw StoreError("Store: Failed to write snapshot");
  }
  BOOST_LOG_TRIVIAL(info) << "Store: Persisted " << live.size() << " entries";
}

void MemoryStore::persist(const std::filesystem::path& file_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Persisting snapshot to: " << file_path.string();

  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path());
  }

  // Write beside the target and rename so a crash never leaves half a snapshot
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create snapshot file: " + temp_path.string());
    }
    persist(file);
  }
  std::filesystem::rename(temp_path, file_path);
}

void MemoryStore::restore(std::istream& input) {
  char magic[sizeof(SNAPSHOT_MAGIC)];
  if (!input.read(magic, sizeof(magic)) ||
      !std::equal(std::begin(magic), std::end(magic), std::begin(SNAPSHOT_MAGIC))) {
    BOOST_LOG_TRIVIAL(error) << "Store: Snapshot has an invalid header";
    throw StoreError("Store: Invalid snapshot header");
  }

  uint8_t version = 0;
  if (!util::ByteOrder::read(input, version) || version != SNAPSHOT_VERSION) {
    throw StoreError("Store: Unsupported snapshot version: " + std::to_string(version));
  }

  uint64_t count = 0;
  if (!util::ByteOrder::read(input, count)) {
    throw StoreError("Store: Truncated snapshot (entry count)");
  }

  struct Record {
    std::string key;
    std::string value;
    std::optional<Clock::time_point> expires_at;
  };

  // Decode everything before touching the live map
  std::vector<Record> records;
  for (uint64_t i = 0; i < count; ++i) {
    Record record;
    record.key = read_field(input);
    record.value = read_field(input);

    uint8_t has_expiry = 0;
    int64_t expires_ms = 0;
    if (!util::ByteOrder::read(input, has_expiry) || !util::ByteOrder::read(input, expires_ms)) {
      throw StoreError("Store: Truncated snapshot (expiry)");
    }
    if (has_expiry) {
      record.expires_at = from_epoch_ms(expires_ms);
    }
    records.push_back(std::move(record));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  clear_locked();

  const auto now = Clock::now();
  std::size_t dropped = 0;
  for (auto& record : records) {
    if (record.expires_at && *record.expires_at <= now) {
      ++dropped;
      continue;
    }
    auto existing = entries_.find(record.key);
    if (existing != entries_.end()) {
      erase_entry(existing);
    }
    order_.push_back(record.key);
    entries_.emplace(record.key, Entry{std::move(record.value), record.expires_at, std::prev(order_.end())});
    ++live_count_;
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Restored " << live_count_ << " entries ("
                          << dropped << " already expired)";
}

void MemoryStore::restore(const std::filesystem::path& file_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Restoring snapshot from: " << file_path.string();

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Snapshot file not found: " << file_path.string();
    throw StoreError("Store: Failed to open snapshot file: " + file_path.string());
  }
  restore(file);
}


//==============================================
// LAZY EXPIRY
//==============================================

MemoryStore::Entry* MemoryStore::find_live(const std::string& key, Clock::time_point now) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return nullptr;
  }
  if (is_expired(it->second, now)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Evicting expired key: " << key;
    erase_entry(it);
    return nullptr;
  }
  return &it->second;
}

void MemoryStore::erase_entry(std::unordered_map<std::string, Entry>::iterator it) {
  order_.erase(it->second.position);
  entries_.erase(it);
  if (live_count_ > 0) {
    --live_count_;
  }
}

bool MemoryStore::is_expired(const Entry& entry, Clock::time_point now) {
  return entry.expires_at && *entry.expires_at <= now;
}

void MemoryStore::clear_locked() {
  entries_.clear();
  order_.clear();
  live_count_ = 0;
}

} // namespace store
} // namespace datastore
