#ifndef DATASTORE_STORE_ERROR_HPP
#define DATASTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace datastore::store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Key absent, or its value has expired
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& key)
        : StoreError("Key not found: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class InvalidTTLError : public StoreError {
public:
    explicit InvalidTTLError(const std::string& message)
        : StoreError("Invalid TTL: " + message) {}
};

// Remote store unreachable, or it answered outside the protocol
class ConnectionError : public StoreError {
public:
    explicit ConnectionError(const std::string& message)
        : StoreError("Connection error: " + message) {}
};

} // namespace datastore::store

#endif // DATASTORE_STORE_ERROR_HPP
