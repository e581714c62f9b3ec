#ifndef DATASTORE_TRANSFER_ERROR_HPP
#define DATASTORE_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace datastore::transfer {

// I/O failure on a transfer's source or sink. Never retried by the engine.
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error("Transfer failed: " + message) {}
};

} // namespace datastore::transfer

#endif // DATASTORE_TRANSFER_ERROR_HPP
