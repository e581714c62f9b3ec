#ifndef DATASTORE_TASK_ID_HPP
#define DATASTORE_TASK_ID_HPP

#include <cstddef>
#include <string>

namespace datastore::task {

static constexpr std::size_t TASK_ID_ENTROPY = 16;  // bytes

// URL-safe base64 (no padding) of `entropy_bytes` bytes from the OpenSSL CSPRNG
std::string generate_task_id(std::size_t entropy_bytes = TASK_ID_ENTROPY);

} // namespace datastore::task

#endif // DATASTORE_TASK_ID_HPP
