#include "task/task_id.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>

namespace datastore::task {

std::string generate_task_id(std::size_t entropy_bytes) {
  if (entropy_bytes == 0) {
    throw std::invalid_argument("Task id: Entropy size must be positive");
  }

  std::vector<unsigned char> bytes(entropy_bytes);
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Task id: RAND_bytes failed: " << ERR_get_error();
    throw std::runtime_error("Task id: Failed to generate random bytes");
  }

  // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a terminator
  std::vector<unsigned char> encoded(4 * ((bytes.size() + 2) / 3) + 1);
  int length = EVP_EncodeBlock(encoded.data(), bytes.data(), static_cast<int>(bytes.size()));
  if (length < 0) {
    throw std::runtime_error("Task id: Failed to encode random bytes");
  }

  std::string id;
  id.reserve(static_cast<std::size_t>(length));
  for (int i = 0; i < length; ++i) {
    char c = static_cast<char>(encoded[i]);
    if (c == '=') break;
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
    id.push_back(c);
  }
  return id;
}

} // namespace datastore::task
