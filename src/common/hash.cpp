#include "ragsync/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace ragsync::common {

std::string sha256_hex(const void *data, const std::size_t size) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(static_cast<const unsigned char *>(data), size, digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::string sha256_hex(const std::string_view data) { return sha256_hex(data.data(), data.size()); }

} // namespace ragsync::common
