#include "blake3_util.h"

#include "util.h"

#include "blake3.h"

namespace scout {

blake3_t blake3_hash(void const *data, size_t length) {
  blake3_t digest;
  blake3_hasher hasher;

  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, length);
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

std::string blake3_fingerprint(std::string_view content) {
  auto const digest{ blake3_hash(content.data(), content.size()) };
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace scout
