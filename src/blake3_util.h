#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace scout {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Lowercase hex digest of `content`; used as the registration-file fingerprint.
std::string blake3_fingerprint(std::string_view content);

}  // namespace scout
