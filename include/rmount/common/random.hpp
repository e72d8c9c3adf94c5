#pragma once

#include <cstddef>
#include <string>

namespace rmount::common {

/// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// RFC 4122 version 4 identifier.
[[nodiscard]] std::string random_uuid();

} // namespace rmount::common
