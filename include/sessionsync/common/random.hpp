#pragma once

#include "sessionsync/common/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sessionsync::common {

/// Bytes from the OpenSSL CSPRNG. Fails rather than degrading to a weaker source.
[[nodiscard]] Result<std::vector<std::uint8_t>> random_bytes(std::size_t count);

/// Uniformly distributed [A-Za-z0-9] characters from the CSPRNG.
[[nodiscard]] Result<std::string> random_alphanumeric(std::size_t length);

[[nodiscard]] bool is_ascii_alphanumeric(const std::string &value);

} // namespace sessionsync::common
