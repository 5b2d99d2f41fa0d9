#pragma once

#include <expected>
#include <string>

namespace stamp {

/// Every data-related failure (I/O, malformed input) travels through this; the error is a message.
template <typename T>
using Result = std::expected<T, std::string>;

} // namespace stamp
