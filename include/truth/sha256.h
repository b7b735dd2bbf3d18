#pragma once

#include "errors.h"
#include <string>

namespace callroute {
namespace truth {

/// Lowercase hex SHA-256 of the bytes of `data`
Result<std::string> sha256_hex(const std::string& data);

} // namespace truth
} // namespace callroute
