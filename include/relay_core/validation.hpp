#pragma once

#include <cstddef>
#include <string>

namespace relay_core {

constexpr std::size_t kDefaultMaxQueryLength = 2000;

// Throws ValidationError unless the query is non-blank, valid UTF-8 and at
// most max_length code points long.
void validate_query(const std::string &query, std::size_t max_length = kDefaultMaxQueryLength);

}  // namespace relay_core
