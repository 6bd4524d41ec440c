#include "relay_core/validation.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

#include "relay_core/errors.hpp"

namespace relay_core {

void validate_query(const std::string &query, std::size_t max_length) {
  const bool blank = std::all_of(query.begin(), query.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  if (query.empty() || blank) {
    throw ValidationError("Query must be a non-empty string");
  }

  if (!utf8::is_valid(query.begin(), query.end())) {
    throw ValidationError("Query must be valid UTF-8");
  }

  const auto length = static_cast<std::size_t>(utf8::distance(query.begin(), query.end()));
  if (length > max_length) {
    throw ValidationError(
        "Query exceeds maximum length of " + std::to_string(max_length) + " characters",
        {{"length", length}, {"maxLength", max_length}});
  }
}

}  // namespace relay_core
