#include "parse.hpp"

#include <charconv>
#include <string>

#include "internal/util/errors.hpp"

namespace lifebank::util {

std::uint64_t ParseUint(std::string_view text, std::string_view what) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    throw InvalidInput(std::string(what) + " must be an unsigned integer: '" + std::string(text) + "'");
  }
  return value;
}

} // namespace lifebank::util
