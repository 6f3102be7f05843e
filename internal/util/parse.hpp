#pragma once

#include <cstdint>
#include <string_view>

namespace lifebank::util {

// Whole-string unsigned decimal. No sign, no whitespace; throws InvalidInput.
std::uint64_t ParseUint(std::string_view text, std::string_view what);

} // namespace lifebank::util
