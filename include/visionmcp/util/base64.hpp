#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace visionmcp::util::base64
{

std::string encode(const std::vector<uint8_t>& bytes);

/// Stops at the first padding or non-alphabet character.
std::vector<uint8_t> decode(const std::string& encoded);

} // namespace visionmcp::util::base64
