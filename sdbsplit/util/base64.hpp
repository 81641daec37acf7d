#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sdbsplit
{

std::string encodeBase64(const std::vector<uint8_t>& input);
std::string encodeBase64(const std::string& input);

// Throws std::runtime_error on characters outside the base64 alphabet.
std::string decodeBase64(const std::string& input);

} // namespace sdbsplit
