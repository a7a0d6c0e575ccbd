#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gt {

// Standard alphabet with '=' padding.
std::string base64Encode(const std::vector<std::uint8_t>& in);

// Accepts missing trailing padding and ignores ASCII whitespace.
// Returns false (out cleared) on any other invalid input.
bool base64Decode(const std::string& in, std::vector<std::uint8_t>& out);

} // namespace gt
