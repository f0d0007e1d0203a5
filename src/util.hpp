#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace rembed {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Parse a strictly positive decimal integer. Returns false on junk,
// sign characters, zero, or overflow.
bool parse_positive(const std::string& s, uint64_t& out);

// Standard (RFC 4648) base64 with padding
std::string base64_encode(const std::string& data);
std::string base64_encode(const unsigned char* data, size_t len);

// Decode standard base64. Whitespace is skipped; throws
// std::invalid_argument on any other character outside the alphabet.
std::string base64_decode(const std::string& encoded);

// Pack floats into their native little-endian byte representation
// (the layout sqlite-vec reads from a float32 blob).
std::string floats_to_blob(const std::vector<float>& values);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace rembed
