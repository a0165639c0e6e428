#ifndef CHECKSUM_H
#define CHECKSUM_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

// CRC-32 (IEEE 802.3, reflected) of a byte range
uint32_t crc32(const uint8_t* data, size_t size, uint32_t seed = 0);

// CRC-32 of a whole file, streamed in blocks
// Returns false if the file cannot be read
bool crc32File(const std::filesystem::path& path, uint32_t& out);

// 64-bit FNV-1a digest of a string
uint64_t fnv1a64(const std::string& data);

// Fixed-width lowercase hex ("0000abcd")
std::string toHex32(uint32_t value);
std::string toHex64(uint64_t value);

#endif // CHECKSUM_H
