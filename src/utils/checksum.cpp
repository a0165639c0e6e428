#include "checksum.h"
#include <array>
#include <fstream>
#include <vector>
#include <cstdio>

namespace {

constexpr uint32_t kCrc32Poly = 0xEDB88320;
constexpr uint64_t kFnvOffset = 14695981039346656037ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;

const std::array<uint32_t, 256>& crcTable() {
    static const std::array<uint32_t, 256> table = []() {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int j = 0; j < 8; ++j) {
                c = (c & 1) ? (kCrc32Poly ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();
    return table;
}

} // namespace

uint32_t crc32(const uint8_t* data, size_t size, uint32_t seed) {
    const auto& table = crcTable();
    uint32_t crc = seed ^ 0xFFFFFFFF;
    for (size_t i = 0; i < size; ++i) {
        crc = table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

bool crc32File(const std::filesystem::path& path, uint32_t& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::vector<char> block(64 * 1024);
    uint32_t crc = 0;
    while (file) {
        file.read(block.data(), static_cast<std::streamsize>(block.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            crc = crc32(reinterpret_cast<const uint8_t*>(block.data()), static_cast<size_t>(got), crc);
        }
    }
    if (file.bad()) {
        return false;
    }
    out = crc;
    return true;
}

uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = kFnvOffset;
    for (unsigned char byte : data) {
        hash ^= static_cast<uint64_t>(byte);
        hash *= kFnvPrime;
    }
    return hash;
}

std::string toHex32(uint32_t value) {
    char buf[9];
    snprintf(buf, sizeof(buf), "%08x", value);
    return buf;
}

std::string toHex64(uint64_t value) {
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return buf;
}
