// POLYMINT - Core Types Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/core/types.h"

namespace polymint {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

// ============================================================================
// Address Implementation
// ============================================================================

Address Address::FromLabel(const std::string& label) {
    // FNV-1a, re-seeded per output byte so short labels still spread
    std::array<Byte, SIZE> data{};
    uint64_t h = 14695981039346656037ULL;
    for (size_t i = 0; i < SIZE; ++i) {
        h ^= static_cast<uint64_t>(i + 1);
        h *= 1099511628211ULL;
        for (char c : label) {
            h ^= static_cast<Byte>(c);
            h *= 1099511628211ULL;
        }
        data[i] = static_cast<Byte>(h >> 56);
    }
    return Address(data);
}

Address Address::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for address");
    }

    std::array<Byte, SIZE> data{};
    for (size_t i = 0; i < SIZE; ++i) {
        int high = HexCharToNibble(digits[i * 2]);
        int low = HexCharToNibble(digits[i * 2 + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        data[i] = static_cast<Byte>((high << 4) | low);
    }
    return Address(data);
}

std::string Address::ToHex() const {
    std::string result = "0x";
    result.reserve(2 + SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(HEX_CHARS[data_[i] >> 4]);
        result.push_back(HEX_CHARS[data_[i] & 0x0F]);
    }
    return result;
}

} // namespace polymint
