// POLYMINT - Core Types Header
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// This file defines fundamental types used throughout POLYMINT.

#ifndef POLYMINT_CORE_TYPES_H
#define POLYMINT_CORE_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace polymint {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount, price or accumulator value in 18-decimal fixed point.
/// Overflow, underflow and division by zero throw.
using Amount = boost::multiprecision::checked_uint256_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Block number
using BlockNumber = uint64_t;

/// Time constants (seconds)
constexpr Timestamp HOURS = 60 * 60;
constexpr Timestamp DAYS = 24 * HOURS;

// ============================================================================
// Address
// ============================================================================

/**
 * 160-bit account or contract identifier.
 */
class Address {
public:
    static constexpr size_t SIZE = 20;

    /// Default constructor - creates the null address
    Address() noexcept { data_.fill(0); }

    /// Construct from byte array
    explicit Address(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Derive a stable address from a human-readable label
    static Address FromLabel(const std::string& label);

    /// Parse from 40 hex characters (optional 0x prefix)
    static Address FromHex(const std::string& hex);

    /// Check if address is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Hex representation with 0x prefix
    std::string ToHex() const;

    /// Short form for log lines (0x + first 8 hex chars)
    std::string ToShortString() const { return ToHex().substr(0, 10); }

    const Byte* data() const noexcept { return data_.data(); }
    constexpr size_t size() const noexcept { return SIZE; }

    bool operator==(const Address& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Address& other) const noexcept { return !(*this == other); }
    bool operator<(const Address& other) const noexcept { return data_ < other.data_; }

private:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Call Context
// ============================================================================

/**
 * Execution environment of a single state-mutating call.
 *
 * Every entry point receives the context explicitly; it is the only
 * source of "now" and of the block unit used by the one-call-per-block
 * guard.
 */
struct CallContext {
    /// Immediate caller of the entry point
    Address caller;

    /// Originating account of the surrounding transaction
    Address origin;

    /// Block the call executes in
    BlockNumber blockNumber{0};

    /// Block timestamp
    Timestamp timestamp{0};

    /// Context for a call made directly by an account
    static CallContext Direct(const Address& account, BlockNumber block, Timestamp time) {
        CallContext ctx;
        ctx.caller = account;
        ctx.origin = account;
        ctx.blockNumber = block;
        ctx.timestamp = time;
        return ctx;
    }
};

} // namespace polymint

namespace std {
template<>
struct hash<polymint::Address> {
    size_t operator()(const polymint::Address& addr) const noexcept {
        size_t h = 0;
        for (size_t i = 0; i < polymint::Address::SIZE; ++i) {
            h = h * 131 + addr.data()[i];
        }
        return h;
    }
};
} // namespace std

#endif // POLYMINT_CORE_TYPES_H
