// POLYMINT - Fixed-Point Arithmetic Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/core/fixedpoint.h"

#include <cctype>
#include <limits>

namespace polymint {
namespace fixedpoint {

namespace {
    constexpr size_t DECIMALS = 18;

    bool AllDigits(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }

    // A leading zero would make the string parse as octal
    Amount DecimalToAmount(const std::string& digits) {
        size_t first = digits.find_first_not_of('0');
        if (first == std::string::npos) {
            return Amount(0);
        }
        return Amount(digits.substr(first).c_str());
    }
}

bool CanAdd(const Amount& a, const Amount& b) {
    return b <= std::numeric_limits<Amount>::max() - a;
}

std::string FormatAmount(const Amount& value) {
    Amount whole = value / WAD;
    Amount frac = value % WAD;

    std::string result = whole.str();
    if (frac == 0) {
        return result;
    }

    std::string fracStr = frac.str();
    fracStr.insert(0, DECIMALS - fracStr.size(), '0');
    while (!fracStr.empty() && fracStr.back() == '0') {
        fracStr.pop_back();
    }
    return result + "." + fracStr;
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    try {
        // Raw base units
        if (str.size() > 3 && str.compare(str.size() - 3, 3, "wei") == 0) {
            std::string digits = str.substr(0, str.size() - 3);
            if (!AllDigits(digits)) return std::nullopt;
            return DecimalToAmount(digits);
        }

        size_t dot = str.find('.');
        std::string wholePart = dot == std::string::npos ? str : str.substr(0, dot);
        std::string fracPart = dot == std::string::npos ? "" : str.substr(dot + 1);

        if (wholePart.empty()) wholePart = "0";
        if (!AllDigits(wholePart)) return std::nullopt;
        if (dot != std::string::npos && !AllDigits(fracPart)) return std::nullopt;
        if (fracPart.size() > DECIMALS) return std::nullopt;

        fracPart.append(DECIMALS - fracPart.size(), '0');
        return DecimalToAmount(wholePart) * WAD + DecimalToAmount(fracPart);
    } catch (const std::runtime_error&) {
        // Out of 256-bit range
        return std::nullopt;
    }
}

double ToDouble(const Amount& value) {
    return value.convert_to<double>() / 1e18;
}

} // namespace fixedpoint
} // namespace polymint
