// ZPROOF - Amount Parsing
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/service/amount.h>

#include <limits>

namespace zproof {
namespace service {

std::optional<uint64_t> ParseAmountString(const std::string& text) {
    size_t pos = 0;
    if (!text.empty() && text[0] == '+') {
        pos = 1;
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }
    
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (kMax - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::optional<uint64_t> ParseAmount(const http::JSONValue& value) {
    if (value.IsString()) {
        return ParseAmountString(value.GetString());
    }
    if (value.IsUInt()) {
        return value.GetUInt();
    }
    if (value.IsInt()) {
        if (value.GetInt() < 0) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value.GetInt());
    }
    // Doubles are fractions, exponents or integers beyond 64 bits
    return std::nullopt;
}

} // namespace service
} // namespace zproof
