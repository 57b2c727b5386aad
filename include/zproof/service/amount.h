// ZPROOF - Amount Parsing
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#ifndef ZPROOF_SERVICE_AMOUNT_H
#define ZPROOF_SERVICE_AMOUNT_H

#include <zproof/http/json.h>

#include <cstdint>
#include <optional>
#include <string>

namespace zproof {
namespace service {

/**
 * Parse a zatoshi amount given as a decimal string.
 * Digits only with an optional leading '+'; no whitespace, sign '-',
 * fraction or exponent. Values above 2^64-1 are rejected.
 */
std::optional<uint64_t> ParseAmountString(const std::string& text);

/// Accepts a non-negative JSON integer or a string per ParseAmountString()
std::optional<uint64_t> ParseAmount(const http::JSONValue& value);

} // namespace service
} // namespace zproof

#endif // ZPROOF_SERVICE_AMOUNT_H
