#pragma once

#include <string_view>

namespace uidkit::codec {

// Crockford Base32 (ULID). Excludes I, L, O, U.
inline constexpr std::string_view kCrockfordBase32 = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Lower-case base36 (CUID2 body).
inline constexpr std::string_view kBase36Lower = "0123456789abcdefghijklmnopqrstuvwxyz";

// Lower-case letters (CUID2 leading character).
inline constexpr std::string_view kLowerLetters = "abcdefghijklmnopqrstuvwxyz";

// NanoID default: 64 URL-safe symbols (A-Z, a-z, 0-9, '-', '_') in the reference ordering.
inline constexpr std::string_view kNanoidUrlAlphabet =
    "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict";

// Bitcoin Base58: alphanumerics without 0, O, I, l.
inline constexpr std::string_view kBase58 =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

inline constexpr std::string_view kBase62 =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

// RFC 4648 URL-safe Base64 ("YouTube style" video IDs).
inline constexpr std::string_view kBase64Url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

}  // namespace uidkit::codec
