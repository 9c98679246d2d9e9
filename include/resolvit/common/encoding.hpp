#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace resolvit::encoding {

    static constexpr const char *BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    static constexpr const char *BASE64_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    /// Base58 (Bitcoin alphabet) encoding
    inline std::string base58Encode(const std::vector<uint8_t> &input) {
        size_t leading_zeros = 0;
        while (leading_zeros < input.size() && input[leading_zeros] == 0) {
            leading_zeros++;
        }

        // Little-endian base58 digits
        std::vector<uint8_t> digits;
        for (size_t i = leading_zeros; i < input.size(); ++i) {
            int carry = input[i];
            for (auto &digit : digits) {
                carry += digit << 8;
                digit = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            while (carry > 0) {
                digits.push_back(static_cast<uint8_t>(carry % 58));
                carry /= 58;
            }
        }

        std::string result(leading_zeros, '1');
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            result += BASE58_ALPHABET[*it];
        }
        return result;
    }

    /// Base58 decoding, nullopt on a character outside the alphabet
    inline std::optional<std::vector<uint8_t>> base58Decode(const std::string &input) {
        size_t leading_ones = 0;
        while (leading_ones < input.size() && input[leading_ones] == '1') {
            leading_ones++;
        }

        std::vector<uint8_t> bytes; // little-endian base256
        for (size_t i = leading_ones; i < input.size(); ++i) {
            const char *pos = nullptr;
            for (const char *p = BASE58_ALPHABET; *p; ++p) {
                if (*p == input[i]) {
                    pos = p;
                    break;
                }
            }
            if (!pos) {
                return std::nullopt;
            }
            int carry = static_cast<int>(pos - BASE58_ALPHABET);
            for (auto &byte : bytes) {
                carry += byte * 58;
                byte = static_cast<uint8_t>(carry & 0xFF);
                carry >>= 8;
            }
            while (carry > 0) {
                bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
                carry >>= 8;
            }
        }

        std::vector<uint8_t> result(leading_ones, 0);
        result.insert(result.end(), bytes.rbegin(), bytes.rend());
        return result;
    }

    inline bool isBase58(const std::string &input) {
        for (char c : input) {
            bool found = false;
            for (const char *p = BASE58_ALPHABET; *p; ++p) {
                if (*p == c) {
                    found = true;
                    break;
                }
            }
            if (!found)
                return false;
        }
        return true;
    }

    inline std::string base64Encode(const std::vector<uint8_t> &data) {
        const std::string chars = BASE64_ALPHABET;
        std::string encoded;
        for (size_t i = 0; i < data.size(); i += 3) {
            uint32_t temp = 0;
            for (size_t j = 0; j < 3; ++j) {
                temp <<= 8;
                if (i + j < data.size())
                    temp |= data[i + j];
            }
            for (int k = 3; k >= 0; --k)
                encoded += chars[(temp >> (6 * k)) & 0x3F];
        }
        size_t pad = data.size() % 3;
        if (pad)
            for (size_t i = 0; i < 3 - pad; ++i)
                encoded[encoded.length() - 1 - i] = '=';
        return encoded;
    }

    /// Strict base64 decoding, nullopt on invalid characters or length
    inline std::optional<std::vector<uint8_t>> base64Decode(const std::string &encoded) {
        const std::string chars = BASE64_ALPHABET;
        std::string clean = encoded;
        while (!clean.empty() && clean.back() == '=')
            clean.pop_back();
        if (clean.size() % 4 == 1)
            return std::nullopt;

        std::vector<uint8_t> decoded;
        for (size_t i = 0; i < clean.size(); i += 4) {
            uint32_t temp = 0;
            int valid = 0;
            for (size_t j = 0; j < 4 && i + j < clean.size(); ++j) {
                size_t pos = chars.find(clean[i + j]);
                if (pos == std::string::npos)
                    return std::nullopt;
                temp |= static_cast<uint32_t>(pos) << (6 * (3 - j));
                valid++;
            }
            if (valid >= 2)
                decoded.push_back(static_cast<uint8_t>((temp >> 16) & 0xFF));
            if (valid >= 3)
                decoded.push_back(static_cast<uint8_t>((temp >> 8) & 0xFF));
            if (valid >= 4)
                decoded.push_back(static_cast<uint8_t>(temp & 0xFF));
        }
        return decoded;
    }

} // namespace resolvit::encoding
