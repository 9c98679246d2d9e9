#pragma once

#include <cstdint>
#include <keylock/keylock.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace resolvit {

    /// SHA-256 via keylock
    inline std::vector<uint8_t> sha256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success) {
            throw std::runtime_error("SHA256 hashing failed");
        }
        return result.data;
    }

    inline std::vector<uint8_t> sha256(const std::string &text) {
        return sha256(std::vector<uint8_t>(text.begin(), text.end()));
    }

    inline std::string toHex(const std::vector<uint8_t> &bytes) { return keylock::keylock::to_hex(bytes); }

    inline std::vector<uint8_t> fromHex(const std::string &hex) { return keylock::keylock::from_hex(hex); }

    inline std::string sha256Hex(const std::string &text) { return toHex(sha256(text)); }

} // namespace resolvit
