/**
 * @file FingerprintUtils.h
 * @brief Utilities for normalizing, comparing and formatting certificate fingerprints.
 */

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>

namespace SecureXfer {

class FingerprintUtils {
public:
    /**
     * @brief Normalize a SHA-256 fingerprint to canonical form.
     *
     * Canonical form:
     * - 64 hex characters
     * - uppercase
     * - no separators
     *
     * Accepts inputs that may contain ':' separators and whitespace.
     *
     * @return Normalized fingerprint, or empty string on invalid input.
     */
    static std::string normalizeSha256Hex(const std::string& input) {
        std::string out;
        out.reserve(64);

        for (unsigned char uc : input) {
            if (uc == ':' || std::isspace(uc)) {
                continue;
            }
            out.push_back(static_cast<char>(uc));
        }

        if (out.size() != 64) {
            return {};
        }

        for (char& c : out) {
            const unsigned char uc = static_cast<unsigned char>(c);
            if (!std::isxdigit(uc)) {
                return {};
            }
            c = static_cast<char>(std::toupper(uc));
        }

        return out;
    }

    /**
     * @brief Case-insensitive fingerprint comparison.
     *
     * Both sides are normalized first; an invalid fingerprint on either side
     * never matches, so an empty pin can not accidentally trust a peer.
     */
    static bool matches(const std::string& presented, const std::string& pinned) {
        const std::string a = normalizeSha256Hex(presented);
        const std::string b = normalizeSha256Hex(pinned);
        return !a.empty() && a == b;
    }

    /**
     * @brief Encode a raw digest as uppercase hex.
     */
    static std::string toUpperHex(const uint8_t* digest, size_t length) {
        static const char kHex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(length * 2);
        for (size_t i = 0; i < length; ++i) {
            out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
            out.push_back(kHex[digest[i] & 0x0F]);
        }
        return out;
    }

    /**
     * @brief Format a canonical fingerprint for display (adds ':' separators).
     *
     * @return Colon-separated fingerprint, or empty string on invalid input.
     */
    static std::string formatForDisplay(const std::string& fingerprint) {
        const std::string norm = normalizeSha256Hex(fingerprint);
        if (norm.empty()) {
            return {};
        }

        std::string out;
        out.reserve(64 + 31);
        for (size_t i = 0; i < norm.size(); i += 2) {
            out.push_back(norm[i]);
            out.push_back(norm[i + 1]);
            if (i + 2 < norm.size()) {
                out.push_back(':');
            }
        }
        return out;
    }

    /**
     * @brief Short form for logs: first 16 hex characters.
     */
    static std::string shortForm(const std::string& fingerprint) {
        const std::string norm = normalizeSha256Hex(fingerprint);
        return norm.empty() ? std::string("<invalid>") : norm.substr(0, 16);
    }
};

}  // namespace SecureXfer
