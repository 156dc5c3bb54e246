#pragma once

#include "shared/exception/DomainException.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace epassport::pa::domain::model {

/**
 * Digest of a data group, held as lowercase hex.
 *
 * The digest length names the algorithm (32, 48 or 64 bytes for
 * SHA-256/384/512), so two hashes are equal only if both the algorithm
 * and the bytes agree.
 */
class DataGroupHash {
private:
    struct Digest {
        const char* name;
        size_t hexLength;
        const EVP_MD* (*md)();
    };

    static const std::array<Digest, 3>& digests() {
        static const std::array<Digest, 3> table{{
            {"SHA-256", 64, &EVP_sha256},
            {"SHA-384", 96, &EVP_sha384},
            {"SHA-512", 128, &EVP_sha512},
        }};
        return table;
    }

    static const Digest* findByName(const std::string& algorithm) {
        for (const auto& d : digests()) {
            if (algorithm == d.name) return &d;
        }
        return nullptr;
    }

    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::string hex_;

    explicit DataGroupHash(std::string hex) : hex_(std::move(hex)) {}

public:
    /**
     * @throws DomainException INVALID_HASH when empty, INVALID_HASH_FORMAT
     *         for a non-hex character or an unknown digest length
     */
    static DataGroupHash of(const std::string& hexValue) {
        if (hexValue.empty()) {
            throw shared::exception::DomainException("INVALID_HASH", "Hash value cannot be empty");
        }
        bool knownLength = false;
        for (const auto& d : digests()) {
            knownLength = knownLength || d.hexLength == hexValue.size();
        }
        if (!knownLength) {
            throw shared::exception::DomainException("INVALID_HASH_FORMAT",
                "Unexpected digest length: " + std::to_string(hexValue.size()) + " hex characters");
        }

        std::string normalized;
        normalized.reserve(hexValue.size());
        for (char c : hexValue) {
            int v = nibble(c);
            if (v < 0) {
                throw shared::exception::DomainException("INVALID_HASH_FORMAT", "Hash is not hex encoded");
            }
            normalized.push_back("0123456789abcdef"[v]);
        }
        return DataGroupHash(std::move(normalized));
    }

    static DataGroupHash of(const std::vector<uint8_t>& hashBytes) {
        if (hashBytes.empty()) {
            throw shared::exception::DomainException("INVALID_HASH", "Hash bytes cannot be empty");
        }
        static const char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(hashBytes.size() * 2);
        for (uint8_t b : hashBytes) {
            hex.push_back(digits[b >> 4]);
            hex.push_back(digits[b & 0x0f]);
        }
        return of(hex);
    }

    /**
     * @param algorithm "SHA-256", "SHA-384" or "SHA-512"
     * @throws DomainException UNSUPPORTED_ALGORITHM, INVALID_CONTENT, HASH_ERROR
     */
    static DataGroupHash calculate(const std::vector<uint8_t>& content, const std::string& algorithm) {
        const Digest* digest = findByName(algorithm);
        if (!digest) {
            throw shared::exception::DomainException("UNSUPPORTED_ALGORITHM",
                "Hash algorithm not supported: " + algorithm);
        }
        if (content.empty()) {
            throw shared::exception::DomainException("INVALID_CONTENT", "Content cannot be empty");
        }

        std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
        unsigned int outLen = 0;
        if (EVP_Digest(content.data(), content.size(), out.data(), &outLen, digest->md(), nullptr) != 1) {
            throw shared::exception::DomainException("HASH_ERROR", algorithm + " digest failed");
        }
        out.resize(outLen);
        return of(out);
    }

    static bool isSupportedAlgorithm(const std::string& algorithm) {
        return findByName(algorithm) != nullptr;
    }

    const std::string& getValue() const { return hex_; }

    std::string getAlgorithm() const {
        for (const auto& d : digests()) {
            if (d.hexLength == hex_.size()) return d.name;
        }
        return "UNKNOWN";
    }

    std::vector<uint8_t> getBytes() const {
        std::vector<uint8_t> bytes(hex_.size() / 2);
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>((nibble(hex_[2 * i]) << 4) | nibble(hex_[2 * i + 1]));
        }
        return bytes;
    }

    bool operator==(const DataGroupHash& other) const { return hex_ == other.hex_; }
    bool operator!=(const DataGroupHash& other) const { return hex_ != other.hex_; }
};

} // namespace epassport::pa::domain::model
