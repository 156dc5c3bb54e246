#pragma once

#include "shared/exception/InfrastructureException.hpp"
#include <openssl/rand.h>
#include <array>
#include <cctype>
#include <cstdint>
#include <string>

namespace epassport::shared::util {

/**
 * UUID helpers for session and audit entry ids.
 */
class UuidUtil {
public:
    /**
     * Random (version 4) UUID from the OpenSSL CSPRNG, lower case.
     *
     * @throws InfrastructureException RANDOM_GENERATION_FAILED if the DRBG
     *         cannot be seeded
     */
    static std::string generate() {
        std::array<unsigned char, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw exception::InfrastructureException("RANDOM_GENERATION_FAILED", "RAND_bytes failed");
        }
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        static const char* hex = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(hex[bytes[i] >> 4]);
            out.push_back(hex[bytes[i] & 0x0F]);
        }
        return out;
    }

    /**
     * 8-4-4-4-12 hex groups, either case.
     */
    static bool isValid(const std::string& uuid) {
        if (uuid.size() != 36) {
            return false;
        }
        for (size_t i = 0; i < uuid.size(); ++i) {
            bool dashPosition = (i == 8 || i == 13 || i == 18 || i == 23);
            unsigned char c = static_cast<unsigned char>(uuid[i]);
            if (dashPosition ? c != '-' : !std::isxdigit(c)) {
                return false;
            }
        }
        return true;
    }
};

} // namespace epassport::shared::util
