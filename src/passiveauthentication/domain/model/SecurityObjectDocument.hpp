#pragma once

#include "shared/exception/DomainException.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <string>
#include <vector>

namespace epassport::pa::domain::model {

/**
 * EF.SOD as read from the chip.
 *
 * Accepted encodings: the ICAO application tag 0x77 around a CMS
 * SignedData, or the bare SignedData SEQUENCE (0x30). Only the outer tag
 * is checked here; the CMS structure is the SOD parser's concern.
 *
 * The hash and signature algorithm names are filled in once the SOD has
 * been parsed.
 */
class SecurityObjectDocument {
public:
    static constexpr uint8_t kIcaoSodTag = 0x77;
    static constexpr uint8_t kSequenceTag = 0x30;

private:
    std::vector<uint8_t> encodedData_;
    std::string hashAlgorithm_;
    std::string signatureAlgorithm_;

    explicit SecurityObjectDocument(std::vector<uint8_t> encodedData)
        : encodedData_(std::move(encodedData)) {}

    static void assignOnce(std::string& slot, const std::string& value, const char* what) {
        if (value.empty()) {
            throw shared::exception::DomainException(
                fmt::format("INVALID_{}_ALGORITHM", what), fmt::format("{} algorithm cannot be empty", what));
        }
        if (!slot.empty()) {
            throw shared::exception::DomainException(
                "ALGORITHM_ALREADY_SET", fmt::format("{} algorithm already set to {}", what, slot));
        }
        slot = value;
    }

public:
    /**
     * @throws DomainException INVALID_SOD for empty input, INVALID_SOD_FORMAT
     *         for an unexpected outer tag
     */
    static SecurityObjectDocument of(const std::vector<uint8_t>& sodBytes) {
        if (sodBytes.empty()) {
            throw shared::exception::DomainException("INVALID_SOD", "SOD data cannot be empty");
        }
        uint8_t tag = sodBytes.front();
        if (tag != kIcaoSodTag && tag != kSequenceTag) {
            throw shared::exception::DomainException(
                "INVALID_SOD_FORMAT",
                fmt::format("SOD must start with tag 0x77 or 0x30, got 0x{:02X}", tag));
        }
        return SecurityObjectDocument(sodBytes);
    }

    const std::vector<uint8_t>& getEncodedData() const { return encodedData_; }
    const std::string& getHashAlgorithm() const { return hashAlgorithm_; }
    const std::string& getSignatureAlgorithm() const { return signatureAlgorithm_; }

    bool hasHashAlgorithm() const { return !hashAlgorithm_.empty(); }
    bool hasSignatureAlgorithm() const { return !signatureAlgorithm_.empty(); }
    bool isIcaoWrapped() const { return encodedData_.front() == kIcaoSodTag; }

    /// @throws DomainException INVALID_HASH_ALGORITHM, ALGORITHM_ALREADY_SET
    void setHashAlgorithm(const std::string& algorithm) {
        assignOnce(hashAlgorithm_, algorithm, "HASH");
    }

    /// @throws DomainException INVALID_SIGNATURE_ALGORITHM, ALGORITHM_ALREADY_SET
    void setSignatureAlgorithm(const std::string& algorithm) {
        assignOnce(signatureAlgorithm_, algorithm, "SIGNATURE");
    }

    size_t calculateSize() const { return encodedData_.size(); }

    bool operator==(const SecurityObjectDocument& other) const {
        return encodedData_ == other.encodedData_;
    }
};

} // namespace epassport::pa::domain::model
