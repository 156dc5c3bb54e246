#pragma once

#include "DataGroupNumber.hpp"
#include "DataGroupHash.hpp"
#include "shared/exception/DomainException.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace epassport::pa::domain::model {

/**
 * One LDS data group file (DG1..DG16) and the outcome of checking it
 * against the SOD.
 *
 * A group is decided exactly once: its hash matched, it did not, or the
 * SOD lists no hash for it. Hashes cannot change after that.
 */
class DataGroup {
private:
    enum class Verdict { PENDING, MATCH, MISMATCH, NOT_IN_SOD };

    DataGroupNumber number_;
    std::vector<uint8_t> content_;
    std::optional<DataGroupHash> expectedHash_;
    std::optional<DataGroupHash> actualHash_;
    Verdict verdict_ = Verdict::PENDING;

    DataGroup(DataGroupNumber number, std::vector<uint8_t> content)
        : number_(number), content_(std::move(content)) {
        if (content_.empty()) {
            throw shared::exception::DomainException(
                "INVALID_DG_CONTENT", toString(number_) + " content cannot be empty");
        }
    }

    void ensurePending() const {
        if (verdict_ != Verdict::PENDING) {
            throw shared::exception::DomainException(
                "DATA_GROUP_ALREADY_VERIFIED", toString(number_) + " has already been verified");
        }
    }

public:
    /// @throws DomainException INVALID_DG_CONTENT for empty content
    static DataGroup of(DataGroupNumber number, const std::vector<uint8_t>& content) {
        return DataGroup(number, content);
    }

    static DataGroup withExpectedHash(DataGroupNumber number,
                                      const std::vector<uint8_t>& content,
                                      const DataGroupHash& expectedHash) {
        DataGroup dg(number, content);
        dg.expectedHash_ = expectedHash;
        return dg;
    }

    DataGroupNumber getNumber() const { return number_; }
    const std::vector<uint8_t>& getContent() const { return content_; }
    const std::optional<DataGroupHash>& getExpectedHash() const { return expectedHash_; }
    const std::optional<DataGroupHash>& getActualHash() const { return actualHash_; }

    void setExpectedHash(const DataGroupHash& hash) {
        ensurePending();
        expectedHash_ = hash;
    }

    void setActualHash(const DataGroupHash& hash) {
        ensurePending();
        actualHash_ = hash;
    }

    void calculateActualHash(const std::string& algorithm) {
        setActualHash(DataGroupHash::calculate(content_, algorithm));
    }

    /**
     * @return true if the computed hash equals the SOD hash
     * @throws DomainException HASH_NOT_READY if either hash is missing,
     *         DATA_GROUP_ALREADY_VERIFIED on a second call
     */
    bool verifyHash() {
        ensurePending();
        if (!expectedHash_ || !actualHash_) {
            throw shared::exception::DomainException(
                "HASH_NOT_READY", toString(number_) + " needs both expected and actual hash");
        }
        verdict_ = (*expectedHash_ == *actualHash_) ? Verdict::MATCH : Verdict::MISMATCH;
        return verdict_ == Verdict::MATCH;
    }

    /// Invalid, but not a mismatch: there was nothing to compare against.
    void markExpectedHashMissing() {
        ensurePending();
        verdict_ = Verdict::NOT_IN_SOD;
    }

    bool isVerified() const { return verdict_ != Verdict::PENDING; }
    bool isValid() const { return verdict_ == Verdict::MATCH; }
    bool isHashMismatchDetected() const { return verdict_ == Verdict::MISMATCH; }
};

} // namespace epassport::pa::domain::model
