#pragma once

#include "shared/domain/ValueObject.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/UuidUtil.hpp"
#include <string>

namespace epassport::pa::domain::model {

/**
 * Verification session identifier (UUID).
 */
class VerificationSessionId : public shared::domain::ValueObject<std::string> {
private:
    explicit VerificationSessionId(std::string value)
        : ValueObject<std::string>(std::move(value)) {}

public:
    static VerificationSessionId newId() {
        return VerificationSessionId(shared::util::UuidUtil::generate());
    }

    /**
     * @throws DomainException INVALID_SESSION_ID if value is not a UUID
     */
    static VerificationSessionId of(const std::string& value) {
        if (!shared::util::UuidUtil::isValid(value)) {
            throw shared::exception::DomainException(
                "INVALID_SESSION_ID",
                "Verification session id must be a UUID: " + value
            );
        }
        return VerificationSessionId(value);
    }

    const std::string& toString() const { return value_; }
};

} // namespace epassport::pa::domain::model
