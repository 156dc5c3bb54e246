#pragma once

#include "shared/exception/DomainException.hpp"
#include <string>

namespace epassport::pa::domain::model {

/// Final verdict of one verification. INVALID means a check failed;
/// ERROR means the checks could not be carried out.
enum class PassiveAuthenticationStatus { VALID, INVALID, ERROR };

inline std::string toString(PassiveAuthenticationStatus status) {
    switch (status) {
        case PassiveAuthenticationStatus::VALID:   return "VALID";
        case PassiveAuthenticationStatus::INVALID: return "INVALID";
        case PassiveAuthenticationStatus::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

/// @throws DomainException INVALID_STATUS
inline PassiveAuthenticationStatus statusFromString(const std::string& str) {
    for (auto status : {PassiveAuthenticationStatus::VALID, PassiveAuthenticationStatus::INVALID,
                        PassiveAuthenticationStatus::ERROR}) {
        if (toString(status) == str) return status;
    }
    throw shared::exception::DomainException("INVALID_STATUS", "Unknown verification status: " + str);
}

} // namespace epassport::pa::domain::model
