/**
 * @file DomainException.hpp
 * @brief Domain layer exception class
 */

#pragma once

#include "shared/exception/CodedException.hpp"

namespace epassport::shared::exception {

/**
 * @brief Malformed input to a value object or aggregate, or an illegal
 *        state transition
 */
class DomainException : public CodedException {
public:
    DomainException(std::string code, const std::string& message)
        : CodedException(std::move(code), message) {}
};

} // namespace epassport::shared::exception
