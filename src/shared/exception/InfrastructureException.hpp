/**
 * @file InfrastructureException.hpp
 * @brief Infrastructure layer exception class
 */

#pragma once

#include "shared/exception/CodedException.hpp"

namespace epassport::shared::exception {

/**
 * @brief Directory, database, file or OpenSSL failure
 *
 * Transient failures (connection refused, server busy, timeout) may be
 * retried; everything else is final.
 */
class InfrastructureException : public CodedException {
private:
    bool transient_;

public:
    InfrastructureException(std::string code, const std::string& message, bool transient = false)
        : CodedException(std::move(code), message), transient_(transient) {}

    [[nodiscard]] bool isTransient() const noexcept { return transient_; }
};

} // namespace epassport::shared::exception
