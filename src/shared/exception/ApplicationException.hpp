/**
 * @file ApplicationException.hpp
 * @brief Application layer exception class
 */

#pragma once

#include "shared/exception/CodedException.hpp"

namespace epassport::shared::exception {

/**
 * @brief A use case or pipeline step cannot proceed (no DSC in the SOD,
 *        caller cancellation, bad paging arguments)
 */
class ApplicationException : public CodedException {
public:
    ApplicationException(std::string code, const std::string& message)
        : CodedException(std::move(code), message) {}
};

} // namespace epassport::shared::exception
