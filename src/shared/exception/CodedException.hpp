/**
 * @file CodedException.hpp
 * @brief Common base of the layered exceptions
 */

#pragma once

#include <stdexcept>
#include <string>

namespace epassport::shared::exception {

/**
 * @brief runtime_error carrying a stable machine-readable code
 *
 * Codes are upper snake case ("INVALID_SOD_FORMAT") and end up verbatim in
 * verification errors and CLI output.
 */
class CodedException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

protected:
    CodedException(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)), message_(message) {}

public:
    [[nodiscard]] const std::string& getCode() const noexcept { return code_; }
    [[nodiscard]] const std::string& getMessage() const noexcept { return message_; }
};

} // namespace epassport::shared::exception
