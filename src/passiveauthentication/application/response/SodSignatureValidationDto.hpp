#pragma once

#include <optional>
#include <string>

namespace epassport::pa::application::response {

/// Algorithms are absent when the SOD was never parsed far enough to read them.
struct SodSignatureValidationDto {
    bool valid = false;
    std::optional<std::string> signatureAlgorithm;
    std::optional<std::string> hashAlgorithm;
};

} // namespace epassport::pa::application::response
