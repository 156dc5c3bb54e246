#pragma once

#include "passiveauthentication/domain/model/DataGroupNumber.hpp"
#include <map>
#include <optional>
#include <string>

namespace epassport::pa::application::response {

struct DataGroupDetailDto {
    bool valid = false;
    bool hashMismatchDetected = false;
    std::optional<std::string> expectedHash;  // absent when the SOD lists no hash for the group
    std::optional<std::string> actualHash;
};

struct DataGroupValidationDto {
    int totalGroups = 0;
    int validGroups = 0;
    int invalidGroups = 0;
    std::map<domain::model::DataGroupNumber, DataGroupDetailDto> details;
};

} // namespace epassport::pa::application::response
