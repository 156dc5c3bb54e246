#pragma once

#include "passiveauthentication/domain/model/DataGroupNumber.hpp"
#include "passiveauthentication/domain/model/RequestMetadata.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace epassport::pa::application::command {

/**
 * Raw chip data for one Passive Authentication run: the EF.SOD bytes and
 * the data group files read from the chip, keyed by number.
 */
class PerformPassiveAuthenticationCommand {
public:
    using DataGroupMap = std::map<domain::model::DataGroupNumber, std::vector<uint8_t>>;

private:
    std::vector<uint8_t> sodBytes_;
    DataGroupMap dataGroups_;
    domain::model::RequestMetadata metadata_;

public:
    PerformPassiveAuthenticationCommand(std::vector<uint8_t> sodBytes, DataGroupMap dataGroups)
        : sodBytes_(std::move(sodBytes)), dataGroups_(std::move(dataGroups)) {}

    PerformPassiveAuthenticationCommand& withRequestMetadata(
        const std::string& ipAddress,
        const std::string& userAgent,
        const std::string& requestedBy)
    {
        metadata_ = domain::model::RequestMetadata::of(ipAddress, userAgent, requestedBy);
        return *this;
    }

    const std::vector<uint8_t>& getSodBytes() const { return sodBytes_; }
    const DataGroupMap& getDataGroups() const { return dataGroups_; }
    const domain::model::RequestMetadata& toRequestMetadata() const { return metadata_; }
};

} // namespace epassport::pa::application::command
