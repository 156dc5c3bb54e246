#pragma once

#include <optional>
#include <string>

namespace epassport::pa::domain::model {

/**
 * Who asked for a verification, kept with the session for the audit trail.
 * Blank strings are stored as absent.
 */
class RequestMetadata {
private:
    std::optional<std::string> ipAddress_;
    std::optional<std::string> userAgent_;
    std::optional<std::string> requestedBy_;

    static std::optional<std::string> present(const std::string& value) {
        if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
            return std::nullopt;
        }
        return value;
    }

public:
    RequestMetadata() = default;

    static RequestMetadata of(const std::string& ipAddress,
                              const std::string& userAgent,
                              const std::string& requestedBy) {
        RequestMetadata metadata;
        metadata.ipAddress_ = present(ipAddress);
        metadata.userAgent_ = present(userAgent);
        metadata.requestedBy_ = present(requestedBy);
        return metadata;
    }

    static RequestMetadata withIpAddress(const std::string& ipAddress) { return of(ipAddress, "", ""); }
    static RequestMetadata empty() { return RequestMetadata(); }

    const std::optional<std::string>& getIpAddress() const { return ipAddress_; }
    const std::optional<std::string>& getUserAgent() const { return userAgent_; }
    const std::optional<std::string>& getRequestedBy() const { return requestedBy_; }

    bool hasIpAddress() const { return ipAddress_.has_value(); }
    bool hasUserAgent() const { return userAgent_.has_value(); }
    bool hasRequestedBy() const { return requestedBy_.has_value(); }
};

} // namespace epassport::pa::domain::model
