#pragma once

/**
 * @file PassiveAuthenticationConfig.hpp
 * @brief Verification settings gathered from ConfigManager at startup
 */

#include "certificatevalidation/domain/model/ValidationClock.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace epassport::pa::infrastructure::config {

struct PassiveAuthenticationConfig {
    std::string logLevel = "info";
    std::string logFile;

    std::chrono::milliseconds directoryTimeout{5000};
    int directoryMaxAttempts = 3;
    std::chrono::milliseconds directoryInitialBackoff{200};

    bool crlCacheEnabled = true;
    std::chrono::seconds crlCacheTtl{86400};

    bool parallelDataGroupHashing = true;

    /// Empty means "now"
    std::optional<std::chrono::system_clock::time_point> checkTime;

    std::string ldapUri = "ldap://localhost:389";
    std::string ldapBindDn;
    std::string ldapBindPassword;
    std::string ldapBaseDn = "dc=pkd,dc=download";
    int ldapPoolSize = 4;

    std::string dbConnInfo;

    /**
     * @brief Read every EPASSPORT_* key through ConfigManager
     *
     * @throws DomainException INVALID_CONFIGURATION if EPASSPORT_CHECK_TIME
     *         is neither "now" nor an ISO-8601 UTC time
     */
    static PassiveAuthenticationConfig fromConfigManager();

    /**
     * @throws DomainException INVALID_CONFIGURATION on a non-positive
     *         timeout, attempt count, backoff, TTL or pool size
     */
    void validate() const;

    certificatevalidation::domain::model::ValidationClock validationClock() const;

    bool hasDatabase() const { return !dbConnInfo.empty(); }
};

} // namespace epassport::pa::infrastructure::config
