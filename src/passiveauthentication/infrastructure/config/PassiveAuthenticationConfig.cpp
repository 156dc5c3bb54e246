#include "passiveauthentication/infrastructure/config/PassiveAuthenticationConfig.hpp"
#include "common/config/config_manager.h"
#include "shared/exception/DomainException.hpp"
#include "shared/util/X509Util.hpp"
#include <spdlog/spdlog.h>

namespace epassport::pa::infrastructure::config {

using shared::exception::DomainException;
using certificatevalidation::domain::model::ValidationClock;

PassiveAuthenticationConfig PassiveAuthenticationConfig::fromConfigManager() {
    const auto& cm = common::ConfigManager::getInstance();
    PassiveAuthenticationConfig config;

    config.logLevel = cm.getString("EPASSPORT_LOG_LEVEL", config.logLevel);
    config.logFile = cm.getString("EPASSPORT_LOG_FILE", config.logFile);

    config.directoryTimeout = std::chrono::milliseconds(
        cm.getInt("EPASSPORT_DIRECTORY_TIMEOUT_MS", static_cast<int>(config.directoryTimeout.count())));
    config.directoryMaxAttempts = cm.getInt("EPASSPORT_DIRECTORY_MAX_ATTEMPTS", config.directoryMaxAttempts);
    config.directoryInitialBackoff = std::chrono::milliseconds(
        cm.getInt("EPASSPORT_DIRECTORY_BACKOFF_MS", static_cast<int>(config.directoryInitialBackoff.count())));

    config.crlCacheEnabled = cm.getBool("EPASSPORT_CRL_CACHE_ENABLED", config.crlCacheEnabled);
    config.crlCacheTtl = std::chrono::seconds(
        cm.getInt("EPASSPORT_CRL_CACHE_TTL_SEC", static_cast<int>(config.crlCacheTtl.count())));

    config.parallelDataGroupHashing = cm.getBool("EPASSPORT_PARALLEL_DG_HASHING", config.parallelDataGroupHashing);

    std::string checkTime = cm.getString("EPASSPORT_CHECK_TIME", "now");
    if (!checkTime.empty() && checkTime != "now") {
        config.checkTime = shared::util::X509Util::parseIso8601(checkTime);
        if (!config.checkTime.has_value()) {
            throw DomainException("INVALID_CONFIGURATION",
                "EPASSPORT_CHECK_TIME must be 'now' or an ISO-8601 UTC time: " + checkTime);
        }
    }

    config.ldapUri = cm.getString("EPASSPORT_LDAP_URI", config.ldapUri);
    config.ldapBindDn = cm.getString("EPASSPORT_LDAP_BIND_DN", config.ldapBindDn);
    config.ldapBindPassword = cm.getString("EPASSPORT_LDAP_BIND_PASSWORD", config.ldapBindPassword);
    config.ldapBaseDn = cm.getString("EPASSPORT_LDAP_BASE_DN", config.ldapBaseDn);
    config.ldapPoolSize = cm.getInt("EPASSPORT_LDAP_POOL_SIZE", config.ldapPoolSize);

    config.dbConnInfo = cm.getString("EPASSPORT_DB_CONNINFO", config.dbConnInfo);

    spdlog::debug("Configuration: directory timeout={}ms attempts={} backoff={}ms, "
                  "CRL cache={} ttl={}s, parallel hashing={}, check time={}",
                  config.directoryTimeout.count(), config.directoryMaxAttempts,
                  config.directoryInitialBackoff.count(), config.crlCacheEnabled,
                  config.crlCacheTtl.count(), config.parallelDataGroupHashing,
                  config.checkTime.has_value() ? checkTime : std::string("now"));
    return config;
}

void PassiveAuthenticationConfig::validate() const {
    if (directoryTimeout.count() <= 0) {
        throw DomainException("INVALID_CONFIGURATION", "Directory timeout must be positive");
    }
    if (directoryMaxAttempts <= 0) {
        throw DomainException("INVALID_CONFIGURATION", "Directory max attempts must be positive");
    }
    if (directoryInitialBackoff.count() < 0) {
        throw DomainException("INVALID_CONFIGURATION", "Directory backoff cannot be negative");
    }
    if (crlCacheEnabled && crlCacheTtl.count() <= 0) {
        throw DomainException("INVALID_CONFIGURATION", "CRL cache TTL must be positive");
    }
    if (ldapPoolSize <= 0) {
        throw DomainException("INVALID_CONFIGURATION", "LDAP pool size must be positive");
    }
}

ValidationClock PassiveAuthenticationConfig::validationClock() const {
    if (checkTime.has_value()) {
        return ValidationClock::at(*checkTime);
    }
    return ValidationClock::currentTime();
}

} // namespace epassport::pa::infrastructure::config
