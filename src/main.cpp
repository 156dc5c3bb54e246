/**
 * @file main.cpp
 * @brief epassport-pa command line entry point
 *
 * Verifies an ePassport SOD and its data groups (ICAO 9303 Part 11
 * Passive Authentication) against local trust anchors or an LDAP
 * directory, and lists stored verifications.
 */

#include "common/config/config_manager.h"
#include "common/database/db_connection_pool.h"
#include "common/logging/logger.h"
#include "passiveauthentication/application/command/PerformPassiveAuthenticationCommand.hpp"
#include "passiveauthentication/application/usecase/PerformPassiveAuthenticationUseCase.hpp"
#include "passiveauthentication/application/usecase/GetPassiveAuthenticationHistoryUseCase.hpp"
#include "passiveauthentication/domain/service/PassiveAuthenticationService.hpp"
#include "passiveauthentication/infrastructure/adapter/CrlCache.hpp"
#include "passiveauthentication/infrastructure/adapter/LocalTrustStoreAdapter.hpp"
#include "passiveauthentication/infrastructure/adapter/OpenSslSodParserAdapter.hpp"
#include "passiveauthentication/infrastructure/adapter/RetryingDirectoryAdapter.hpp"
#include "passiveauthentication/infrastructure/config/PassiveAuthenticationConfig.hpp"
#include "passiveauthentication/infrastructure/repository/InMemoryVerificationSessionRepository.hpp"
#include "passiveauthentication/infrastructure/repository/PostgresVerificationSessionRepository.hpp"
#include "shared/exception/ApplicationException.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/exception/InfrastructureException.hpp"

#ifdef EPASSPORT_HAS_LDAP
#include "common/ldap/ldap_connection_pool.h"
#include "ldapintegration/infrastructure/adapter/OpenLdapDirectoryAdapter.hpp"
#endif

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace epassport;
using shared::exception::DomainException;
using shared::exception::ApplicationException;
using shared::exception::InfrastructureException;

constexpr int EXIT_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_ERROR = 2;
constexpr int EXIT_USAGE = 64;

struct CliOptions {
    std::string command;
    std::string sodFile;
    std::map<pa::domain::model::DataGroupNumber, std::string> dataGroupFiles;
    std::vector<std::string> cscaFiles;
    std::vector<std::string> crlFiles;
    bool useLdap = false;
    std::string checkTime;
    std::string configFile;
    bool json = false;
    std::string verificationId;
    std::string status;
    int offset = 0;
    int limit = 20;
};

void printUsage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " verify --sod FILE --dg N=FILE [--dg N=FILE ...]\n"
              << "         (--csca FILE [--csca FILE ...] [--crl FILE ...] | --ldap)\n"
              << "         [--check-time ISO8601] [--config FILE] [--json]\n"
              << "  " << program << " history [--id UUID] [--status VALID|INVALID|ERROR]\n"
              << "         [--offset N] [--limit N] [--config FILE]\n"
              << "\n"
              << "  --sod FILE         EF.SOD as read from the chip\n"
              << "  --dg N=FILE        Data group N (1-16) content\n"
              << "  --csca FILE        CSCA certificate(s), PEM or DER\n"
              << "  --crl FILE         CRL, PEM or DER\n"
              << "  --ldap             Resolve CSCA and CRL from the LDAP directory\n"
              << "  --check-time T     Validate at T instead of now (e.g. 2025-01-01T00:00:00Z)\n"
              << "  --config FILE      Flat JSON configuration file\n"
              << "  --json             Print the full JSON response\n"
              << "\n"
              << "Exit status: 0 VALID, 1 INVALID, 2 ERROR, 64 usage error\n";
}

/**
 * @throws DomainException USAGE on malformed arguments
 */
CliOptions parseArguments(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        throw DomainException("USAGE", "Missing command");
    }
    options.command = argv[1];

    auto requireValue = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            throw DomainException("USAGE", arg + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--sod") {
            options.sodFile = requireValue(i, arg);
        } else if (arg == "--dg") {
            std::string value = requireValue(i, arg);
            auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == value.size()) {
                throw DomainException("USAGE", "--dg expects N=FILE, got " + value);
            }
            int number = 0;
            try {
                number = std::stoi(value.substr(0, eq));
            } catch (const std::exception&) {
                throw DomainException("USAGE", "--dg number is not an integer: " + value);
            }
            auto dgn = pa::domain::model::dataGroupNumberFromInt(number);
            if (!options.dataGroupFiles.emplace(dgn, value.substr(eq + 1)).second) {
                throw DomainException("USAGE", "Data group given twice: DG" + std::to_string(number));
            }
        } else if (arg == "--csca") {
            options.cscaFiles.push_back(requireValue(i, arg));
        } else if (arg == "--crl") {
            options.crlFiles.push_back(requireValue(i, arg));
        } else if (arg == "--ldap") {
            options.useLdap = true;
        } else if (arg == "--check-time") {
            options.checkTime = requireValue(i, arg);
        } else if (arg == "--config") {
            options.configFile = requireValue(i, arg);
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--id") {
            options.verificationId = requireValue(i, arg);
        } else if (arg == "--status") {
            options.status = requireValue(i, arg);
        } else if (arg == "--offset") {
            options.offset = std::atoi(requireValue(i, arg).c_str());
        } else if (arg == "--limit") {
            options.limit = std::atoi(requireValue(i, arg).c_str());
        } else {
            throw DomainException("USAGE", "Unknown option: " + arg);
        }
    }

    if (options.command == "verify") {
        if (options.sodFile.empty()) {
            throw DomainException("USAGE", "--sod is required");
        }
        if (options.dataGroupFiles.empty()) {
            throw DomainException("USAGE", "At least one --dg is required");
        }
        if (options.useLdap == !options.cscaFiles.empty()) {
            throw DomainException("USAGE", "Give either --csca files or --ldap");
        }
        if (!options.crlFiles.empty() && options.useLdap) {
            throw DomainException("USAGE", "--crl cannot be combined with --ldap");
        }
    } else if (options.command != "history") {
        throw DomainException("USAGE", "Unknown command: " + options.command);
    }
    return options;
}

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw InfrastructureException("FILE_READ_ERROR", "Cannot open file: " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::shared_ptr<pa::domain::repository::VerificationSessionRepository> createRepository(
    const pa::infrastructure::config::PassiveAuthenticationConfig& config)
{
    if (!config.hasDatabase()) {
        spdlog::info("No database configured, verification results are kept in memory");
        return std::make_shared<pa::infrastructure::repository::InMemoryVerificationSessionRepository>();
    }

    common::DbPoolSettings settings;
    settings.connInfo = config.dbConnInfo;
    auto pool = std::make_shared<common::DbConnectionPool>(settings);
    pool->verifyConnectivity();
    auto repository = std::make_shared<pa::infrastructure::repository::PostgresVerificationSessionRepository>(pool);
    repository->initializeSchema();
    return repository;
}

std::shared_ptr<pa::domain::port::DirectoryPort> createDirectory(
    const CliOptions& options,
    const pa::infrastructure::config::PassiveAuthenticationConfig& config)
{
    std::shared_ptr<pa::domain::port::DirectoryPort> directory;

    if (options.useLdap) {
#ifdef EPASSPORT_HAS_LDAP
        common::LdapPoolSettings settings;
        settings.uri = config.ldapUri;
        settings.bindDn = config.ldapBindDn;
        settings.bindPassword = config.ldapBindPassword;
        settings.maxConnections = static_cast<size_t>(config.ldapPoolSize);
        settings.acquireTimeout = config.directoryTimeout;
        settings.networkTimeout = config.directoryTimeout;
        auto pool = std::make_shared<common::LdapConnectionPool>(settings);
        try {
            pool->verifyConnectivity();
        } catch (const InfrastructureException& e) {
            spdlog::warn("LDAP not reachable yet ({}), lookups will retry", e.getMessage());
        }
        directory = std::make_shared<epassport::ldap::infrastructure::adapter::OpenLdapDirectoryAdapter>(
            pool, config.ldapBaseDn, config.directoryTimeout);
#else
        throw DomainException("USAGE", "This build has no LDAP support; use --csca/--crl");
#endif
    } else {
        auto store = std::make_shared<pa::infrastructure::adapter::LocalTrustStoreAdapter>();
        for (const auto& file : options.cscaFiles) {
            store->loadCscaFile(file);
        }
        for (const auto& file : options.crlFiles) {
            store->loadCrlFile(file);
        }
        spdlog::info("Local trust store: {} CSCA, {} CRL", store->cscaCount(), store->crlCount());
        directory = store;
    }

    pa::infrastructure::adapter::RetryingDirectoryAdapter::Options retry;
    retry.timeout = config.directoryTimeout;
    retry.maxAttempts = config.directoryMaxAttempts;
    retry.initialBackoff = config.directoryInitialBackoff;
    directory = std::make_shared<pa::infrastructure::adapter::RetryingDirectoryAdapter>(directory, retry);

    if (config.crlCacheEnabled) {
        directory = std::make_shared<pa::infrastructure::adapter::CrlCache>(directory, config.crlCacheTtl);
    }
    return directory;
}

int exitCodeFor(pa::domain::model::PassiveAuthenticationStatus status) {
    switch (status) {
        case pa::domain::model::PassiveAuthenticationStatus::VALID: return EXIT_VALID;
        case pa::domain::model::PassiveAuthenticationStatus::INVALID: return EXIT_INVALID;
        default: return EXIT_ERROR;
    }
}

int runVerify(const CliOptions& options, const pa::infrastructure::config::PassiveAuthenticationConfig& config) {
    auto clock = config.validationClock();
    auto service = std::make_shared<pa::domain::service::PassiveAuthenticationService>(
        std::make_shared<pa::infrastructure::adapter::OpenSslSodParserAdapter>(),
        createDirectory(options, config),
        certificatevalidation::domain::service::TrustChainValidator(clock),
        pa::domain::service::CrlVerificationService(clock),
        config.parallelDataGroupHashing);

    pa::application::usecase::PerformPassiveAuthenticationUseCase useCase(service, createRepository(config));

    std::map<pa::domain::model::DataGroupNumber, std::vector<uint8_t>> dataGroups;
    for (const auto& [number, file] : options.dataGroupFiles) {
        dataGroups.emplace(number, readFile(file));
    }
    pa::application::command::PerformPassiveAuthenticationCommand command(readFile(options.sodFile), std::move(dataGroups));
    command.withRequestMetadata("", "epassport-pa", common::ConfigManager::getEnv("USER"));

    auto response = useCase.execute(command);

    if (options.json) {
        std::cout << response.toJsonString() << std::endl;
    } else {
        std::cout << pa::domain::model::toString(response.getStatus())
                  << " " << response.getVerificationId() << std::endl;
        for (const auto& error : response.getErrors()) {
            std::cout << "  [" << error.getSeverityString() << "] " << error.getCode()
                      << ": " << error.getMessage() << std::endl;
        }
    }
    return exitCodeFor(response.getStatus());
}

int runHistory(const CliOptions& options, const pa::infrastructure::config::PassiveAuthenticationConfig& config) {
    pa::application::usecase::GetPassiveAuthenticationHistoryUseCase useCase(createRepository(config));

    if (!options.verificationId.empty()) {
        auto response = useCase.findById(options.verificationId);
        if (!response.has_value()) {
            std::cerr << "Verification not found: " << options.verificationId << std::endl;
            return EXIT_ERROR;
        }
        std::cout << response->toJsonString() << std::endl;
        return EXIT_VALID;
    }

    auto page = options.status.empty()
        ? useCase.findAll(options.offset, options.limit)
        : useCase.findByStatus(pa::domain::model::statusFromString(options.status), options.offset, options.limit);

    std::cout << "Total: " << page.total << std::endl;
    for (const auto& item : page.items) {
        std::cout << item.getVerificationId() << "  "
                  << pa::domain::model::toString(item.getStatus()) << "  "
                  << item.getDataGroupValidation().validGroups << "/"
                  << item.getDataGroupValidation().totalGroups << " DG" << std::endl;
    }
    return EXIT_VALID;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parseArguments(argc, argv);
    } catch (const DomainException& e) {
        std::cerr << "Error: " << e.getMessage() << "\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    auto& configManager = common::ConfigManager::getInstance();
    try {
        if (!options.configFile.empty()) {
            configManager.loadFromFile(options.configFile);
        }
        if (!options.checkTime.empty()) {
            configManager.set("EPASSPORT_CHECK_TIME", options.checkTime);
        }
    } catch (const InfrastructureException& e) {
        std::cerr << "Error: " << e.getMessage() << std::endl;
        return EXIT_USAGE;
    }

    pa::infrastructure::config::PassiveAuthenticationConfig config;
    try {
        config = pa::infrastructure::config::PassiveAuthenticationConfig::fromConfigManager();
        config.validate();
    } catch (const DomainException& e) {
        std::cerr << "Error: " << e.getMessage() << std::endl;
        return EXIT_USAGE;
    }

    try {
        common::Logger::initialize("epassport-pa", config.logLevel, config.logFile);
        if (options.command == "verify") {
            return runVerify(options, config);
        }
        return runHistory(options, config);
    } catch (const DomainException& e) {
        spdlog::error("[{}] {}", e.getCode(), e.getMessage());
        std::cerr << "Error: " << e.getMessage() << std::endl;
        return e.getCode() == "USAGE" ? EXIT_USAGE : EXIT_ERROR;
    } catch (const ApplicationException& e) {
        spdlog::error("[{}] {}", e.getCode(), e.getMessage());
        std::cerr << "Error: " << e.getMessage() << std::endl;
        return EXIT_ERROR;
    } catch (const InfrastructureException& e) {
        spdlog::error("[{}] {}", e.getCode(), e.getMessage());
        std::cerr << "Error: " << e.getMessage() << std::endl;
        return EXIT_ERROR;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_ERROR;
    }
}
