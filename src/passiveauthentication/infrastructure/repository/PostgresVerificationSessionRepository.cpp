#include "passiveauthentication/infrastructure/repository/PostgresVerificationSessionRepository.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace epassport::pa::infrastructure::repository {

using shared::exception::InfrastructureException;
using domain::model::VerificationRecord;
using domain::model::VerificationSessionId;
using domain::model::PassiveAuthenticationStatus;
using domain::model::PassiveAuthenticationError;
using domain::model::PassiveAuthenticationResult;
using domain::model::CrlCheckResult;
using domain::model::AuditLogEntry;
using domain::model::DataGroupRecord;

namespace {

using TimePoint = std::chrono::system_clock::time_point;

const char* kSelectSession =
    "SELECT id, verification_status, hash_algorithm, signature_algorithm, sod_size, "
    "client_ip, user_agent, requested_by, "
    "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT, "
    "(EXTRACT(EPOCH FROM started_at) * 1000)::BIGINT, "
    "(EXTRACT(EPOCH FROM completed_at) * 1000)::BIGINT, "
    "processing_duration_ms, has_result, certificate_chain_valid, sod_signature_valid, "
    "crl_status, crl_message, revocation_reason, "
    "(EXTRACT(EPOCH FROM revocation_date) * 1000)::BIGINT, "
    "total_data_groups, valid_data_groups, errors, data_groups "
    "FROM pa_verification_session ";

std::string toEpochMillis(TimePoint tp) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count());
}

TimePoint fromEpochMillis(const std::string& text) {
    return TimePoint(std::chrono::milliseconds(std::stoll(text)));
}

std::optional<std::string> optionalTimestamp(const std::optional<TimePoint>& tp) {
    if (!tp.has_value()) {
        return std::nullopt;
    }
    return toEpochMillis(*tp);
}

std::string boolStr(bool value) {
    return value ? "true" : "false";
}

std::string toJsonText(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw InfrastructureException("DATABASE_ERROR", "Corrupt JSON column: " + errors);
    }
    return root;
}

bool isNull(PGresult* res, int row, int col) {
    return PQgetisnull(res, row, col) == 1;
}

std::string text(PGresult* res, int row, int col) {
    return isNull(res, row, col) ? std::string() : std::string(PQgetvalue(res, row, col));
}

std::optional<std::string> optionalText(PGresult* res, int row, int col) {
    if (isNull(res, row, col)) {
        return std::nullopt;
    }
    return std::string(PQgetvalue(res, row, col));
}

std::optional<TimePoint> optionalTime(PGresult* res, int row, int col) {
    if (isNull(res, row, col)) {
        return std::nullopt;
    }
    return fromEpochMillis(PQgetvalue(res, row, col));
}

bool pgBool(PGresult* res, int row, int col) {
    return text(res, row, col) == "t";
}

} // anonymous namespace

PostgresVerificationSessionRepository::PostgresVerificationSessionRepository(
    std::shared_ptr<common::DbConnectionPool> pool)
    : pool_(std::move(pool))
{
    if (!pool_) {
        throw std::invalid_argument("PostgresVerificationSessionRepository: pool cannot be null");
    }
    spdlog::debug("[PostgresVerificationSessionRepository] Initialized");
}

PostgresVerificationSessionRepository::PgResultPtr PostgresVerificationSessionRepository::execute(
    PGconn* conn,
    const std::string& sql,
    const Params& params)
{
    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& p : params) {
        paramValues.push_back(p.has_value() ? p->c_str() : nullptr);
    }

    PgResultPtr res(PQexecParams(
        conn,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        paramValues.empty() ? nullptr : paramValues.data(),
        nullptr,
        nullptr,
        0
    ));

    if (!res) {
        throw InfrastructureException("DATABASE_ERROR", "Query execution failed: null result");
    }

    ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        throw InfrastructureException("DATABASE_ERROR",
            std::string("Query failed: ") + PQerrorMessage(conn));
    }
    return res;
}

void PostgresVerificationSessionRepository::initializeSchema() {
    common::DbConnection conn = pool_->acquire();

    conn.execute(
        "CREATE TABLE IF NOT EXISTS pa_verification_session ("
        "  id UUID PRIMARY KEY,"
        "  verification_status VARCHAR(20) NOT NULL,"
        "  hash_algorithm VARCHAR(50),"
        "  signature_algorithm VARCHAR(100),"
        "  sod_size INTEGER NOT NULL,"
        "  client_ip VARCHAR(64),"
        "  user_agent TEXT,"
        "  requested_by VARCHAR(255),"
        "  created_at TIMESTAMPTZ NOT NULL,"
        "  started_at TIMESTAMPTZ,"
        "  completed_at TIMESTAMPTZ,"
        "  processing_duration_ms BIGINT,"
        "  has_result BOOLEAN NOT NULL DEFAULT FALSE,"
        "  certificate_chain_valid BOOLEAN,"
        "  sod_signature_valid BOOLEAN,"
        "  crl_status VARCHAR(20),"
        "  crl_message TEXT,"
        "  revocation_reason INTEGER,"
        "  revocation_date TIMESTAMPTZ,"
        "  total_data_groups INTEGER NOT NULL DEFAULT 0,"
        "  valid_data_groups INTEGER NOT NULL DEFAULT 0,"
        "  errors JSONB NOT NULL DEFAULT '[]',"
        "  data_groups JSONB NOT NULL DEFAULT '[]'"
        ")");

    conn.execute(
        "CREATE TABLE IF NOT EXISTS pa_verification_audit_log ("
        "  id UUID PRIMARY KEY,"
        "  session_id UUID NOT NULL REFERENCES pa_verification_session(id) ON DELETE CASCADE,"
        "  seq INTEGER NOT NULL,"
        "  step VARCHAR(30) NOT NULL,"
        "  step_status VARCHAR(20) NOT NULL,"
        "  log_level VARCHAR(10) NOT NULL,"
        "  message TEXT NOT NULL,"
        "  details TEXT,"
        "  execution_time_ms BIGINT,"
        "  logged_at TIMESTAMPTZ NOT NULL,"
        "  UNIQUE (session_id, seq)"
        ")");

    conn.execute(
        "CREATE INDEX IF NOT EXISTS idx_pa_session_status_created "
        "ON pa_verification_session (verification_status, created_at DESC)");

    spdlog::info("[PostgresVerificationSessionRepository] Schema ready");
}

void PostgresVerificationSessionRepository::save(const domain::model::VerificationSession& session) {
    VerificationRecord record = VerificationRecord::from(session);
    const std::string id = record.sessionId.getValue();
    spdlog::debug("[PostgresVerificationSessionRepository] Saving session {}", id);

    Json::Value errors = Json::arrayValue;
    Params resultParams(7);
    if (record.result.has_value()) {
        const auto& result = *record.result;
        for (const auto& e : result.getErrors()) {
            Json::Value error;
            error["code"] = e.getCode();
            error["message"] = e.getMessage();
            error["severity"] = e.getSeverityString();
            error["timestamp"] = static_cast<Json::Int64>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    e.getTimestamp().time_since_epoch()).count());
            errors.append(error);
        }
        const CrlCheckResult& crl = result.getCrlCheckResult();
        resultParams[0] = boolStr(result.isCertificateChainValid());
        resultParams[1] = boolStr(result.isSodSignatureValid());
        resultParams[2] = domain::model::toString(crl.getStatus());
        resultParams[3] = crl.getMessage();
        if (crl.getRevocationReason().has_value()) {
            resultParams[4] = std::to_string(*crl.getRevocationReason());
        }
        resultParams[5] = optionalTimestamp(crl.getRevocationDate());
        resultParams[6] = std::to_string(result.getTotalDataGroups());
    }

    Json::Value dataGroups = Json::arrayValue;
    for (const auto& dg : record.dataGroups) {
        Json::Value item;
        item["number"] = domain::model::toInt(dg.number);
        item["expectedHash"] = dg.expectedHash.has_value() ? Json::Value(*dg.expectedHash) : Json::Value();
        item["actualHash"] = dg.actualHash.has_value() ? Json::Value(*dg.actualHash) : Json::Value();
        item["valid"] = dg.valid;
        item["hashMismatchDetected"] = dg.hashMismatchDetected;
        item["contentSize"] = static_cast<Json::UInt64>(dg.contentSize);
        dataGroups.append(item);
    }

    const std::string upsert =
        "INSERT INTO pa_verification_session ("
        "id, verification_status, hash_algorithm, signature_algorithm, sod_size, "
        "client_ip, user_agent, requested_by, created_at, started_at, completed_at, "
        "processing_duration_ms, has_result, certificate_chain_valid, sod_signature_valid, "
        "crl_status, crl_message, revocation_reason, revocation_date, "
        "total_data_groups, valid_data_groups, errors, data_groups"
        ") VALUES ("
        "$1, $2, $3, $4, $5, $6, $7, $8, "
        "to_timestamp($9::DOUBLE PRECISION / 1000), "
        "to_timestamp($10::DOUBLE PRECISION / 1000), "
        "to_timestamp($11::DOUBLE PRECISION / 1000), "
        "$12, $13, $14, $15, $16, $17, $18, "
        "to_timestamp($19::DOUBLE PRECISION / 1000), "
        "$20, $21, $22::JSONB, $23::JSONB"
        ") ON CONFLICT (id) DO UPDATE SET "
        "verification_status = EXCLUDED.verification_status, "
        "hash_algorithm = EXCLUDED.hash_algorithm, "
        "signature_algorithm = EXCLUDED.signature_algorithm, "
        "started_at = EXCLUDED.started_at, "
        "completed_at = EXCLUDED.completed_at, "
        "processing_duration_ms = EXCLUDED.processing_duration_ms, "
        "has_result = EXCLUDED.has_result, "
        "certificate_chain_valid = EXCLUDED.certificate_chain_valid, "
        "sod_signature_valid = EXCLUDED.sod_signature_valid, "
        "crl_status = EXCLUDED.crl_status, "
        "crl_message = EXCLUDED.crl_message, "
        "revocation_reason = EXCLUDED.revocation_reason, "
        "revocation_date = EXCLUDED.revocation_date, "
        "total_data_groups = EXCLUDED.total_data_groups, "
        "valid_data_groups = EXCLUDED.valid_data_groups, "
        "errors = EXCLUDED.errors, "
        "data_groups = EXCLUDED.data_groups";

    Params params = {
        id,                                                        // $1
        domain::model::toString(record.status),                    // $2
        record.hashAlgorithm.empty() ? std::nullopt : std::optional<std::string>(record.hashAlgorithm),
        record.signatureAlgorithm.empty() ? std::nullopt : std::optional<std::string>(record.signatureAlgorithm),
        std::to_string(record.sodSize),                            // $5
        record.requestMetadata.getIpAddress(),                     // $6
        record.requestMetadata.getUserAgent(),                     // $7
        record.requestMetadata.getRequestedBy(),                   // $8
        toEpochMillis(record.createdAt),                           // $9
        optionalTimestamp(record.startedAt),                       // $10
        optionalTimestamp(record.completedAt),                     // $11
        record.processingDurationMs.has_value()
            ? std::optional<std::string>(std::to_string(*record.processingDurationMs))
            : std::nullopt,                                        // $12
        boolStr(record.result.has_value()),                        // $13
        resultParams[0], resultParams[1], resultParams[2],         // $14-$16
        resultParams[3], resultParams[4], resultParams[5],         // $17-$19
        resultParams[6].value_or(std::to_string(record.dataGroups.size())),  // $20
        std::to_string(record.getValidDataGroupCount()),           // $21
        toJsonText(errors),                                        // $22
        toJsonText(dataGroups)                                     // $23
    };

    common::DbConnection conn = pool_->acquire();
    conn.execute("BEGIN");
    try {
        execute(conn.get(), upsert, params);
        execute(conn.get(), "DELETE FROM pa_verification_audit_log WHERE session_id = $1", {id});

        const std::string insertAudit =
            "INSERT INTO pa_verification_audit_log ("
            "id, session_id, seq, step, step_status, log_level, message, details, "
            "execution_time_ms, logged_at"
            ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, to_timestamp($10::DOUBLE PRECISION / 1000))";

        int seq = 0;
        for (const auto& entry : record.auditLog) {
            execute(conn.get(), insertAudit, {
                entry.getId(),
                id,
                std::to_string(seq++),
                domain::model::toString(entry.getStep()),
                domain::model::toString(entry.getStepStatus()),
                domain::model::toString(entry.getLogLevel()),
                entry.getMessage(),
                entry.getDetails(),
                entry.getExecutionTimeMs().has_value()
                    ? std::optional<std::string>(std::to_string(*entry.getExecutionTimeMs()))
                    : std::nullopt,
                toEpochMillis(entry.getTimestamp())
            });
        }
        conn.execute("COMMIT");
    } catch (const InfrastructureException& e) {
        spdlog::error("[PostgresVerificationSessionRepository] Save of {} failed: {}", id, e.getMessage());
        PGresult* rollback = PQexec(conn.get(), "ROLLBACK");
        if (rollback) {
            PQclear(rollback);
        }
        throw;
    }

    spdlog::info("[PostgresVerificationSessionRepository] Saved session {} ({} audit entries)",
                 id, record.auditLog.size());
}

VerificationRecord PostgresVerificationSessionRepository::recordFromRow(PGresult* res, int row) {
    VerificationRecord record;
    record.sessionId = VerificationSessionId::of(text(res, row, 0));
    record.status = domain::model::statusFromString(text(res, row, 1));
    record.hashAlgorithm = text(res, row, 2);
    record.signatureAlgorithm = text(res, row, 3);
    record.sodSize = static_cast<size_t>(std::stoul(text(res, row, 4)));
    record.requestMetadata = domain::model::RequestMetadata::of(
        text(res, row, 5), text(res, row, 6), text(res, row, 7));
    record.createdAt = fromEpochMillis(text(res, row, 8));
    record.startedAt = optionalTime(res, row, 9);
    record.completedAt = optionalTime(res, row, 10);
    if (!isNull(res, row, 11)) {
        record.processingDurationMs = std::stoll(text(res, row, 11));
    }

    Json::Value dataGroups = parseJson(text(res, row, 22));
    for (const auto& item : dataGroups) {
        DataGroupRecord dg;
        dg.number = domain::model::dataGroupNumberFromInt(item["number"].asInt());
        if (item["expectedHash"].isString()) {
            dg.expectedHash = item["expectedHash"].asString();
        }
        if (item["actualHash"].isString()) {
            dg.actualHash = item["actualHash"].asString();
        }
        dg.valid = item["valid"].asBool();
        dg.hashMismatchDetected = item["hashMismatchDetected"].asBool();
        dg.contentSize = static_cast<size_t>(item["contentSize"].asUInt64());
        record.dataGroups.push_back(dg);
    }

    if (pgBool(res, row, 12)) {
        std::optional<int> reason;
        if (!isNull(res, row, 17)) {
            reason = std::stoi(text(res, row, 17));
        }
        CrlCheckResult crl = CrlCheckResult::restore(
            domain::model::crlCheckStatusFromString(text(res, row, 15)),
            optionalTime(res, row, 18),
            reason,
            optionalText(res, row, 16));

        std::vector<PassiveAuthenticationError> errors;
        Json::Value errorsJson = parseJson(text(res, row, 21));
        for (const auto& item : errorsJson) {
            errors.push_back(PassiveAuthenticationError::restore(
                item["code"].asString(),
                item["message"].asString(),
                PassiveAuthenticationError::severityFromString(item["severity"].asString()),
                TimePoint(std::chrono::milliseconds(item["timestamp"].asInt64()))));
        }

        record.result = PassiveAuthenticationResult::restore(
            record.status,
            pgBool(res, row, 13),
            crl,
            pgBool(res, row, 14),
            std::stoi(text(res, row, 19)),
            std::stoi(text(res, row, 20)),
            errors);
    }
    return record;
}

std::vector<AuditLogEntry> PostgresVerificationSessionRepository::loadAuditLog(
    PGconn* conn,
    const std::string& sessionId)
{
    PgResultPtr res = execute(conn,
        "SELECT id, step, step_status, (EXTRACT(EPOCH FROM logged_at) * 1000)::BIGINT, "
        "log_level, message, details, execution_time_ms "
        "FROM pa_verification_audit_log WHERE session_id = $1 ORDER BY seq",
        {sessionId});

    VerificationSessionId id = VerificationSessionId::of(sessionId);
    std::vector<AuditLogEntry> entries;
    int rows = PQntuples(res.get());
    entries.reserve(static_cast<size_t>(rows));
    for (int i = 0; i < rows; ++i) {
        std::optional<int64_t> executionTime;
        if (!isNull(res.get(), i, 7)) {
            executionTime = std::stoll(text(res.get(), i, 7));
        }
        entries.push_back(AuditLogEntry::restore(
            text(res.get(), i, 0),
            id,
            domain::model::verificationStepFromString(text(res.get(), i, 1)),
            domain::model::stepStatusFromString(text(res.get(), i, 2)),
            fromEpochMillis(text(res.get(), i, 3)),
            domain::model::logLevelFromString(text(res.get(), i, 4)),
            text(res.get(), i, 5),
            optionalText(res.get(), i, 6),
            executionTime));
    }
    return entries;
}

std::vector<VerificationRecord> PostgresVerificationSessionRepository::query(
    const std::string& sql,
    const Params& params)
{
    common::DbConnection conn = pool_->acquire();
    PgResultPtr res = execute(conn.get(), sql, params);

    std::vector<VerificationRecord> records;
    int rows = PQntuples(res.get());
    for (int i = 0; i < rows; ++i) {
        VerificationRecord record = recordFromRow(res.get(), i);
        record.auditLog = loadAuditLog(conn.get(), record.sessionId.getValue());
        records.push_back(std::move(record));
    }
    return records;
}

std::optional<VerificationRecord> PostgresVerificationSessionRepository::findById(const VerificationSessionId& id) {
    spdlog::debug("[PostgresVerificationSessionRepository] Finding session {}", id.getValue());
    auto records = query(std::string(kSelectSession) + "WHERE id = $1", {id.getValue()});
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

std::vector<VerificationRecord> PostgresVerificationSessionRepository::findAll(int offset, int limit) {
    return query(std::string(kSelectSession) + "ORDER BY created_at DESC OFFSET $1 LIMIT $2",
                 {std::to_string(offset), std::to_string(limit)});
}

std::vector<VerificationRecord> PostgresVerificationSessionRepository::findByStatus(
    PassiveAuthenticationStatus status,
    int offset,
    int limit)
{
    return query(std::string(kSelectSession) +
                     "WHERE verification_status = $1 ORDER BY created_at DESC OFFSET $2 LIMIT $3",
                 {domain::model::toString(status), std::to_string(offset), std::to_string(limit)});
}

long PostgresVerificationSessionRepository::countQuery(PGconn* conn, const std::string& sql, const Params& params) {
    PgResultPtr res = execute(conn, sql, params);
    if (PQntuples(res.get()) != 1) {
        throw InfrastructureException("DATABASE_ERROR", "Count query returned no row");
    }
    return std::stol(text(res.get(), 0, 0));
}

long PostgresVerificationSessionRepository::countAll() {
    common::DbConnection conn = pool_->acquire();
    return countQuery(conn.get(), "SELECT COUNT(*) FROM pa_verification_session", {});
}

long PostgresVerificationSessionRepository::countByStatus(PassiveAuthenticationStatus status) {
    common::DbConnection conn = pool_->acquire();
    return countQuery(conn.get(),
        "SELECT COUNT(*) FROM pa_verification_session WHERE verification_status = $1",
        {domain::model::toString(status)});
}

std::vector<AuditLogEntry> PostgresVerificationSessionRepository::findAuditLog(const VerificationSessionId& id) {
    common::DbConnection conn = pool_->acquire();
    return loadAuditLog(conn.get(), id.getValue());
}

} // namespace epassport::pa::infrastructure::repository
