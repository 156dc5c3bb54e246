#include "passiveauthentication/infrastructure/repository/InMemoryVerificationSessionRepository.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace epassport::pa::infrastructure::repository {

using domain::model::VerificationRecord;
using domain::model::VerificationSessionId;
using domain::model::PassiveAuthenticationStatus;

void InMemoryVerificationSessionRepository::save(const domain::model::VerificationSession& session) {
    VerificationRecord record = VerificationRecord::from(session);
    const std::string key = record.sessionId.getValue();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexById_.find(key);
    if (it != indexById_.end()) {
        records_[it->second] = std::move(record);
        spdlog::debug("[InMemoryRepository] Replaced session {}", key);
        return;
    }
    indexById_.emplace(key, records_.size());
    records_.push_back(std::move(record));
    spdlog::debug("[InMemoryRepository] Saved session {} (total={})", key, records_.size());
}

std::optional<VerificationRecord> InMemoryVerificationSessionRepository::findById(const VerificationSessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexById_.find(id.getValue());
    if (it == indexById_.end()) {
        return std::nullopt;
    }
    return records_[it->second];
}

std::vector<VerificationRecord> InMemoryVerificationSessionRepository::page(
    const std::vector<const VerificationRecord*>& newestFirst,
    int offset,
    int limit)
{
    std::vector<VerificationRecord> result;
    if (offset < 0 || limit <= 0) {
        return result;
    }
    for (size_t i = static_cast<size_t>(offset); i < newestFirst.size() && result.size() < static_cast<size_t>(limit); ++i) {
        result.push_back(*newestFirst[i]);
    }
    return result;
}

std::vector<VerificationRecord> InMemoryVerificationSessionRepository::findAll(int offset, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const VerificationRecord*> newestFirst;
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        newestFirst.push_back(&*it);
    }
    return page(newestFirst, offset, limit);
}

std::vector<VerificationRecord> InMemoryVerificationSessionRepository::findByStatus(
    PassiveAuthenticationStatus status,
    int offset,
    int limit)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const VerificationRecord*> newestFirst;
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->status == status) {
            newestFirst.push_back(&*it);
        }
    }
    return page(newestFirst, offset, limit);
}

long InMemoryVerificationSessionRepository::countAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<long>(records_.size());
}

long InMemoryVerificationSessionRepository::countByStatus(PassiveAuthenticationStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<long>(std::count_if(records_.begin(), records_.end(),
        [status](const VerificationRecord& r) { return r.status == status; }));
}

std::vector<domain::model::AuditLogEntry> InMemoryVerificationSessionRepository::findAuditLog(
    const VerificationSessionId& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexById_.find(id.getValue());
    if (it == indexById_.end()) {
        return {};
    }
    return records_[it->second].auditLog;
}

} // namespace epassport::pa::infrastructure::repository
