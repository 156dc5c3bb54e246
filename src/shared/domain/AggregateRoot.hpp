/**
 * @file AggregateRoot.hpp
 * @brief Base class for Aggregate Roots in DDD
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace epassport::shared::domain {

class DomainEvent {
private:
    std::string eventType_;
    std::chrono::system_clock::time_point occurredAt_;

protected:
    explicit DomainEvent(std::string eventType)
        : eventType_(std::move(eventType)),
          occurredAt_(std::chrono::system_clock::now()) {}

public:
    virtual ~DomainEvent() = default;

    [[nodiscard]] const std::string& getEventType() const noexcept { return eventType_; }
    [[nodiscard]] std::chrono::system_clock::time_point getOccurredAt() const noexcept { return occurredAt_; }
};

/**
 * @brief Identity plus the events raised since the last clearDomainEvents()
 *
 * Roots are identified by id, move-only, and stamped with their creation
 * time.
 *
 * @tparam IdType identifier value object
 */
template<typename IdType>
class AggregateRoot {
protected:
    IdType id_;
    std::chrono::system_clock::time_point createdAt_;

    explicit AggregateRoot(IdType id)
        : id_(std::move(id)), createdAt_(std::chrono::system_clock::now()) {}

    void registerEvent(std::shared_ptr<DomainEvent> event) {
        domainEvents_.push_back(std::move(event));
    }

private:
    std::vector<std::shared_ptr<DomainEvent>> domainEvents_;

public:
    virtual ~AggregateRoot() = default;

    AggregateRoot(const AggregateRoot&) = delete;
    AggregateRoot& operator=(const AggregateRoot&) = delete;
    AggregateRoot(AggregateRoot&&) noexcept = default;
    AggregateRoot& operator=(AggregateRoot&&) noexcept = default;

    [[nodiscard]] const IdType& getId() const noexcept { return id_; }
    [[nodiscard]] std::chrono::system_clock::time_point getCreatedAt() const noexcept { return createdAt_; }

    [[nodiscard]] const std::vector<std::shared_ptr<DomainEvent>>& getDomainEvents() const noexcept {
        return domainEvents_;
    }

    void clearDomainEvents() { domainEvents_.clear(); }
};

} // namespace epassport::shared::domain
