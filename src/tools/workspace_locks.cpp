#include "tools/workspace_locks.hpp"

#include <chrono>
#include <utility>

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

bool is_prefix(const std::filesystem::path& prefix, const std::filesystem::path& path) {
    auto prefix_it = prefix.begin();
    auto path_it = path.begin();
    for (; prefix_it != prefix.end(); ++prefix_it, ++path_it) {
        if (prefix_it->empty()) {
            continue;
        }
        if (path_it == path.end() || *prefix_it != *path_it) {
            return false;
        }
    }
    return true;
}

bool overlaps(const std::filesystem::path& a, const std::filesystem::path& b) {
    return is_prefix(a, b) || is_prefix(b, a);
}

}  // namespace

bool scopes_conflict(const LockScope& a, const LockScope& b) {
    if (a.mode == LockMode::None || b.mode == LockMode::None) {
        return false;
    }
    if (a.mode == LockMode::Read && b.mode == LockMode::Read) {
        return false;
    }
    if (a.mode == LockMode::Workspace || b.mode == LockMode::Workspace) {
        return true;
    }
    return overlaps(a.path, b.path);
}

WorkspaceLocks::Lease::~Lease() {
    release();
}

WorkspaceLocks::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_), ticket_(other.ticket_) {
    other.owner_ = nullptr;
    other.ticket_ = 0;
}

WorkspaceLocks::Lease& WorkspaceLocks::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        ticket_ = other.ticket_;
        other.owner_ = nullptr;
        other.ticket_ = 0;
    }
    return *this;
}

core::errors::Status WorkspaceLocks::Lease::wait(const core::concurrency::CancelToken& cancel) {
    if (owner_ == nullptr) {
        return core::errors::ok();
    }
    std::unique_lock<std::mutex> lock(owner_->mutex_);
    while (!owner_->grantable_locked(ticket_)) {
        if (core::concurrency::is_cancelled(cancel)) {
            return ForgeError{ErrorCategory::Execution,
                              "Cancelled while waiting for a workspace lock.", "cancelled"};
        }
        owner_->cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    return core::errors::ok();
}

void WorkspaceLocks::Lease::release() {
    if (owner_ != nullptr) {
        owner_->release_ticket(ticket_);
        owner_ = nullptr;
        ticket_ = 0;
    }
}

WorkspaceLocks::Lease WorkspaceLocks::reserve(const LockScope& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t ticket = next_ticket_++;
    tickets_.emplace(ticket, scope);
    return Lease(this, ticket);
}

std::size_t WorkspaceLocks::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickets_.size();
}

bool WorkspaceLocks::grantable_locked(const std::uint64_t ticket) const {
    const auto mine = tickets_.find(ticket);
    if (mine == tickets_.end()) {
        return true;
    }
    for (auto it = tickets_.begin(); it != mine; ++it) {
        if (scopes_conflict(it->second, mine->second)) {
            return false;
        }
    }
    return true;
}

void WorkspaceLocks::release_ticket(const std::uint64_t ticket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tickets_.erase(ticket);
    }
    cv_.notify_all();
}

}  // namespace forge::tools
