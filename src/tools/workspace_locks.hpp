#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/forge_errors.hpp"

namespace forge::tools {

enum class LockMode {
    None,       // network and memory tools
    Read,       // shared on a path
    Write,      // exclusive on a path
    Workspace   // exclusive on the whole workspace
};

struct LockScope {
    LockMode mode = LockMode::None;
    std::filesystem::path path;  // absolute, lexically normal; unused for None/Workspace
};

bool scopes_conflict(const LockScope& a, const LockScope& b);

// Readers-writer locking over workspace path scopes with FIFO fairness:
// reserve() takes a ticket immediately, and a ticket is granted once no
// earlier outstanding ticket conflicts with it. Reserving in authorization
// order therefore serializes conflicting calls in that order.
class WorkspaceLocks {
public:
    class Lease {
    public:
        Lease() = default;
        ~Lease();
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        // Blocks until granted; fails with `cancelled` if the token fires first.
        core::errors::Status wait(const core::concurrency::CancelToken& cancel);
        void release();

    private:
        friend class WorkspaceLocks;
        Lease(WorkspaceLocks* owner, std::uint64_t ticket) : owner_(owner), ticket_(ticket) {}

        WorkspaceLocks* owner_ = nullptr;
        std::uint64_t ticket_ = 0;
    };

    Lease reserve(const LockScope& scope);
    std::size_t outstanding() const;

private:
    bool grantable_locked(std::uint64_t ticket) const;
    void release_ticket(std::uint64_t ticket);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::uint64_t, LockScope> tickets_;
    std::uint64_t next_ticket_ = 1;
};

}  // namespace forge::tools
