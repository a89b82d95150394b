#pragma once

#include <atomic>
#include <mutex>
#include "protocol/task_contract.hpp"

namespace turnstile::session {

// Owner of the process-wide revision counter. `commit` is the only way to
// advance it; the callback runs under the commit lock with the new revision,
// so anything it publishes is ordered by revision.
class RevisionStore {
public:
    protocol::Revision current() const { return rev_.load(); }

    template <typename Fn>
    protocol::Revision commit(Fn&& publish) {
        std::lock_guard<std::mutex> lock(commit_mutex_);
        const protocol::Revision next = rev_.load() + 1;
        publish(next);
        rev_.store(next);
        return next;
    }

    // Runs `read` with no commit in flight, passing the current revision.
    template <typename Fn>
    auto read_consistent(Fn&& read) const {
        std::lock_guard<std::mutex> lock(commit_mutex_);
        return read(rev_.load());
    }

private:
    mutable std::mutex commit_mutex_;
    std::atomic<protocol::Revision> rev_{0};
};

}  // namespace turnstile::session
