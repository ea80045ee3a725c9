#pragma once

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace Shardrun {

/**
 * The pair of primitives shared by every worker of a problem's pool:
 *  - a counting semaphore bounding simultaneous sandbox-acquisition operations
 *    (image pulls, container starts) against the container daemon;
 *  - a mutex serializing the local provisioning section.
 *
 * Owned by the scheduler and handed to workers by shared handle.
 */
class ConcurrencyToken {
public:
    explicit ConcurrencyToken(int max_concurrency);

    ConcurrencyToken(const ConcurrencyToken&) = delete;
    ConcurrencyToken& operator=(const ConcurrencyToken&) = delete;

    // Blocks until a permit is free.
    void Acquire();
    void Release();

    // RAII permit
    class Permit {
    public:
        explicit Permit(ConcurrencyToken& token) : token_(token) { token_.Acquire(); }
        ~Permit() { token_.Release(); }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        ConcurrencyToken& token_;
    };

    absl::Mutex& provisioning_mutex() { return provisioning_mutex_; }

    int max_concurrency() const { return max_concurrency_; }
    int in_flight() const;
    // Highest in_flight() ever observed
    int peak_in_flight() const;
    // Permits handed out so far
    int total_acquired() const;

private:
    const int max_concurrency_;

    mutable absl::Mutex mutex_;
    absl::CondVar permit_freed_cv_;
    int in_flight_ ABSL_GUARDED_BY(mutex_) = 0;
    int peak_in_flight_ ABSL_GUARDED_BY(mutex_) = 0;
    int total_acquired_ ABSL_GUARDED_BY(mutex_) = 0;

    absl::Mutex provisioning_mutex_;
};

} // namespace Shardrun
