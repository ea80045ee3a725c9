#include "concurrency_token.h"

#include <algorithm>
#include <string>

#include <glog/logging.h>

#include "common/errors.h"

namespace Shardrun {

ConcurrencyToken::ConcurrencyToken(int max_concurrency) : max_concurrency_(max_concurrency) {
    if (max_concurrency_ < 1) {
        throw ConfigurationError("max concurrency must be at least 1, got " +
                                 std::to_string(max_concurrency_));
    }
}

void ConcurrencyToken::Acquire() {
    absl::MutexLock lock(&mutex_);
    while (in_flight_ >= max_concurrency_) {
        permit_freed_cv_.Wait(&mutex_);
    }
    ++in_flight_;
    ++total_acquired_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
    VLOG(3) << "Sandbox permit acquired (" << in_flight_ << "/" << max_concurrency_ << ")";
}

void ConcurrencyToken::Release() {
    absl::MutexLock lock(&mutex_);
    if (in_flight_ == 0) {
        LOG(ERROR) << "ConcurrencyToken released more often than acquired";
        return;
    }
    --in_flight_;
    permit_freed_cv_.Signal();
}

int ConcurrencyToken::in_flight() const {
    absl::MutexLock lock(&mutex_);
    return in_flight_;
}

int ConcurrencyToken::peak_in_flight() const {
    absl::MutexLock lock(&mutex_);
    return peak_in_flight_;
}

int ConcurrencyToken::total_acquired() const {
    absl::MutexLock lock(&mutex_);
    return total_acquired_;
}

} // namespace Shardrun
