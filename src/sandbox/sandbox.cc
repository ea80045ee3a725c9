#include "sandbox.h"

#include <glog/logging.h>

namespace Shardrun {

const char* SandboxStateName(SandboxState state) {
    switch (state) {
        case SandboxState::kCreated:  return "CREATED";
        case SandboxState::kPulling:  return "PULLING";
        case SandboxState::kStarting: return "STARTING";
        case SandboxState::kCopying:  return "COPYING";
        case SandboxState::kVerified: return "VERIFIED";
        case SandboxState::kRunning:  return "RUNNING";
        case SandboxState::kStopping: return "STOPPING";
        case SandboxState::kRemoved:  return "REMOVED";
        case SandboxState::kFailed:   return "FAILED";
    }
    return "UNKNOWN";
}

bool IsTransitionAllowed(SandboxState from, SandboxState to) {
    if (to == SandboxState::kFailed) {
        return from != SandboxState::kRemoved && from != SandboxState::kStopping &&
               from != SandboxState::kFailed;
    }
    switch (from) {
        case SandboxState::kCreated:  return to == SandboxState::kPulling;
        case SandboxState::kPulling:  return to == SandboxState::kStarting;
        case SandboxState::kStarting: return to == SandboxState::kCopying || to == SandboxState::kStopping;
        case SandboxState::kCopying:  return to == SandboxState::kVerified;
        case SandboxState::kVerified: return to == SandboxState::kRunning;
        case SandboxState::kRunning:  return to == SandboxState::kStopping;
        case SandboxState::kStopping: return to == SandboxState::kRemoved;
        case SandboxState::kFailed:   return to == SandboxState::kStopping;
        case SandboxState::kRemoved:  return false;
    }
    return false;
}

Sandbox::Sandbox(std::string problem_id, std::string image, std::string name)
    : problem_id_(std::move(problem_id)), image_(std::move(image)), name_(std::move(name)) {
    history_.push_back(state_);
}

bool Sandbox::TransitionTo(SandboxState to) {
    if (!IsTransitionAllowed(state_, to)) {
        LOG(ERROR) << "[" << name_ << "] Illegal sandbox transition "
                   << SandboxStateName(state_) << " -> " << SandboxStateName(to);
        return false;
    }
    VLOG(2) << "[" << name_ << "] " << SandboxStateName(state_) << " -> " << SandboxStateName(to);
    state_ = to;
    history_.push_back(to);
    return true;
}

void Sandbox::Fail(const std::string& reason) {
    if (state_ == SandboxState::kStopping || state_ == SandboxState::kRemoved ||
        state_ == SandboxState::kFailed) {
        return;
    }
    failure_reason_ = reason;
    TransitionTo(SandboxState::kFailed);
}

} // namespace Shardrun
