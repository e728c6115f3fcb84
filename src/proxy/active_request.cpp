#include "active_request.hpp"
#include "../utils/logger.h"

#include <stdexcept>
#include <string>

const char* to_string(RequestState p_state) {
    switch (p_state) {
        case RequestState::Idle:       return "Idle";
        case RequestState::Validating: return "Validating";
        case RequestState::Rejected:   return "Rejected";
        case RequestState::Forwarding: return "Forwarding";
        case RequestState::Succeeded:  return "Succeeded";
        case RequestState::Failed:     return "Failed";
        case RequestState::Done:       return "Done";
    }
    return "Unknown";
}

ActiveRequest::ActiveRequest()
    : request_id_(generate_request_id()),
      start_time_(std::chrono::steady_clock::now()) {
    LOG_DEBUG("Created request " << request_id_);
}

ActiveRequest::~ActiveRequest() {
    LOG_DEBUG("Destroyed request " << request_id_ << " in state " << to_string(state_));
}

void ActiveRequest::set_state(RequestState p_state) {
    if (!can_transition(state_, p_state)) {
        throw std::logic_error(std::string("Illegal request transition ") +
                               to_string(state_) + " -> " + to_string(p_state));
    }
    state_ = p_state;
    LOG_DEBUG("Request " << request_id_ << " state: " << to_string(p_state));
}

bool ActiveRequest::is_terminal() const {
    return state_ == RequestState::Rejected ||
           state_ == RequestState::Succeeded ||
           state_ == RequestState::Failed;
}

std::chrono::milliseconds ActiveRequest::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
}

bool ActiveRequest::can_transition(RequestState p_from, RequestState p_to) {
    switch (p_from) {
        case RequestState::Idle:
            return p_to == RequestState::Validating;
        case RequestState::Validating:
            return p_to == RequestState::Rejected || p_to == RequestState::Forwarding;
        case RequestState::Forwarding:
            return p_to == RequestState::Succeeded || p_to == RequestState::Failed ||
                   p_to == RequestState::Rejected;
        case RequestState::Rejected:
        case RequestState::Succeeded:
        case RequestState::Failed:
            return p_to == RequestState::Done;
        case RequestState::Done:
            return false;
    }
    return false;
}

uint64_t ActiveRequest::generate_request_id() {
    // Log correlation only
    static std::atomic<uint64_t> next_request_id{1};
    return next_request_id.fetch_add(1);
}
