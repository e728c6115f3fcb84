#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

enum class RequestState {
    Idle,
    Validating,
    Rejected,
    Forwarding,
    Succeeded,
    Failed,
    Done
};

const char* to_string(RequestState p_state);

// Lifecycle of one proxied request:
//   Idle -> Validating -> {Rejected | Forwarding} -> {Succeeded | Failed} -> Done
// Forwarding may also end in Rejected when the scheme has no transport.
class ActiveRequest {
public:
    ActiveRequest();
    ~ActiveRequest();

    uint64_t get_id() const { return request_id_; }
    RequestState get_state() const { return state_; }

    // Throws std::logic_error on a transition the lifecycle does not allow
    void set_state(RequestState p_state);

    bool is_terminal() const;
    std::chrono::milliseconds elapsed() const;

    static bool can_transition(RequestState p_from, RequestState p_to);

private:
    static uint64_t generate_request_id();

    uint64_t request_id_;
    RequestState state_ = RequestState::Idle;
    std::chrono::steady_clock::time_point start_time_;
};
