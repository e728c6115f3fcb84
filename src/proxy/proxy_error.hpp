#pragma once

enum class ProxyError {
    MissingTarget,
    InvalidTarget,
    UnreachableTarget,
    TargetTimeout,
    InternalFault
};

inline const char* to_string(ProxyError p_error) {
    switch (p_error) {
        case ProxyError::MissingTarget:     return "MissingTarget";
        case ProxyError::InvalidTarget:     return "InvalidTarget";
        case ProxyError::UnreachableTarget: return "UnreachableTarget";
        case ProxyError::TargetTimeout:     return "TargetTimeout";
        case ProxyError::InternalFault:     return "InternalFault";
    }
    return "Unknown";
}

inline int status_for(ProxyError p_error) {
    switch (p_error) {
        case ProxyError::MissingTarget:
        case ProxyError::InvalidTarget:
            return 400;
        case ProxyError::UnreachableTarget:
        case ProxyError::TargetTimeout:
            return 502;
        case ProxyError::InternalFault:
            return 500;
    }
    return 500;
}
