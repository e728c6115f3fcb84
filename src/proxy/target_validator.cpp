#include "target_validator.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_control_or_space(char c) {
    auto uc = static_cast<unsigned char>(c);
    return uc <= 0x20 || uc == 0x7f;
}

bool is_host_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~' || c == '%' || uc >= 0x80;
}

bool is_ipv6_char(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
}

std::string to_lower(std::string_view p_input) {
    std::string out(p_input);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view trim(std::string_view p_input) {
    while (!p_input.empty() && is_ascii_space(p_input.front())) p_input.remove_prefix(1);
    while (!p_input.empty() && is_ascii_space(p_input.back())) p_input.remove_suffix(1);
    return p_input;
}

bool parse_port(std::string_view p_digits, uint16_t& p_port) {
    if (p_digits.empty() || p_digits.size() > 5) {
        return false;
    }
    unsigned long value = 0;
    for (char c : p_digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > 65535) {
        return false;
    }
    p_port = static_cast<uint16_t>(value);
    return true;
}

}

std::string TargetDescriptor::host_header_value() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]";
    }
    return host;
}

ValidationResult validate_target(const std::optional<std::string>& p_raw_url) {
    ValidationResult result;
    if (!p_raw_url || p_raw_url->empty()) {
        result.error = ProxyError::MissingTarget;
        return result;
    }

    result.target = parse_absolute_url(*p_raw_url);
    if (!result.target) {
        result.error = ProxyError::InvalidTarget;
    }
    return result;
}

std::optional<TargetDescriptor> parse_absolute_url(std::string_view p_url) {
    std::string_view input = trim(p_url);
    if (std::any_of(input.begin(), input.end(), is_control_or_space)) {
        return std::nullopt;
    }

    // scheme
    auto colon = input.find("://");
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    std::string_view scheme = input.substr(0, colon);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return std::nullopt;
    }
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }

    TargetDescriptor target;
    target.raw = std::string(p_url);
    target.scheme = to_lower(scheme);

    std::string_view rest = input.substr(colon + 3);
    auto authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    // userinfo is accepted but never forwarded
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    std::string_view port_part;
    bool has_port = false;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(1, close - 1);
        if (host.empty() || !std::all_of(host.begin(), host.end(), is_ipv6_char)) {
            return std::nullopt;
        }
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            has_port = true;
            port_part = after.substr(1);
        }
    } else {
        auto port_colon = authority.rfind(':');
        host = authority.substr(0, port_colon);
        if (port_colon != std::string_view::npos) {
            has_port = true;
            port_part = authority.substr(port_colon + 1);
        }
        if (host.empty() || !std::all_of(host.begin(), host.end(), is_host_char)) {
            return std::nullopt;
        }
    }
    target.host = to_lower(host);

    target.port = default_port_for(target.scheme);
    if (has_port && !port_part.empty() && !parse_port(port_part, target.port)) {
        return std::nullopt;
    }

    auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }
    auto question = rest.find('?');
    std::string_view path = rest.substr(0, question);
    if (question != std::string_view::npos) {
        target.query = std::string(rest.substr(question));
        if (target.query == "?") {
            target.query.clear();
        }
    }
    target.path = path.empty() ? "/" : std::string(path);

    return target;
}

uint16_t default_port_for(std::string_view p_scheme) {
    if (p_scheme == "http") return 80;
    if (p_scheme == "https") return 443;
    return 0;
}

std::optional<std::string> find_query_param(std::string_view p_request_target, std::string_view p_name) {
    auto question = p_request_target.find('?');
    if (question == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view query = p_request_target.substr(question + 1);
    auto fragment = query.find('#');
    if (fragment != std::string_view::npos) {
        query = query.substr(0, fragment);
    }

    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        auto eq = pair.find('=');
        std::string name = percent_decode(pair.substr(0, eq), true);
        if (name != p_name) {
            continue;
        }
        if (eq == std::string_view::npos) {
            return std::string();
        }
        return percent_decode(pair.substr(eq + 1), true);
    }
    return std::nullopt;
}

std::string percent_decode(std::string_view p_input, bool p_plus_as_space) {
    std::string out;
    out.reserve(p_input.size());
    for (size_t i = 0; i < p_input.size(); ++i) {
        char c = p_input[i];
        if (c == '%' && i + 2 < p_input.size() && hex_value(p_input[i + 1]) >= 0 && hex_value(p_input[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(p_input[i + 1]) * 16 + hex_value(p_input[i + 2])));
            i += 2;
        } else if (c == '+' && p_plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}
