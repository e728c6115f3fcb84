#include "proxy_handler.hpp"
#include "../proxy/active_request.hpp"
#include "../proxy/target_validator.hpp"
#include "../utils/logger.h"

ProxyRequestHandler::ProxyRequestHandler(ForwardingEngine& engine) : engine_(engine) {}

void ProxyRequestHandler::handle_proxy_request(const InboundRequest& request, ResponseSender sender) {
    auto active = std::make_shared<ActiveRequest>();
    auto stream_id = request.stream_id;

    active->set_state(RequestState::Validating);
    auto raw_target = find_query_param(request.target, "url");
    auto validation = validate_target(raw_target);

    if (!validation.ok()) {
        active->set_state(RequestState::Rejected);
        if (*validation.error == ProxyError::MissingTarget) {
            LOG_WARN("Request " << active->get_id() << ": " << request.method << " " << request.target
                     << " has no url parameter");
            sender(stream_id, missing_target_response());
        } else {
            LOG_WARN("Request " << active->get_id() << ": invalid url '" << *raw_target << "'");
            sender(stream_id, invalid_target_response(*raw_target));
        }
        active->set_state(RequestState::Done);
        return;
    }

    LOG_INFO(request.method << " " << validation.target->raw);
    active->set_state(RequestState::Forwarding);

    engine_.forward(request, *validation.target,
        [active, sender, stream_id](const RelayedResponse& relayed) {
            if (relayed.ok()) {
                active->set_state(RequestState::Succeeded);
            } else if (relayed.error == ProxyError::InvalidTarget) {
                active->set_state(RequestState::Rejected);
            } else {
                active->set_state(RequestState::Failed);
            }
            LOG_DEBUG("Request " << active->get_id() << " finished with " << relayed.response.status_code
                      << " after " << active->elapsed().count() << " ms");
            sender(stream_id, relayed.response);
            active->set_state(RequestState::Done);
        });
}
