#include "executor.hpp"

namespace dgadmin {

Outcome Outcome::success(std::string body) {
    Outcome o;
    o.kind = OutcomeKind::Success;
    o.body = std::move(body);
    return o;
}

Outcome Outcome::application_error(long status_code, std::string body) {
    Outcome o;
    o.kind = OutcomeKind::ApplicationError;
    o.status_code = status_code;
    o.body = std::move(body);
    return o;
}

Outcome Outcome::transport_error(std::string cause) {
    Outcome o;
    o.kind = OutcomeKind::TransportError;
    o.cause = std::move(cause);
    return o;
}

Outcome classify_response(const HttpResponse& response) {
    if (response.status_code == 0) {
        return Outcome::transport_error(
            response.error.empty() ? "no response received" : response.error);
    }
    if (response.status_code >= 200 && response.status_code < 300)
        return Outcome::success(response.body);
    return Outcome::application_error(response.status_code, response.body);
}

Outcome execute(const RequestDescriptor& descriptor,
                const EndpointConfig& endpoint,
                HttpClient& http,
                long timeout_seconds) {
    std::string url = endpoint.base_url + descriptor.path;

    HttpResponse response;
    if (descriptor.method == HttpMethod::Post) {
        response = http.post(url, descriptor.body.value_or(""),
                             descriptor.headers, timeout_seconds);
    } else {
        response = http.get(url, descriptor.headers, timeout_seconds);
    }
    return classify_response(response);
}

} // namespace dgadmin
