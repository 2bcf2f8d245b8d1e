#pragma once
#include "command.hpp"
#include "endpoint.hpp"
#include "http.hpp"
#include <string>

namespace dgadmin {

enum class OutcomeKind {
    Success,          // 2xx; body is the response body
    ApplicationError, // non-2xx; status + body passed through untouched
    TransportError,   // no response at all; cause says why
};

struct Outcome {
    OutcomeKind kind = OutcomeKind::TransportError;
    long status_code = 0; // ApplicationError only
    std::string body;     // Success / ApplicationError
    std::string cause;    // TransportError only

    static Outcome success(std::string body);
    static Outcome application_error(long status_code, std::string body);
    static Outcome transport_error(std::string cause);

    bool ok() const { return kind == OutcomeKind::Success; }

    bool operator==(const Outcome& other) const {
        return kind == other.kind && status_code == other.status_code &&
               body == other.body && cause == other.cause;
    }
};

// Classify a raw transport result. status_code 0 is a transport failure.
Outcome classify_response(const HttpResponse& response);

// Send exactly one request (base_url + descriptor.path) and classify it.
// No retries. Blocks for at most timeout_seconds.
Outcome execute(const RequestDescriptor& descriptor,
                const EndpointConfig& endpoint,
                HttpClient& http,
                long timeout_seconds = kDefaultTimeoutSeconds);

} // namespace dgadmin
