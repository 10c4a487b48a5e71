#pragma once

#include <string>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include "fairness_error.hpp"

namespace fairdraw {

namespace http = boost::beast::http;

// JSON response construction shared by the request handlers. Security and
// CORS headers are added by HttpSession on the way out.
inline http::response<http::string_body> json_response(http::status status, unsigned version,
                                                       const boost::json::object& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.body() = boost::json::serialize(body);
    res.prepare_payload();
    return res;
}

inline http::response<http::string_body> error_response(http::status status, unsigned version,
                                                        const std::string& message) {
    boost::json::object body;
    body["error"] = message;
    return json_response(status, version, body);
}

// sequencing -> 409, integrity -> 422, infrastructure -> 503
inline http::status status_for(const FairnessError& e) {
    switch (e.category()) {
        case ErrorCategory::SEQUENCING:     return http::status::conflict;
        case ErrorCategory::INTEGRITY:      return http::status::unprocessable_entity;
        case ErrorCategory::INFRASTRUCTURE: return http::status::service_unavailable;
    }
    return http::status::internal_server_error;
}

inline http::response<http::string_body> fairness_error_response(const FairnessError& e, unsigned version) {
    boost::json::object body;
    body["error"] = error_code_name(e.code());
    body["detail"] = e.what();
    return json_response(status_for(e), version, body);
}

}
