#include "mcplink/transport/transport_error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>

namespace mcplink {

namespace {

constexpr std::size_t kMaxBodyInMessage = 200;

std::chrono::milliseconds parse_retry_after(const HeaderMap& headers) {
    const auto value = get_header(headers, "Retry-After");
    if (value.has_value() == false) {
        return kDefaultRetryAfter;
    }

    // Only the delay-seconds form; an HTTP-date falls back to the default
    long long seconds = 0;
    const auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), seconds);
    if (ec == std::errc::result_out_of_range) {
        return kMaxRetryAfter;
    }
    const bool parsed = (ec == std::errc{}) && (seconds >= 0);
    if (parsed == false) {
        return kDefaultRetryAfter;
    }
    return std::chrono::seconds{std::min<long long>(seconds, kMaxRetryAfter.count())};
}

std::string describe_status(int status, std::string_view body) {
    std::string message = "HTTP " + std::to_string(status);
    if (body.empty() == false) {
        message += ": ";
        message += body.substr(0, kMaxBodyInMessage);
    }
    return message;
}

}  // namespace

AuthFailure classify_unauthorized(std::string_view body) {
    const auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    const bool is_object = parsed.is_object();
    if (is_object == false) {
        return AuthFailure::Rejected;
    }

    const auto error = parsed.find("error");
    const auto description = parsed.find("error_description");
    const bool has_fields =
        (error != parsed.end()) && error->is_string() &&
        (description != parsed.end()) && description->is_string();
    if (has_fields == false) {
        return AuthFailure::Rejected;
    }

    const bool malformed =
        (error->get<std::string>() == "invalid_token") &&
        (description->get<std::string>().find("Invalid token format") != std::string::npos);
    return malformed ? AuthFailure::Malformed : AuthFailure::Rejected;
}

HttpTransportError classify_http_failure(
    int status,
    const HeaderMap& headers,
    std::string_view body
) {
    switch (status) {
        case 401: {
            const AuthFailure failure = classify_unauthorized(body);
            const std::string message = (failure == AuthFailure::Malformed)
                ? "Invalid token format"
                : "Authentication required";
            return HttpTransportError::unauthorized(failure, message);
        }
        case 403:
            return HttpTransportError::forbidden();
        case 429:
            return HttpTransportError::rate_limited(parse_retry_after(headers));
        case 500:
        case 502:
        case 503:
        case 504:
            return HttpTransportError::server_error(status, describe_status(status, body));
        default:
            return HttpTransportError::http_error(status, describe_status(status, body));
    }
}

}  // namespace mcplink
