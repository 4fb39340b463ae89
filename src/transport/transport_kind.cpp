#include "mcplink/transport/transport_kind.hpp"

namespace mcplink {

namespace {

// std::visit helper
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

TransportKind kind_of(const NegotiatedTransport& transport) noexcept {
    return std::visit(overloaded{
        [](const std::monostate&) { return TransportKind::Unknown; },
        [](const StreamableTransport&) { return TransportKind::Streamable; },
        [](const LegacySseTransport&) { return TransportKind::LegacySse; }
    }, transport);
}

std::optional<std::string> post_target(
    const NegotiatedTransport& transport,
    std::string_view base_url
) {
    return std::visit(overloaded{
        [](const std::monostate&) -> std::optional<std::string> {
            return std::nullopt;
        },
        [base_url](const StreamableTransport&) -> std::optional<std::string> {
            return std::string(base_url);
        },
        [](const LegacySseTransport& legacy) -> std::optional<std::string> {
            return legacy.endpoint;
        }
    }, transport);
}

bool reconnects_on_stream_end(const NegotiatedTransport& transport) noexcept {
    return std::holds_alternative<LegacySseTransport>(transport);
}

std::optional<std::pair<std::string, std::string>> session_header(
    const NegotiatedTransport& transport
) {
    const auto* streamable = std::get_if<StreamableTransport>(&transport);
    const bool has_session = (streamable != nullptr) && streamable->session_id.has_value();
    if (has_session == false) {
        return std::nullopt;
    }
    return std::make_pair(streamable->session_header, *streamable->session_id);
}

std::optional<std::string> session_id(const NegotiatedTransport& transport) {
    return std::visit(overloaded{
        [](const std::monostate&) -> std::optional<std::string> { return std::nullopt; },
        [](const StreamableTransport& t) { return t.session_id; },
        [](const LegacySseTransport& t) { return t.session_id; }
    }, transport);
}

bool is_valid_session_id(std::string_view id) noexcept {
    constexpr std::size_t max_session_id_length = 256;
    if (id.empty() || (id.size() > max_session_id_length)) {
        return false;
    }

    for (char c : id) {
        const bool is_alphanumeric = (c >= 'a' && c <= 'z') ||
                                     (c >= 'A' && c <= 'Z') ||
                                     (c >= '0' && c <= '9');
        const bool is_safe_special = (c == '-') || (c == '_') || (c == '.');
        if (!is_alphanumeric && !is_safe_special) {
            return false;
        }
    }
    return true;
}

}  // namespace mcplink
