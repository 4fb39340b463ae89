#pragma once

#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/transport/transport_error.hpp"
#include "mcplink/transport/transport_kind.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────

/// Lifecycle of one server connection.
///
///                        ┌──────────────┐
///                        │ Disconnected │◀──────── disconnected() from any state
///                        └──────┬───────┘
///                               │ begin_connect()
///                               ▼
///                        ┌──────────────┐
///              ┌────────▶│  Connecting  │─────────────────────┐
///              │         └──────┬───────┘                     │
///              │                │ connection_established()    │
///              │                ▼                             │
///              │         ┌──────────────┐                     │
///              │         │  Connected   │                     │
///              │         └──────┬───────┘                     │
///              │                │                             │
///              │   connection_failed()          auth_failed() │
///              │                ▼                             ▼
///              │         ┌──────────────┐     ┌───────────────────────────┐
///              └─────────│    Error     │     │ NeedsAuth / InvalidToken  │
///        begin_connect() └──────────────┘     └───────────────────────────┘
///        (reconnect)                            (no automatic retry)
///
enum class ConnectionState {
    Disconnected,   ///< Initial; reached only through disconnect()
    Connecting,     ///< Negotiation or handshake in progress
    Connected,      ///< Stream established
    Error,          ///< Transport failure; a reconnect may be scheduled
    NeedsAuth,      ///< Credential rejected or expired
    InvalidToken    ///< Credential malformed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
        case ConnectionState::NeedsAuth:    return "needs-auth";
        case ConnectionState::InvalidToken: return "invalid-token";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Server Status
// ─────────────────────────────────────────────────────────────────────────────

/// Read-only projection of a connection, pushed to status callbacks.
struct ServerStatus {
    std::string server_id;
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<std::string> error;
    std::optional<std::chrono::system_clock::time_point> last_connected;
    TransportKind transport{TransportKind::Unknown};
    std::vector<Tool> tools;
};

// ─────────────────────────────────────────────────────────────────────────────
// Connection State Machine
// ─────────────────────────────────────────────────────────────────────────────

/// Thread-safe state holder. Transitions that do not apply to the current
/// state are ignored and return false. Callbacks run after the lock is
/// released, so they may query status().
class ConnectionStateMachine {
public:
    using StatusCallback = std::function<void(const ServerStatus& status)>;

    explicit ConnectionStateMachine(std::string server_id);

    [[nodiscard]] ServerStatus status() const;
    [[nodiscard]] ConnectionState state() const;

    /// Disconnected, Error, NeedsAuth or InvalidToken → Connecting.
    bool begin_connect();

    /// Connecting → Connected. Records the transport and the connection time.
    bool connection_established(TransportKind transport);

    /// Connecting or Connected → Error. In Error, replaces the message.
    bool connection_failed(std::string error_message);

    /// Any state but Disconnected → NeedsAuth or InvalidToken.
    bool auth_failed(AuthFailure failure, std::string error_message);

    /// Any state → Disconnected. Clears the transport and the tool list.
    bool disconnected();

    /// Publish the tool list discovered after the handshake.
    void set_tools(std::vector<Tool> tools);

    void on_status_change(StatusCallback callback);

private:
    struct Notification {
        ServerStatus snapshot;
        std::vector<StatusCallback> callbacks;
    };

    // Caller must hold mutex_
    Notification prepare_notification_locked() const;

    static void fire_unlocked(const Notification& notification);

    mutable std::mutex mutex_;
    ServerStatus status_;
    std::vector<StatusCallback> callbacks_;
};

}  // namespace mcplink
