#include "mcplink/client/connection_state.hpp"

#include "mcplink/log/logger.hpp"

namespace mcplink {

ConnectionStateMachine::ConnectionStateMachine(std::string server_id) {
    status_.server_id = std::move(server_id);
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

ServerStatus ConnectionStateMachine::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

ConnectionState ConnectionStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_.state;
}

// ─────────────────────────────────────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────────────────────────────────────

bool ConnectionStateMachine::begin_connect() {
    Notification notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool busy =
            (status_.state == ConnectionState::Connecting) ||
            (status_.state == ConnectionState::Connected);
        if (busy) {
            return false;
        }

        status_.state = ConnectionState::Connecting;
        notification = prepare_notification_locked();
    }
    fire_unlocked(notification);
    return true;
}

bool ConnectionStateMachine::connection_established(TransportKind transport) {
    Notification notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool is_connecting = (status_.state == ConnectionState::Connecting);
        if (is_connecting == false) {
            return false;
        }

        status_.state = ConnectionState::Connected;
        status_.transport = transport;
        status_.error.reset();
        status_.last_connected = std::chrono::system_clock::now();
        notification = prepare_notification_locked();
    }
    fire_unlocked(notification);
    return true;
}

bool ConnectionStateMachine::connection_failed(std::string error_message) {
    Notification notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool can_fail =
            (status_.state == ConnectionState::Connecting) ||
            (status_.state == ConnectionState::Connected) ||
            (status_.state == ConnectionState::Error);
        if (can_fail == false) {
            return false;
        }

        status_.state = ConnectionState::Error;
        status_.error = std::move(error_message);
        notification = prepare_notification_locked();
    }
    fire_unlocked(notification);
    return true;
}

bool ConnectionStateMachine::auth_failed(AuthFailure failure, std::string error_message) {
    Notification notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (status_.state == ConnectionState::Disconnected) {
            return false;
        }

        status_.state = (failure == AuthFailure::Malformed)
            ? ConnectionState::InvalidToken
            : ConnectionState::NeedsAuth;
        status_.error = std::move(error_message);
        notification = prepare_notification_locked();
    }
    fire_unlocked(notification);
    return true;
}

bool ConnectionStateMachine::disconnected() {
    Notification notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (status_.state == ConnectionState::Disconnected) {
            return false;
        }

        status_.state = ConnectionState::Disconnected;
        status_.transport = TransportKind::Unknown;
        status_.tools.clear();
        notification = prepare_notification_locked();
    }
    fire_unlocked(notification);
    return true;
}

void ConnectionStateMachine::set_tools(std::vector<Tool> tools) {
    Notification notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_.tools = std::move(tools);
        notification = prepare_notification_locked();
    }
    fire_unlocked(notification);
}

// ─────────────────────────────────────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────────────────────────────────────

void ConnectionStateMachine::on_status_change(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

ConnectionStateMachine::Notification ConnectionStateMachine::prepare_notification_locked() const {
    return Notification{status_, callbacks_};
}

void ConnectionStateMachine::fire_unlocked(const Notification& notification) {
    for (const auto& callback : notification.callbacks) {
        try {
            callback(notification.snapshot);
        } catch (const std::exception& e) {
            MCPLINK_LOG_ERROR("Exception in status callback: " + std::string(e.what()));
        }
    }
}

}  // namespace mcplink
