#include "mcplink/client/request_correlator.hpp"

#include "mcplink/log/logger.hpp"

#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

namespace mcplink {

RequestCorrelator::RequestCorrelator(
    asio::any_io_executor executor,
    std::string server_id,
    std::chrono::milliseconds default_timeout
)
    : executor_(std::move(executor))
    , server_id_(std::move(server_id))
    , default_timeout_(default_timeout)
    , entries_(std::make_shared<EntryMap>())
{}

RequestCorrelator::~RequestCorrelator() {
    for (auto& [id, entry] : *entries_) {
        entry.timer->cancel();
        entry.reply->close();
    }
}

std::uint64_t RequestCorrelator::next_id() noexcept {
    return ++last_id_;
}

RequestCorrelator::Ticket RequestCorrelator::track(std::uint64_t id, std::string method) {
    return track(id, std::move(method), default_timeout_);
}

RequestCorrelator::Ticket RequestCorrelator::track(
    std::uint64_t id,
    std::string method,
    std::chrono::milliseconds timeout
) {
    Entry entry;
    entry.reply = std::make_shared<ReplyChannel>(executor_, 1);
    entry.timer = std::make_unique<asio::steady_timer>(executor_);
    entry.method = method;
    entry.created = std::chrono::steady_clock::now();

    const bool has_timeout = (timeout.count() > 0);
    if (has_timeout) {
        std::string message = "Request to " + server_id_ + " timed out after " +
                              std::to_string(timeout.count()) + "ms (method: " + method + ")";
        entry.timer->expires_after(timeout);
        entry.timer->async_wait(
            [weak = std::weak_ptr<EntryMap>(entries_), id, message = std::move(message)](asio::error_code ec) {
                if (ec) {
                    return;  // Cancelled: settled some other way
                }
                auto entries = weak.lock();
                if (!entries) {
                    return;
                }
                const bool timed_out = settle(*entries, id, tl::unexpected(ClientError::timeout(message)));
                if (timed_out) {
                    MCPLINK_LOG_WARN(message);
                }
            });
    }

    auto ticket = entry.reply;
    (*entries_)[id] = std::move(entry);
    return ticket;
}

asio::awaitable<ClientResult<Json>> RequestCorrelator::await_reply(Ticket ticket) {
    asio::error_code ec;
    auto result = co_await ticket->async_receive(asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return tl::unexpected(ClientError::disconnected());
    }
    co_return result;
}

bool RequestCorrelator::resolve(std::uint64_t id, const Json& response) {
    const auto it = entries_->find(id);
    if (it == entries_->end()) {
        return false;
    }

    if (get_logger().should_log(LogLevel::Debug)) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - it->second.created);
        get_logger().debug_fmt("[{}] {} #{} answered after {}ms",
                               server_id_, it->second.method, id, elapsed.count());
    }
    return settle(*entries_, id, extract_result(response));
}

bool RequestCorrelator::reject(std::uint64_t id, ClientError error) {
    return settle(*entries_, id, tl::unexpected(std::move(error)));
}

std::size_t RequestCorrelator::reject_all(const ClientError& error) {
    // Move out first: settling must not observe a half-cleared map
    EntryMap drained;
    drained.swap(*entries_);

    for (auto& [id, entry] : drained) {
        entry.timer->cancel();
        entry.reply->try_send(asio::error_code{}, ClientResult<Json>(tl::unexpected(error)));
    }
    return drained.size();
}

bool RequestCorrelator::is_pending(std::uint64_t id) const {
    return entries_->contains(id);
}

std::size_t RequestCorrelator::pending_count() const {
    return entries_->size();
}

ClientResult<Json> RequestCorrelator::extract_result(const Json& response) {
    const auto error = response.find("error");
    if (error != response.end()) {
        return tl::unexpected(ClientError::from_rpc_error(JsonRpcError::from_json(*error)));
    }

    const auto result = response.find("result");
    if (result == response.end()) {
        return tl::unexpected(ClientError::protocol_error("Response has neither result nor error"));
    }
    return *result;
}

bool RequestCorrelator::settle(EntryMap& entries, std::uint64_t id, ClientResult<Json> result) {
    auto node = entries.extract(id);
    if (node.empty()) {
        return false;
    }

    Entry& entry = node.mapped();
    entry.timer->cancel();
    const bool delivered = entry.reply->try_send(asio::error_code{}, std::move(result));
    if (delivered == false) {
        MCPLINK_LOG_DEBUG("Reply channel for request #" + std::to_string(id) + " was already closed");
    }
    return true;
}

}  // namespace mcplink
