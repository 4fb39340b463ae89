#pragma once

#include "mcplink/client/client_error.hpp"
#include "mcplink/protocol/json_rpc.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// RequestCorrelator
// ─────────────────────────────────────────────────────────────────────────────
// Matches replies to outstanding requests.
//
// Each tracked id owns a capacity-1 reply channel and a timeout timer. The
// entry is erased by whichever of resolve(), reject(), reject_all() or the
// timer gets to it first, so every request settles exactly once and a late
// reply finds nothing to settle.
//
// Not thread-safe: construct it with the connection's strand and call it only
// from there. The timer handlers run on the same executor.
//
//   const auto id = correlator.next_id();
//   auto ticket = correlator.track(id, "tools/list");
//   co_await send(...);
//   auto reply = co_await RequestCorrelator::await_reply(ticket);

class RequestCorrelator {
public:
    using ReplyChannel = asio::experimental::channel<void(asio::error_code, ClientResult<Json>)>;
    using Ticket = std::shared_ptr<ReplyChannel>;

    RequestCorrelator(
        asio::any_io_executor executor,
        std::string server_id,
        std::chrono::milliseconds default_timeout
    );
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// Monotonic, starting at 1, never reused for the lifetime of the correlator.
    [[nodiscard]] std::uint64_t next_id() noexcept;

    [[nodiscard]] Ticket track(std::uint64_t id, std::string method);
    [[nodiscard]] Ticket track(std::uint64_t id, std::string method, std::chrono::milliseconds timeout);

    /// Suspend until the ticket is settled. A ticket whose channel was closed
    /// without a value yields Disconnected.
    [[nodiscard]] static asio::awaitable<ClientResult<Json>> await_reply(Ticket ticket);

    /// Settle `id` with a response message. Returns false for unknown ids.
    bool resolve(std::uint64_t id, const Json& response);

    bool reject(std::uint64_t id, ClientError error);

    /// Reject every outstanding entry. Returns how many were rejected.
    std::size_t reject_all(const ClientError& error);

    [[nodiscard]] bool is_pending(std::uint64_t id) const;
    [[nodiscard]] std::size_t pending_count() const;

    /// The result member of a response, or its error member as a ClientError.
    [[nodiscard]] static ClientResult<Json> extract_result(const Json& response);

private:
    struct Entry {
        Ticket reply;
        std::unique_ptr<asio::steady_timer> timer;
        std::string method;
        std::chrono::steady_clock::time_point created;
    };

    using EntryMap = std::unordered_map<std::uint64_t, Entry>;

    // Settles and erases; false if the id is not pending.
    static bool settle(EntryMap& entries, std::uint64_t id, ClientResult<Json> result);

    asio::any_io_executor executor_;
    std::string server_id_;
    std::chrono::milliseconds default_timeout_;
    std::atomic<std::uint64_t> last_id_{0};

    // Shared with timer handlers, which hold it weakly
    std::shared_ptr<EntryMap> entries_;
};

}  // namespace mcplink
