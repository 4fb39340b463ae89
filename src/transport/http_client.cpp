#include "mcplink/transport/http_client.hpp"

namespace mcplink {

asio::awaitable<HttpClientResult<std::string>> HttpStream::async_read_all(std::size_t limit) {
    std::string body;
    while (true) {
        auto chunk = co_await async_read_some();
        if (!chunk) {
            co_return tl::unexpected(chunk.error());
        }
        const bool finished = (chunk->has_value() == false);
        if (finished) {
            co_return body;
        }
        if (body.size() + (*chunk)->size() > limit) {
            cancel();
            co_return tl::unexpected(HttpClientError::response_too_large(limit));
        }
        body += **chunk;
    }
}

asio::awaitable<HttpClientResult<std::string>> HttpStream::async_read_prefix(std::size_t limit) {
    std::string body;
    while (body.size() < limit) {
        auto chunk = co_await async_read_some();
        if (!chunk) {
            co_return tl::unexpected(chunk.error());
        }
        const bool finished = (chunk->has_value() == false);
        if (finished) {
            co_return body;
        }
        body += **chunk;
    }

    body.resize(limit);
    cancel();
    co_return body;
}

}  // namespace mcplink
