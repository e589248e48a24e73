#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include <pincer/core/types.h>
#include <pincer/protocol/envelope.h>

namespace pincer::bridge {

inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{30000};

/**
 * Outstanding-command table keyed by (connection id, request id).
 *
 * Every armed entry reaches exactly one terminal outcome: resolved by a matching result,
 * failed by its deadline (CommandTimeout), or failed by connection teardown
 * (ConnectionClosed). The entry is erased and its timer cancelled before the completion runs,
 * so a second result for the same key is a no-op.
 */
class RequestCorrelator {
public:
    using Completion = std::function<void(Result<protocol::Json>)>;

    // A completion detached from the table together with its outcome. Callers that hold their
    // own lock while detaching invoke it after unlocking.
    struct Settlement {
        Completion completion;
        Result<protocol::Json> outcome;
        void operator()();
    };

    RequestCorrelator(boost::asio::any_io_executor executor,
                      std::chrono::milliseconds timeout = kDefaultRequestTimeout);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    // Created -> Sent. Fails with DuplicateRequest if the key is already pending, in which case
    // `completion` is left untouched.
    Result<void> arm(const ConnectionId& conn, const RequestId& request, Completion&& completion);

    // Resolves a pending entry with a result payload. Returns false if nothing was pending.
    bool resolve(const ConnectionId& conn, const RequestId& request, protocol::Json result);

    std::optional<Settlement> take(const ConnectionId& conn, const RequestId& request,
                                   Error error);
    std::vector<Settlement> takeConnection(const ConnectionId& conn, const Error& error);

    std::size_t cancelAll(const Error& error);

    std::size_t pending() const;
    std::size_t pending(const ConnectionId& conn) const;
    std::chrono::milliseconds timeout() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace pincer::bridge
