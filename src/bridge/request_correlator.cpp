#include <pincer/bridge/request_correlator.h>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <spdlog/spdlog.h>

#include <mutex>
#include <string>
#include <unordered_map>

namespace pincer::bridge {

namespace {

struct PendingRequest {
    RequestCorrelator::Completion completion;
    std::shared_ptr<boost::asio::steady_timer> timer;
    std::chrono::steady_clock::time_point deadline;
    uint64_t seq{0};
};

} // namespace

struct RequestCorrelator::Impl {
    Impl(boost::asio::any_io_executor ex, std::chrono::milliseconds t)
        : strand(boost::asio::make_strand(std::move(ex))), timeout(t) {}

    boost::asio::strand<boost::asio::any_io_executor> strand;
    const std::chrono::milliseconds timeout;

    mutable std::mutex mu;
    std::unordered_map<ConnectionId, std::unordered_map<RequestId, PendingRequest>> byConn;
    std::size_t total{0};
    uint64_t nextSeq{1};

    // Timer objects are only touched on the strand.
    void release(std::shared_ptr<boost::asio::steady_timer> timer) {
        if (!timer)
            return;
        boost::asio::post(strand, [timer = std::move(timer)]() { timer->cancel(); });
    }

    std::optional<PendingRequest> extract(const ConnectionId& conn, const RequestId& request,
                                          std::optional<uint64_t> seq) {
        auto c = byConn.find(conn);
        if (c == byConn.end())
            return std::nullopt;
        auto r = c->second.find(request);
        if (r == c->second.end())
            return std::nullopt;
        if (seq && r->second.seq != *seq)
            return std::nullopt;
        PendingRequest out = std::move(r->second);
        c->second.erase(r);
        if (c->second.empty())
            byConn.erase(c);
        --total;
        return out;
    }

    void expire(const ConnectionId& conn, const RequestId& request, uint64_t seq) {
        std::optional<PendingRequest> p;
        {
            std::lock_guard<std::mutex> lk(mu);
            p = extract(conn, request, seq);
        }
        if (!p)
            return;
        spdlog::debug("Command {} on {} timed out after {}ms", request, conn, timeout.count());
        p->completion(Error{ErrorCode::CommandTimeout,
                            "Command timeout (" + conn + ":" + request + ")"});
    }
};

void RequestCorrelator::Settlement::operator()() {
    if (completion)
        completion(std::move(outcome));
}

RequestCorrelator::RequestCorrelator(boost::asio::any_io_executor executor,
                                     std::chrono::milliseconds timeout)
    : impl_(std::make_shared<Impl>(std::move(executor), timeout)) {}

RequestCorrelator::~RequestCorrelator() {
    auto n = cancelAll(Error{ErrorCode::ConnectionClosed, "Request correlator shut down"});
    if (n > 0)
        spdlog::debug("RequestCorrelator: failed {} pending request(s) at shutdown", n);
}

Result<void> RequestCorrelator::arm(const ConnectionId& conn, const RequestId& request,
                                    Completion&& completion) {
    if (!completion)
        return Error{ErrorCode::InvalidArgument, "completion is required"};

    auto timer = std::make_shared<boost::asio::steady_timer>(impl_->strand);
    const auto deadline = std::chrono::steady_clock::now() + impl_->timeout;
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        auto& reqs = impl_->byConn[conn];
        if (reqs.count(request) != 0) {
            return Error{ErrorCode::DuplicateRequest,
                         "Request already pending: " + conn + ":" + request};
        }
        seq = impl_->nextSeq++;
        PendingRequest p;
        p.completion = std::move(completion);
        p.timer = timer;
        p.deadline = deadline;
        p.seq = seq;
        reqs.emplace(request, std::move(p));
        ++impl_->total;
    }

    std::weak_ptr<Impl> weak = impl_;
    boost::asio::post(impl_->strand, [timer, weak, conn, request, seq, deadline]() {
        timer->expires_at(deadline);
        timer->async_wait([timer, weak, conn, request, seq](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (auto self = weak.lock())
                self->expire(conn, request, seq);
        });
    });
    return Result<void>();
}

bool RequestCorrelator::resolve(const ConnectionId& conn, const RequestId& request,
                                protocol::Json result) {
    std::optional<PendingRequest> p;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        p = impl_->extract(conn, request, std::nullopt);
    }
    if (!p) {
        spdlog::debug("No pending command for {}:{} (late or duplicate result)", conn, request);
        return false;
    }
    impl_->release(std::move(p->timer));
    p->completion(std::move(result));
    return true;
}

std::optional<RequestCorrelator::Settlement>
RequestCorrelator::take(const ConnectionId& conn, const RequestId& request, Error error) {
    std::optional<PendingRequest> p;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        p = impl_->extract(conn, request, std::nullopt);
    }
    if (!p)
        return std::nullopt;
    impl_->release(std::move(p->timer));
    return Settlement{std::move(p->completion), std::move(error)};
}

std::vector<RequestCorrelator::Settlement>
RequestCorrelator::takeConnection(const ConnectionId& conn, const Error& error) {
    std::unordered_map<RequestId, PendingRequest> reqs;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        auto it = impl_->byConn.find(conn);
        if (it == impl_->byConn.end())
            return {};
        reqs = std::move(it->second);
        impl_->byConn.erase(it);
        impl_->total -= reqs.size();
    }
    std::vector<Settlement> out;
    out.reserve(reqs.size());
    for (auto& [id, p] : reqs) {
        impl_->release(std::move(p.timer));
        out.push_back(Settlement{std::move(p.completion), error});
    }
    return out;
}

std::size_t RequestCorrelator::cancelAll(const Error& error) {
    std::unordered_map<ConnectionId, std::unordered_map<RequestId, PendingRequest>> all;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        all.swap(impl_->byConn);
        impl_->total = 0;
    }
    std::size_t n = 0;
    for (auto& [conn, reqs] : all) {
        for (auto& [id, p] : reqs) {
            impl_->release(std::move(p.timer));
            p.completion(error);
            ++n;
        }
    }
    return n;
}

std::size_t RequestCorrelator::pending() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->total;
}

std::size_t RequestCorrelator::pending(const ConnectionId& conn) const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    auto it = impl_->byConn.find(conn);
    return it == impl_->byConn.end() ? 0 : it->second.size();
}

std::chrono::milliseconds RequestCorrelator::timeout() const noexcept {
    return impl_->timeout;
}

} // namespace pincer::bridge
