#include <pincer/client/gateway_connection.h>
#include <pincer/core/text_utils.h>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <spdlog/spdlog.h>

#include <mutex>
#include <optional>
#include <utility>

namespace pincer::client {

namespace {

std::string buildUrl(const config::ClientConfig& cfg) {
    std::string url = cfg.gatewayUrl;
    if (cfg.token && !cfg.token->empty()) {
        url += url.find('?') == std::string::npos ? '?' : '&';
        url += "token=" + percentEncode(*cfg.token);
    }
    return url;
}

} // namespace

struct GatewayConnection::Impl : std::enable_shared_from_this<Impl> {
    Impl(boost::asio::any_io_executor ex, config::ClientConfig c, TransportFactory f,
         ConnectionEvents e)
        : strand(boost::asio::make_strand(std::move(ex))), cfg(std::move(c)),
          factory(std::move(f)), events(std::move(e)) {}

    boost::asio::strand<boost::asio::any_io_executor> strand;

    mutable std::mutex mu;
    config::ClientConfig cfg;
    TransportFactory factory;
    const ConnectionEvents events;
    ConnectionState state{ConnectionState::Disconnected};
    std::shared_ptr<ClientTransport> transport;
    uint64_t generation{0};
    int attempts{0};
    std::shared_ptr<boost::asio::steady_timer> reconnectTimer;
    uint64_t timerSeq{0};
    bool shutdown{false};

    void emitStatus(ConnectionState s) const {
        if (events.onStatusChange)
            events.onStatusChange(s);
    }

    // Timer objects are only touched on the strand.
    void cancelTimerLocked() {
        ++timerSeq;
        if (auto t = std::move(reconnectTimer))
            boost::asio::post(strand, [t]() { t->cancel(); });
    }

    std::optional<std::pair<int, std::chrono::milliseconds>> scheduleReconnectLocked() {
        if (shutdown)
            return std::nullopt;
        if (attempts >= cfg.reconnect.maxAttempts) {
            spdlog::info("Max reconnect attempts reached ({})", cfg.reconnect.maxAttempts);
            return std::nullopt;
        }
        const auto delay = cfg.reconnect.delayFor(attempts);
        ++attempts;
        auto timer = std::make_shared<boost::asio::steady_timer>(strand);
        reconnectTimer = timer;
        const uint64_t seq = ++timerSeq;
        std::weak_ptr<Impl> weak = shared_from_this();
        boost::asio::post(strand, [timer, weak, seq, delay]() {
            timer->expires_after(delay);
            timer->async_wait([timer, weak, seq](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted)
                    return;
                if (auto self = weak.lock())
                    self->onReconnectTimer(seq);
            });
        });
        spdlog::info("Reconnecting in {}ms (attempt {})", delay.count(), attempts);
        return std::make_pair(attempts, delay);
    }

    void onReconnectTimer(uint64_t seq) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (seq != timerSeq || !reconnectTimer || shutdown)
                return;
            reconnectTimer.reset();
        }
        connect();
    }

    void connect() {
        std::shared_ptr<ClientTransport> t;
        std::string url;
        std::string display;
        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lk(mu);
            if (shutdown || state == ConnectionState::Connecting ||
                state == ConnectionState::Connected)
                return;
            cancelTimerLocked();
            t = factory ? factory() : nullptr;
            if (t) {
                gen = ++generation;
                transport = t;
                state = ConnectionState::Connecting;
                url = buildUrl(cfg);
                display = cfg.gatewayUrl;
            }
        }
        if (!t) {
            Error err{ErrorCode::InternalError, "No transport available for gateway connection"};
            spdlog::error("{}", err.message);
            if (events.onError)
                events.onError(err);
            return;
        }

        emitStatus(ConnectionState::Connecting);
        spdlog::info("Connecting to gateway {}", display);

        std::weak_ptr<Impl> weak = shared_from_this();
        TransportHandlers h;
        h.onOpen = [weak, gen]() {
            if (auto self = weak.lock())
                self->handleOpen(gen);
        };
        h.onMessage = [weak, gen](std::string text) {
            if (auto self = weak.lock())
                self->handleMessage(gen, text);
        };
        h.onError = [weak, gen](const Error& e) {
            if (auto self = weak.lock())
                self->handleError(gen, e);
        };
        h.onClose = [weak, gen]() {
            if (auto self = weak.lock())
                self->handleClose(gen);
        };
        t->open(url, std::move(h));
    }

    bool current(uint64_t gen) const { return !shutdown && gen == generation; }

    void handleOpen(uint64_t gen) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (!current(gen))
                return;
            attempts = 0;
            state = ConnectionState::Connected;
        }
        spdlog::info("Connected to gateway");
        emitStatus(ConnectionState::Connected);
    }

    void handleMessage(uint64_t gen, const std::string& text) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (!current(gen))
                return;
        }
        auto cmd = protocol::parseCommand(text);
        if (!cmd) {
            spdlog::error("[{}] Failed to parse command: {}",
                          errorToString(ErrorCode::MalformedMessage), cmd.error().message);
            return;
        }
        if (events.onCommand)
            events.onCommand(std::move(cmd).value());
    }

    void handleError(uint64_t gen, const Error& e) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (!current(gen))
                return;
            state = ConnectionState::Error;
        }
        spdlog::warn("Gateway connection error: {}", e.message);
        emitStatus(ConnectionState::Error);
        if (events.onError)
            events.onError(e);
    }

    void handleClose(uint64_t gen) {
        std::shared_ptr<ClientTransport> old;
        std::optional<std::pair<int, std::chrono::milliseconds>> scheduled;
        {
            std::lock_guard<std::mutex> lk(mu);
            if (!current(gen))
                return;
            old = std::move(transport);
            state = ConnectionState::Disconnected;
            scheduled = scheduleReconnectLocked();
        }
        emitStatus(ConnectionState::Disconnected);
        if (scheduled && events.onReconnectScheduled)
            events.onReconnectScheduled(scheduled->first, scheduled->second);
    }

    void disconnect(bool notify) {
        std::shared_ptr<ClientTransport> old;
        {
            std::lock_guard<std::mutex> lk(mu);
            cancelTimerLocked();
            attempts = cfg.reconnect.maxAttempts;
            ++generation;
            old = std::move(transport);
            state = ConnectionState::Disconnected;
            if (!notify)
                shutdown = true;
        }
        if (old)
            old->close();
        if (notify)
            emitStatus(ConnectionState::Disconnected);
    }
};

GatewayConnection::GatewayConnection(boost::asio::any_io_executor executor,
                                     config::ClientConfig cfg, TransportFactory factory,
                                     ConnectionEvents events)
    : impl_(std::make_shared<Impl>(std::move(executor), std::move(cfg), std::move(factory),
                                   std::move(events))) {}

GatewayConnection::~GatewayConnection() {
    impl_->disconnect(false);
}

void GatewayConnection::connect() {
    impl_->connect();
}

void GatewayConnection::disconnect() {
    impl_->disconnect(true);
}

bool GatewayConnection::send(const protocol::EventEnvelope& event) {
    std::shared_ptr<ClientTransport> t;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        if (impl_->state == ConnectionState::Connected)
            t = impl_->transport;
    }
    if (!t) {
        spdlog::warn("Cannot send {} - not connected", protocol::eventTypeName(event.body));
        return false;
    }
    std::string frame;
    try {
        frame = protocol::serializeEvent(event);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Cannot encode {} event: {}", protocol::eventTypeName(event.body), e.what());
        return false;
    }
    return t->send(std::move(frame));
}

void GatewayConnection::updateConfig(config::ClientConfig cfg) {
    std::lock_guard<std::mutex> lk(impl_->mu);
    impl_->cfg = std::move(cfg);
}

ConnectionState GatewayConnection::state() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->state;
}

int GatewayConnection::reconnectAttempts() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->attempts;
}

bool GatewayConnection::reconnectPending() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->reconnectTimer != nullptr;
}

std::string GatewayConnection::connectUrl() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return buildUrl(impl_->cfg);
}

} // namespace pincer::client
