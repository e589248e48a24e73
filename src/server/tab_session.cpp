#include <pincer/server/tab_session.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <spdlog/spdlog.h>

namespace pincer::server {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using boost::asio::use_awaitable;

TabSession::TabSession(ConnectionId id, Stream stream)
    : id_(std::move(id)), ws_(std::move(stream)) {
    ws_.text(true);
}

TabSession::~TabSession() {
    spdlog::debug("TabSession {} destroyed", id_);
}

bool TabSession::isOpen() const {
    return open_.load(std::memory_order_acquire);
}

bool TabSession::sendText(std::string frame) {
    if (!isOpen())
        return false;
    boost::asio::post(ws_.get_executor(),
                      [self = shared_from_this(), frame = std::move(frame)]() mutable {
                          if (!self->isOpen() || self->closing_)
                              return;
                          self->writeQueue_.push_back(std::move(frame));
                          if (self->writing_)
                              return;
                          self->writing_ = true;
                          boost::asio::co_spawn(self->ws_.get_executor(), self->flush(),
                                                boost::asio::detached);
                      });
    return true;
}

boost::asio::awaitable<void> TabSession::flush() {
    auto self = shared_from_this();
    while (!writeQueue_.empty()) {
        std::string frame = std::move(writeQueue_.front());
        writeQueue_.pop_front();
        beast::error_code ec;
        co_await ws_.async_write(boost::asio::buffer(frame),
                                 boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            spdlog::debug("TabSession {} write failed: {}", id_, ec.message());
            open_.store(false, std::memory_order_release);
            writeQueue_.clear();
            break;
        }
    }
    writing_ = false;
    if (closing_ && ws_.is_open())
        sendClose();
}

void TabSession::close() {
    boost::asio::post(ws_.get_executor(), [self = shared_from_this()] {
        if (self->closing_ || !self->ws_.is_open())
            return;
        self->closing_ = true;
        self->open_.store(false, std::memory_order_release);
        self->writeQueue_.clear();
        // An in-flight write finishes first; flush() sends the close frame after it.
        if (!self->writing_)
            self->sendClose();
    });
}

void TabSession::sendClose() {
    ws_.async_close(websocket::close_code::going_away,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec)
                            spdlog::debug("TabSession {} close: {}", self->id_, ec.message());
                    });
}

boost::asio::awaitable<void> TabSession::run(FrameHandler onFrame, CloseHandler onClosed) {
    auto self = shared_from_this();
    beast::flat_buffer buffer;
    for (;;) {
        beast::error_code ec;
        co_await ws_.async_read(buffer, boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec == websocket::error::closed)
                spdlog::debug("TabSession {} closed by peer", id_);
            else
                spdlog::debug("TabSession {} read ended: {}", id_, ec.message());
            break;
        }
        if (!ws_.got_text()) {
            buffer.consume(buffer.size());
            continue;
        }
        std::string text = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        if (onFrame)
            onFrame(id_, text);
    }
    open_.store(false, std::memory_order_release);
    writeQueue_.clear();
    if (onClosed)
        onClosed(id_);
}

} // namespace pincer::server
