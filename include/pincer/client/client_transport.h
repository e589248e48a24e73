#pragma once

#include <functional>
#include <memory>
#include <string>

#include <pincer/core/types.h>

namespace pincer::client {

struct TransportHandlers {
    std::function<void()> onOpen;
    std::function<void(std::string)> onMessage;
    std::function<void(const Error&)> onError;
    std::function<void()> onClose;
};

/**
 * One client socket attempt.
 *
 * After open() the transport reports onClose exactly once, whether the attempt failed before
 * opening or an open socket ended later. onError, when reported, always precedes that onClose.
 * A transport is not reopened; a new attempt uses a new instance.
 */
class ClientTransport {
public:
    virtual ~ClientTransport() = default;

    virtual void open(const std::string& url, TransportHandlers handlers) = 0;
    // False when the socket is not open for writing.
    virtual bool send(std::string frame) = 0;
    virtual void close() = 0;
};

using TransportFactory = std::function<std::shared_ptr<ClientTransport>()>;

} // namespace pincer::client
