#pragma once

#include <string>

namespace pincer::bridge {

// Write side of a live tab socket as seen by the registry. The registry only observes whether
// the socket is writable; the transport owns its lifecycle.
class TabSocket {
public:
    virtual ~TabSocket() = default;

    virtual bool isOpen() const = 0;

    // Queues one UTF-8 text frame. Returns false if the socket is no longer writable.
    virtual bool sendText(std::string frame) = 0;

    // Requests an orderly close; completion is reported through the transport's close path.
    virtual void close() = 0;
};

} // namespace pincer::bridge
