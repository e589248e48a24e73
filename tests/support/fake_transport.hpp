#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <pincer/client/client_transport.h>

namespace pincer::test_support {

// Scripted ClientTransport; the test drives open/message/error/close by hand.
class FakeTransport : public client::ClientTransport {
public:
    void open(const std::string& url, client::TransportHandlers handlers) override {
        openedUrl = url;
        handlers_ = std::move(handlers);
        ++openCalls;
        if (failOnOpen)
            fail("connection refused");
    }

    bool send(std::string frame) override {
        if (!connected)
            return false;
        sent.push_back(std::move(frame));
        return true;
    }

    void close() override {
        connected = false;
        ++closeCalls;
        if (closeHook)
            closeHook();
    }

    void simulateOpen() {
        connected = true;
        if (handlers_.onOpen)
            handlers_.onOpen();
    }
    void simulateMessage(std::string text) {
        if (handlers_.onMessage)
            handlers_.onMessage(std::move(text));
    }
    void simulateError(const std::string& what) {
        if (handlers_.onError)
            handlers_.onError(Error{ErrorCode::NetworkError, what});
    }
    void simulateClose() {
        connected = false;
        if (handlers_.onClose)
            handlers_.onClose();
    }
    // Error followed by its close, as a real socket reports a failed attempt.
    void fail(const std::string& what) {
        simulateError(what);
        simulateClose();
    }

    std::string openedUrl;
    std::vector<std::string> sent;
    bool connected = false;
    bool failOnOpen = false;
    int openCalls = 0;
    int closeCalls = 0;
    // Runs inside close(), e.g. to fire host callbacks during teardown.
    std::function<void()> closeHook;

private:
    client::TransportHandlers handlers_;
};

// Hands out FakeTransports and keeps them for inspection.
struct FakeTransportFactory {
    std::vector<std::shared_ptr<FakeTransport>> created;
    bool failOnOpen = false;

    client::TransportFactory make() {
        return [this]() -> std::shared_ptr<client::ClientTransport> {
            auto t = std::make_shared<FakeTransport>();
            t->failOnOpen = failOnOpen;
            created.push_back(t);
            return t;
        };
    }

    FakeTransport& last() { return *created.back(); }
};

} // namespace pincer::test_support
