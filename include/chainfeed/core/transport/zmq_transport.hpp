#pragma once
#include <chainfeed/core/transport/transport.hpp>
#include <zmq.hpp>
#include <memory>
#include <string>

namespace ChainFeed {

struct ZmqTransportOptions {
    int receive_hwm = 1000;     // ZMQ_RCVHWM, 0 = unlimited
    bool tcp_keepalive = true;  // Detect half-open TCP links to the daemon
};

/**
 * @class ZmqTransport
 * @brief Transport over a ZeroMQ SUB socket.
 *
 * The context may be shared between transports (zmq::context_t is thread-safe),
 * the socket may not.
 */
class ZmqTransport : public Transport {
public:
    /**
     * @brief Open a SUB socket, apply the topic filter and connect
     * @param topic_filter Prefix filter, empty subscribes to everything
     * @throws ConnectError if the socket cannot be created or the endpoint is rejected
     */
    static TransportPtr connect(zmq::context_t& context, const std::string& endpoint,
                                const std::string& topic_filter,
                                const ZmqTransportOptions& options = {});

    // Connector bound to one context, for Dispatcher::run
    static TransportConnector connector(zmq::context_t& context, ZmqTransportOptions options = {});

private:
    // Only connect() can name the tag, so construction goes through it
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    ZmqTransport(PrivateTag, std::unique_ptr<zmq::socket_t> socket, std::string endpoint);
    ~ZmqTransport() override;

    std::optional<RawMultipartMessage> receive(std::chrono::milliseconds timeout) override;
    void close() override;
    bool isOpen() const override { return socket_ != nullptr; }
    const std::string& endpoint() const override { return endpoint_; }

private:
    std::unique_ptr<zmq::socket_t> socket_;
    std::string endpoint_;
};

} // namespace ChainFeed
