#include <chainfeed/core/transport/zmq_transport.hpp>
#include <zmq_addon.hpp>
#include <cerrno>
#include <iterator>
#include <vector>
#include <spdlog/spdlog.h>

namespace ChainFeed {

TransportPtr ZmqTransport::connect(zmq::context_t& context, const std::string& endpoint,
                                   const std::string& topic_filter,
                                   const ZmqTransportOptions& options) {
    try {
        auto socket = std::make_unique<zmq::socket_t>(context, zmq::socket_type::sub);
        socket->set(zmq::sockopt::linger, 0);
        socket->set(zmq::sockopt::rcvhwm, options.receive_hwm);
        if (options.tcp_keepalive) {
            socket->set(zmq::sockopt::tcp_keepalive, 1);
        }
        socket->set(zmq::sockopt::subscribe, topic_filter);
        socket->connect(endpoint);

        spdlog::info("[ZmqTransport] Subscribed to '{}' on {}",
                     topic_filter.empty() ? "*" : topic_filter, endpoint);
        return std::make_unique<ZmqTransport>(PrivateTag{}, std::move(socket), endpoint);
    } catch (const zmq::error_t& e) {
        throw ConnectError("Cannot connect SUB socket to " + endpoint + ": " + e.what());
    }
}

TransportConnector ZmqTransport::connector(zmq::context_t& context, ZmqTransportOptions options) {
    return [&context, options](const std::string& endpoint, const std::string& topic_filter) {
        return ZmqTransport::connect(context, endpoint, topic_filter, options);
    };
}

ZmqTransport::ZmqTransport(PrivateTag, std::unique_ptr<zmq::socket_t> socket, std::string endpoint)
    : socket_(std::move(socket)), endpoint_(std::move(endpoint)) {}

ZmqTransport::~ZmqTransport() {
    close();
}

std::optional<RawMultipartMessage> ZmqTransport::receive(std::chrono::milliseconds timeout) {
    if (!socket_) {
        throw TransportError("Transport to " + endpoint_ + " is closed");
    }

    try {
        zmq::pollitem_t items[] = {{socket_->handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, 1, timeout);
        if (!(items[0].revents & ZMQ_POLLIN)) {
            return std::nullopt;
        }

        // Multipart delivery is atomic: once the first part is readable, all parts are
        std::vector<zmq::message_t> parts;
        auto received = zmq::recv_multipart(*socket_, std::back_inserter(parts), zmq::recv_flags::dontwait);
        if (!received) {
            return std::nullopt;
        }

        RawMultipartMessage raw;
        raw.frames.reserve(parts.size());
        for (const auto& part : parts) {
            const auto* data = static_cast<const uint8_t*>(part.data());
            raw.frames.emplace_back(data, data + part.size());
        }
        return raw;
    } catch (const zmq::error_t& e) {
        // A signal landed on this thread; the caller decides whether to stop
        if (e.num() == EINTR) {
            return std::nullopt;
        }
        if (e.num() == ETERM) {
            throw TransportError("ZeroMQ context terminated while receiving from " + endpoint_);
        }
        throw TransportError("Receive from " + endpoint_ + " failed: " + e.what());
    }
}

void ZmqTransport::close() {
    if (!socket_) return;
    socket_->close();
    socket_.reset();
    spdlog::info("[ZmqTransport] Closed connection to {}", endpoint_);
}

} // namespace ChainFeed
