#pragma once
#include <chainfeed/core/notify/notification.hpp>
#include <chainfeed/core/notify/errors.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ChainFeed {

/**
 * @class Transport
 * @brief Subscriber connection delivering whole multipart messages in order.
 *
 * Exclusively owned by one Dispatcher. Implementations must make close()
 * idempotent and call it from their destructor.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Wait up to `timeout` for the next message
     * @return The message, or nullopt if the timeout elapsed first
     * @throws TransportError on connection loss or a closed transport
     */
    virtual std::optional<RawMultipartMessage> receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual const std::string& endpoint() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

/**
 * Opens a subscriber connection to `endpoint` filtered by `topic_filter`.
 * Throws ConnectError when the connection cannot be established.
 */
using TransportConnector =
    std::function<TransportPtr(const std::string& endpoint, const std::string& topic_filter)>;

} // namespace ChainFeed
