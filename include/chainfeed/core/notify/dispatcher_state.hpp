#pragma once
#include <cstdint>

namespace ChainFeed {

/**
 * Dispatcher lifecycle
 *
 *   IDLE -> CONNECTED -> { RECEIVING <-> DECODING } -> CLOSED
 *
 * RECEIVING is the only state in which the loop waits. CLOSED is terminal for
 * a run and is reached on transport failure, handler failure or stop().
 */
enum class DispatcherState : uint8_t {
    IDLE = 0,
    CONNECTED = 1,
    RECEIVING = 2,
    DECODING = 3,
    CLOSED = 4
};

const char* toString(DispatcherState state);

} // namespace ChainFeed
