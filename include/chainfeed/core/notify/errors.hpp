#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ChainFeed {

/**
 * Error taxonomy
 *
 * Connection level (ConnectError, TransportError) always propagates to the caller.
 * Message level (DecodeError and subclasses) is contained by the Dispatcher:
 * the message is dropped and the loop keeps running.
 */

class ConnectError : public std::runtime_error {
public:
    explicit ConnectError(const std::string& what) : std::runtime_error(what) {}
};

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

enum class DecodeErrorKind : uint8_t {
    FRAME_COUNT = 0,
    ENCODING = 1,
    SEQUENCE_LENGTH = 2
};

const char* toString(DecodeErrorKind kind);

class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    DecodeErrorKind kind() const { return kind_; }

private:
    DecodeErrorKind kind_;
};

class FrameCountError : public DecodeError {
public:
    explicit FrameCountError(const std::string& what)
        : DecodeError(DecodeErrorKind::FRAME_COUNT, what) {}
};

class EncodingError : public DecodeError {
public:
    explicit EncodingError(const std::string& what)
        : DecodeError(DecodeErrorKind::ENCODING, what) {}
};

class SequenceLengthError : public DecodeError {
public:
    explicit SequenceLengthError(const std::string& what)
        : DecodeError(DecodeErrorKind::SEQUENCE_LENGTH, what) {}
};

} // namespace ChainFeed
