#include <chainfeed/core/notify/errors.hpp>

namespace ChainFeed {

const char* toString(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::FRAME_COUNT:      return "FrameCountError";
        case DecodeErrorKind::ENCODING:         return "EncodingError";
        case DecodeErrorKind::SEQUENCE_LENGTH:  return "SequenceLengthError";
        default:                                return "UNKNOWN";
    }
}

} // namespace ChainFeed
