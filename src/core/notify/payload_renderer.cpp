#include <chainfeed/core/notify/payload_renderer.hpp>
#include <boost/algorithm/hex.hpp>
#include <iterator>

namespace ChainFeed {

namespace {

inline bool isContinuation(uint8_t c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    boost::algorithm::hex_lower(data, data + len, std::back_inserter(out));
    return out;
}

std::string hexEncode(const std::vector<uint8_t>& bytes) {
    return hexEncode(bytes.data(), bytes.size());
}

std::optional<std::vector<uint8_t>> hexDecode(std::string_view hex) {
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    try {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(out));
    } catch (const boost::algorithm::hex_decode_error&) {
        // non_hex_input and not_enough_input (odd length) both derive from it
        return std::nullopt;
    }
    return out;
}

bool isPrintableUtf8(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        uint8_t c = bytes[i];
        if (c < 0x80) {
            if (c == 0x7F) return false;
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') return false;
            ++i;
            continue;
        }

        size_t extra;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0)      { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;

        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            if (!isContinuation(bytes[i + k])) return false;
            cp = (cp << 6) | (bytes[i + k] & 0x3F);
        }

        // Reject overlong forms, surrogates, out-of-range and C1 controls
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000))
            return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;
        if (cp >= 0x80 && cp <= 0x9F) return false;

        i += extra + 1;
    }
    return true;
}

RenderedView render(const NotificationRecord& record, RenderMode mode) {
    RenderedView view;
    view.topic = record.topic();
    view.sequence = record.sequence();
    view.mode = mode;

    const auto& payload = record.payload();
    switch (mode) {
        case RenderMode::RAW:
            view.effective_mode = RenderMode::RAW;
            view.bytes = payload;
            break;
        case RenderMode::UTF8_IF_PRINTABLE:
            if (isPrintableUtf8(payload)) {
                view.effective_mode = RenderMode::UTF8_IF_PRINTABLE;
                view.text.assign(payload.begin(), payload.end());
                break;
            }
            view.effective_mode = RenderMode::HEX;
            view.text = hexEncode(payload);
            break;
        case RenderMode::HEX:
        default:
            view.effective_mode = RenderMode::HEX;
            view.text = hexEncode(payload);
            break;
    }
    return view;
}

const char* toString(RenderMode mode) {
    switch (mode) {
        case RenderMode::HEX:               return "hex";
        case RenderMode::RAW:               return "raw";
        case RenderMode::UTF8_IF_PRINTABLE: return "utf8";
        default:                            return "UNKNOWN";
    }
}

std::optional<RenderMode> renderModeFromString(std::string_view name) {
    if (name == "hex")  return RenderMode::HEX;
    if (name == "raw")  return RenderMode::RAW;
    if (name == "utf8") return RenderMode::UTF8_IF_PRINTABLE;
    return std::nullopt;
}

} // namespace ChainFeed
