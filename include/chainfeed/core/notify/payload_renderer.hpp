#pragma once
#include <chainfeed/core/notify/notification.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ChainFeed {

enum class RenderMode : uint8_t {
    HEX = 0,
    RAW = 1,
    UTF8_IF_PRINTABLE = 2
};

/**
 * @brief Application-visible view of one record
 *
 * text holds the hex or UTF-8 rendering (empty in RAW mode),
 * bytes holds the payload copy (RAW mode only).
 * mode is the requested mode, effective_mode is what was actually produced.
 */
struct RenderedView {
    std::string topic;
    uint32_t sequence = 0;
    RenderMode mode = RenderMode::HEX;
    RenderMode effective_mode = RenderMode::HEX;
    std::string text;
    std::vector<uint8_t> bytes;

    bool fellBackToHex() const {
        return mode == RenderMode::UTF8_IF_PRINTABLE && effective_mode == RenderMode::HEX;
    }
};

/**
 * @brief Render a record's payload. Pure, never fails, never touches the record.
 */
RenderedView render(const NotificationRecord& record, RenderMode mode);

// Lowercase, two characters per byte, high nibble first
std::string hexEncode(const uint8_t* data, size_t len);
std::string hexEncode(const std::vector<uint8_t>& bytes);

/**
 * @brief Inverse of hexEncode, accepts both cases
 * @return nullopt on odd length or a non-hex character
 */
std::optional<std::vector<uint8_t>> hexDecode(std::string_view hex);

// Valid UTF-8 without control characters other than tab, CR and LF
bool isPrintableUtf8(const std::vector<uint8_t>& bytes);

const char* toString(RenderMode mode);
std::optional<RenderMode> renderModeFromString(std::string_view name);

} // namespace ChainFeed
