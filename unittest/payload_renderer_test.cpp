// ============================================================================
// PAYLOAD RENDERER UNIT TESTS
// ============================================================================
// Tests for hex / raw / utf8 rendering and hex decoding
// ============================================================================

#include <gtest/gtest.h>
#include <chainfeed/core/notify/payload_renderer.hpp>
#include <random>
#include <string>
#include <vector>

using namespace ChainFeed;

namespace {

NotificationRecord makeRecord(std::vector<uint8_t> payload, uint32_t seq = 7) {
    return NotificationRecord("rawtx", std::move(payload), seq);
}

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

// ============================================================================
// HEX MODE
// ============================================================================

TEST(PayloadRenderer, HexIsLowercaseHighNibbleFirst) {
    auto view = render(makeRecord({0x00, 0x0F, 0xA0, 0xFF, 0x3C}), RenderMode::HEX);
    EXPECT_EQ(view.text, "000fa0ff3c");
    EXPECT_EQ(view.effective_mode, RenderMode::HEX);
    EXPECT_TRUE(view.bytes.empty());
}

TEST(PayloadRenderer, HexCarriesTopicAndSequence) {
    auto view = render(makeRecord({0x01}, 42), RenderMode::HEX);
    EXPECT_EQ(view.topic, "rawtx");
    EXPECT_EQ(view.sequence, 42u);
}

TEST(PayloadRenderer, HexOfEmptyPayload) {
    auto view = render(makeRecord({}), RenderMode::HEX);
    EXPECT_EQ(view.text, "");
}

TEST(PayloadRenderer, HexLengthAndRoundTrip) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> byte(0, 255);

    for (size_t len : {1u, 31u, 32u, 33u, 250u, 4096u}) {
        std::vector<uint8_t> payload(len);
        for (auto& b : payload) b = static_cast<uint8_t>(byte(rng));

        auto record = makeRecord(payload);
        auto first = render(record, RenderMode::HEX);
        auto second = render(record, RenderMode::HEX);

        EXPECT_EQ(first.text, second.text);
        EXPECT_EQ(first.text.size(), 2 * len);

        auto decoded = hexDecode(first.text);
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(*decoded, payload);
    }
}

TEST(PayloadRenderer, RenderDoesNotTouchRecord) {
    auto record = makeRecord({0x10, 0x20, 0x30}, 9);
    render(record, RenderMode::HEX);
    render(record, RenderMode::RAW);
    render(record, RenderMode::UTF8_IF_PRINTABLE);

    EXPECT_EQ(record.payload(), std::vector<uint8_t>({0x10, 0x20, 0x30}));
    EXPECT_EQ(record.sequence(), 9u);
}

// ============================================================================
// RAW MODE
// ============================================================================

TEST(PayloadRenderer, RawCopiesBytes) {
    auto view = render(makeRecord({0xDE, 0xAD, 0xBE, 0xEF}), RenderMode::RAW);
    EXPECT_EQ(view.effective_mode, RenderMode::RAW);
    EXPECT_EQ(view.bytes, std::vector<uint8_t>({0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_TRUE(view.text.empty());
}

// ============================================================================
// UTF-8 MODE
// ============================================================================

TEST(PayloadRenderer, Utf8ForPrintableText) {
    auto view = render(makeRecord(bytesOf("hello\tworld\n")), RenderMode::UTF8_IF_PRINTABLE);
    EXPECT_EQ(view.effective_mode, RenderMode::UTF8_IF_PRINTABLE);
    EXPECT_FALSE(view.fellBackToHex());
    EXPECT_EQ(view.text, "hello\tworld\n");
}

TEST(PayloadRenderer, Utf8AcceptsMultibyte) {
    // "₿" U+20BF, "é" U+00E9
    auto view = render(makeRecord({0xE2, 0x82, 0xBF, 0x20, 0xC3, 0xA9}), RenderMode::UTF8_IF_PRINTABLE);
    EXPECT_EQ(view.effective_mode, RenderMode::UTF8_IF_PRINTABLE);
    EXPECT_EQ(view.text.size(), 6u);
}

TEST(PayloadRenderer, Utf8FallsBackToHexForBinary) {
    auto view = render(makeRecord({0x01, 0x00, 0x00, 0x00}), RenderMode::UTF8_IF_PRINTABLE);
    EXPECT_EQ(view.mode, RenderMode::UTF8_IF_PRINTABLE);
    EXPECT_EQ(view.effective_mode, RenderMode::HEX);
    EXPECT_TRUE(view.fellBackToHex());
    EXPECT_EQ(view.text, "01000000");
}

TEST(PayloadRenderer, Utf8RejectsMalformedSequences) {
    EXPECT_FALSE(isPrintableUtf8({0xC3}));                 // truncated
    EXPECT_FALSE(isPrintableUtf8({0xC0, 0xAF}));           // overlong
    EXPECT_FALSE(isPrintableUtf8({0xED, 0xA0, 0x80}));     // surrogate
    EXPECT_FALSE(isPrintableUtf8({0xF5, 0x80, 0x80, 0x80})); // beyond U+10FFFF
    EXPECT_FALSE(isPrintableUtf8({0x80}));                 // stray continuation
    EXPECT_FALSE(isPrintableUtf8({0x41, 0x7F}));           // DEL
    EXPECT_FALSE(isPrintableUtf8({0xC2, 0x85}));           // C1 control
    EXPECT_TRUE(isPrintableUtf8({}));
    EXPECT_TRUE(isPrintableUtf8(bytesOf("hashblock")));
}

// ============================================================================
// HEX DECODE & MODE NAMES
// ============================================================================

TEST(PayloadRenderer, HexDecodeAcceptsBothCases) {
    auto decoded = hexDecode("DEADbeef");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, std::vector<uint8_t>({0xDE, 0xAD, 0xBE, 0xEF}));
}

TEST(PayloadRenderer, HexDecodeRejectsInvalidInput) {
    EXPECT_FALSE(hexDecode("abc").has_value());
    EXPECT_FALSE(hexDecode("zz").has_value());
    EXPECT_FALSE(hexDecode("0g").has_value());
    ASSERT_TRUE(hexDecode("").has_value());
    EXPECT_TRUE(hexDecode("")->empty());
}

TEST(PayloadRenderer, HexDecodeRejectsTrailingNibbleAfterValidBytes) {
    EXPECT_FALSE(hexDecode("deadbee").has_value());
    EXPECT_FALSE(hexDecode("dead be").has_value());
    EXPECT_FALSE(hexDecode("00000000x0").has_value());
}

TEST(PayloadRenderer, HexEncodeOfBlockHash) {
    std::vector<uint8_t> hash(32);
    for (size_t i = 0; i < hash.size(); ++i) hash[i] = static_cast<uint8_t>(0xF0 + (i % 16));

    std::string text = hexEncode(hash);
    ASSERT_EQ(text.size(), 64u);
    EXPECT_EQ(text.substr(0, 8), "f0f1f2f3");
    EXPECT_EQ(text.find_first_of("ABCDEF"), std::string::npos);
    EXPECT_EQ(hexEncode(hash.data(), 0), "");
    EXPECT_EQ(*hexDecode(text), hash);
}

TEST(PayloadRenderer, RenderModeNames) {
    for (auto mode : {RenderMode::HEX, RenderMode::RAW, RenderMode::UTF8_IF_PRINTABLE}) {
        auto parsed = renderModeFromString(toString(mode));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, mode);
    }
    EXPECT_FALSE(renderModeFromString("base64").has_value());
}
