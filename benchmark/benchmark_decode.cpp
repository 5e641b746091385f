// ============================================================================
// BENCHMARK: NOTIFICATION DECODE PATH
// ============================================================================
// Cost of the per-message work a Dispatcher does between two receives:
// 1. classify()            (frame checks + LE sequence)
// 2. render() hex          (32-byte hash and 250-byte raw tx)
// 3. SequenceTracker       (per-topic gap check)
// ============================================================================

#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <spdlog/spdlog.h>

#include <chainfeed/core/notify/frame_classifier.hpp>
#include <chainfeed/core/notify/payload_renderer.hpp>
#include <chainfeed/core/notify/sequence_tracker.hpp>

using namespace ChainFeed;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t elapsed_ns;
    double ops_per_sec;
    double ns_per_op;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    std::cout << std::left << std::setw(30) << r.name
              << std::right
              << std::setw(12) << r.total_ops << " ops | "
              << std::setw(10) << std::fixed << std::setprecision(2) << (r.ops_per_sec / 1e6) << "M ops/s | "
              << std::setw(8) << std::fixed << std::setprecision(1) << r.ns_per_op << " ns/op"
              << std::endl;
}

RawMultipartMessage makeMessage(const std::string& topic, size_t payload_size, uint32_t seq) {
    RawMultipartMessage raw;
    raw.frames.emplace_back(topic.begin(), topic.end());
    raw.frames.emplace_back(payload_size, static_cast<uint8_t>(seq));
    raw.frames.push_back({static_cast<uint8_t>(seq), static_cast<uint8_t>(seq >> 8),
                          static_cast<uint8_t>(seq >> 16), static_cast<uint8_t>(seq >> 24)});
    return raw;
}

template <typename Fn>
BenchmarkResult run(const std::string& name, uint64_t num_ops, Fn&& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < num_ops; ++i) {
        fn(i);
    }
    auto end = std::chrono::high_resolution_clock::now();
    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    if (elapsed_ns == 0) elapsed_ns = 1;
    return {name, num_ops, elapsed_ns, (num_ops * 1e9) / elapsed_ns, (double)elapsed_ns / num_ops};
}

// ============================================================================
// SCENARIOS
// ============================================================================

int main() {
    spdlog::set_level(spdlog::level::warn);
    constexpr uint64_t kOps = 1'000'000;

    print_header("classify()");
    size_t sink = 0;
    print_result(run("classify hashblock (32B)", kOps, [&](uint64_t i) {
        auto record = classify(makeMessage("hashblock", 32, static_cast<uint32_t>(i)));
        sink += record.sequence();
    }));
    print_result(run("classify rawtx (250B)", kOps, [&](uint64_t i) {
        auto record = classify(makeMessage("rawtx", 250, static_cast<uint32_t>(i)));
        sink += record.payload().size();
    }));

    print_header("render() hex");
    NotificationRecord hash("hashblock", std::vector<uint8_t>(32, 0xAB), 1);
    NotificationRecord tx("rawtx", std::vector<uint8_t>(250, 0xCD), 1);
    print_result(run("render hash hex", kOps, [&](uint64_t) {
        sink += render(hash, RenderMode::HEX).text.size();
    }));
    print_result(run("render rawtx hex", kOps, [&](uint64_t) {
        sink += render(tx, RenderMode::HEX).text.size();
    }));
    print_result(run("render rawtx utf8 fallback", kOps, [&](uint64_t) {
        sink += render(tx, RenderMode::UTF8_IF_PRINTABLE).text.size();
    }));

    print_header("SequenceTracker::observe()");
    SequenceTracker tracker;
    const std::string topics[] = {"hashblock", "hashtx", "rawblock", "rawtx"};
    print_result(run("observe 4 topics contiguous", kOps, [&](uint64_t i) {
        if (tracker.observe(topics[i % 4], static_cast<uint32_t>(i / 4))) ++sink;
    }));

    std::cout << "\n(sink " << sink << ")" << std::endl;
    return 0;
}
