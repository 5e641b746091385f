#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <zmq.hpp>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <exception>
#include <thread>
#include <chrono>
#include <memory>
#include <vector>

#include <chainfeed/core/config/loader.hpp>
#include <chainfeed/core/notify/dispatcher.hpp>
#include <chainfeed/core/notify/payload_renderer.hpp>
#include <chainfeed/core/notify/sequence_payload.hpp>
#include <chainfeed/core/notify/topic_table.hpp>
#include <chainfeed/core/transport/zmq_transport.hpp>

using namespace ChainFeed;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Console output
// ============================================================================

/**
 * Prints one line per record on stdout through a bare "%v" logger, so that
 * diagnostics (stderr, default logger) and data never interleave.
 */
class ConsoleNotificationHandler : public NotificationHandler {
public:
    ConsoleNotificationHandler(std::shared_ptr<spdlog::logger> out, std::shared_ptr<const TopicTable> topics)
        : out_(std::move(out)), topics_(std::move(topics)) {}

    void onRecord(NotificationRecord record) override {
        if (record.topic() == "sequence") {
            printSequenceNotice(record);
            return;
        }

        RenderedView view = render(record, topics_->modeFor(record.topic()));
        if (view.effective_mode == RenderMode::RAW) {
            out_->info("{} #{} <{} bytes>", view.topic, view.sequence, view.bytes.size());
            return;
        }
        out_->info("{} #{} {}", view.topic, view.sequence, view.text);
    }

    void onDecodeError(const std::string& topic_hint, const DecodeError& error) override {
        spdlog::warn("Skipping malformed notification (topic '{}'): {}", topic_hint, error.what());
    }

    void onGap(const SequenceGap& gap) override {
        spdlog::warn("{}: notifications missed (expected #{}, got #{})", gap.topic, gap.expected, gap.actual);
    }

    const char* name() const override { return "ConsoleNotificationHandler"; }

private:
    void printSequenceNotice(const NotificationRecord& record) {
        try {
            SequenceNotice notice = decodeSequencePayload(record.payload());
            if (notice.mempool_sequence) {
                out_->info("sequence #{} {} {} mempool_seq={}", record.sequence(), notice.hash_hex,
                           toString(notice.label), *notice.mempool_sequence);
            } else {
                out_->info("sequence #{} {} {}", record.sequence(), notice.hash_hex, toString(notice.label));
            }
        } catch (const EncodingError& e) {
            spdlog::warn("Undecodable sequence payload #{}: {}", record.sequence(), e.what());
            out_->info("sequence #{} {}", record.sequence(), hexEncode(record.payload()));
        }
    }

    std::shared_ptr<spdlog::logger> out_;
    std::shared_ptr<const TopicTable> topics_;
};

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

// argv: [config.yaml] [endpoint] [topic]
static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig(configPath);

    ConfigLoader::applyOverrides(config, (argc > 2) ? argv[2] : "", (argc > 3) ? argv[3] : "");
    return config;
}

static DispatcherOptions makeDispatcherOptions(const AppConfig::AppConfiguration& config,
                                               const std::string& topic) {
    DispatcherOptions options;
    options.name = topic;
    options.poll_interval = std::chrono::milliseconds(config.subscriber.receive_timeout_ms);
    options.limits.max_topic_length = config.decoder.max_topic_length;
    options.gap_policy.enabled = config.gap_detection.enabled;
    options.gap_policy.allow_wraparound = config.gap_detection.allow_wraparound;
    options.gap_policy.reset_on_reconnect = config.gap_detection.reset_on_reconnect;
    options.dead_letter_capacity = config.dead_letter.capacity;
    return options;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Worker {
    std::string topic;
    std::unique_ptr<Dispatcher> dispatcher;
    std::thread thread;
    std::atomic<bool> finished{false};
    std::exception_ptr error;
};

int main(int argc, char* argv[]) {
    spdlog::info("chainfeed starting...");

    AppConfig::AppConfiguration config;
    try {
        config = loadConfiguration(argc, argv);
    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return EXIT_FAILURE;
    }

    setupLogging(config.logging);
    setupSignalHandlers();

    auto out = spdlog::stdout_logger_mt("records");
    out->set_pattern("%v");
    out->set_level(spdlog::level::info);

    std::vector<TopicSetting> settings;
    for (const auto& t : config.subscriber.topics) {
        settings.push_back(TopicSetting{t.name, renderModeFromString(t.render).value_or(RenderMode::HEX)});
    }
    auto topics = std::make_shared<TopicTable>();
    topics->Load(settings);

    auto handler = std::make_shared<ConsoleNotificationHandler>(out, topics);

    zmq::context_t context(1);
    ZmqTransportOptions transportOptions;
    transportOptions.receive_hwm = config.subscriber.receive_hwm;
    transportOptions.tcp_keepalive = config.subscriber.tcp_keepalive;
    TransportConnector connector = ZmqTransport::connector(context, transportOptions);

    // One dispatcher, socket and thread per topic
    std::vector<std::unique_ptr<Worker>> workers;
    for (const auto& t : config.subscriber.topics) {
        auto w = std::make_unique<Worker>();
        w->topic = t.name;
        w->dispatcher = std::make_unique<Dispatcher>(handler, makeDispatcherOptions(config, t.name));
        workers.push_back(std::move(w));
    }

    spdlog::info("Subscribing to {} topic(s) on {}", workers.size(), config.subscriber.endpoint);
    for (auto& w : workers) {
        Worker* worker = w.get();
        worker->thread = std::thread([worker, &connector, &config]() {
            try {
                worker->dispatcher->run(connector, config.subscriber.endpoint, worker->topic);
            } catch (const std::exception& e) {
                spdlog::error("[{}] listener stopped: {}", worker->topic, e.what());
                worker->error = std::current_exception();
            }
            worker->finished.store(true, std::memory_order_release);
        });
    }

    spdlog::info("Press Ctrl+C to shutdown");

    // Main loop - until a signal arrives or any listener dies
    bool failed = false;
    while (g_running.load(std::memory_order_acquire) && !failed) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        for (const auto& w : workers) {
            if (w->finished.load(std::memory_order_acquire)) {
                failed = true;
            }
        }
    }

    spdlog::info("Shutting down listeners...");
    for (auto& w : workers) {
        w->dispatcher->stop();
    }

    int exitCode = EXIT_SUCCESS;
    for (auto& w : workers) {
        if (w->thread.joinable()) {
            w->thread.join();
        }
        auto m = w->dispatcher->metrics();
        spdlog::info("[{}] received={} emitted={} decode_errors={} gaps={}", w->topic,
                     m.total_messages_received, m.total_records_emitted,
                     m.total_decode_errors, m.total_gaps_detected);
        if (w->error) {
            exitCode = EXIT_FAILURE;
        }
    }

    spdlog::info("chainfeed shutdown complete");
    return exitCode;
}
