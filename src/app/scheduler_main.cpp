/**
 * @file scheduler_main.cpp
 * @brief tco_scheduler daemon entry point.
 *
 * Wires all modules into a running scheduler:
 *   Config → Logger → Telemetry → Executor → SchedulerService → RPC server
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/job_executor.hpp"
#include "executor/simulated_executor.hpp"
#include "rpc/rpc_server.hpp"
#include "service/scheduler_service.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <charconv>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace tco_scheduler;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint16_t port = 0;
    std::string log_dir;
    std::string log_level;
};

void print_usage() {
    std::cout << "Usage: tco_scheduler [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --port <port>        RPC listen port (overrides scheduler.listen_port)\n"
              << "  --log-dir <path>     Log output directory (default: stdout)\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  --help, -h           Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            std::string_view text = argv[++i];
            unsigned port = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
            if (ec != std::errc{} || ptr != text.data() + text.size() || port > 65535) {
                return Error{ErrorCode::InvalidArgument, "invalid port: " + std::string{text}};
            }
            args.port = static_cast<uint16_t>(port);
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorCode::InvalidArgument, "unknown option: " + arg};
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_metrics_sink(const TelemetryConfig& telemetry) {
    if (telemetry.metrics_file.empty()) {
        return std::make_unique<NullSink>();
    }
    std::filesystem::path path = telemetry.metrics_file;
    auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path{"."};
    return std::make_unique<JsonFileSink>(dir, path.stem().string(),
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << "\n";
        print_usage();
        return 1;
    }
    auto args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.port != 0) config.scheduler.listen_port = args.port;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.telemetry.log_level
                  << "', using info" << std::endl;
    }

    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "tco_scheduler",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info));
    logger.info("main", "tco_scheduler starting: cluster=" + config.scheduler.cluster_id
                + " port=" + std::to_string(config.scheduler.listen_port)
                + " latency_model=" + config.latency.model
                + " executor=" + config.executor.mode);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Telemetry ─────────────────
    MetricsCollector metrics(make_metrics_sink(config.telemetry));

    // ── Initialize Executor ──────────────────
    auto mailbox = std::make_shared<ExecutorMailbox>();
    std::shared_ptr<IJobExecutor> executor;
    if (config.executor.mode == "simulated") {
        executor = std::make_shared<SimulatedExecutor>(config.executor, mailbox, logger);
    } else {
        executor = std::make_shared<ExternalExecutor>();
    }

    // ── Initialize Scheduler ─────────────────
    auto service_result = SchedulerService::create(config, executor, mailbox, logger, &metrics);
    if (!service_result) {
        logger.error("main", "cannot create scheduler: " + service_result.error().message);
        return 1;
    }
    auto& service = **service_result;

    for (const auto& node : config.nodes) {
        if (auto registered = service.register_node(to_node_spec(node)); !registered) {
            logger.error("main", "static node " + node.id + " rejected: "
                         + registered.error().message);
        }
    }

    service.start();

    // ── Initialize RPC Server ────────────────
    SchedulerRpcServer server(service, logger);
    auto bound = server.start(config.scheduler.listen_port);
    if (!bound) {
        logger.error("main", "cannot start RPC server: " + bound.error().message);
        service.stop();
        return 1;
    }

    logger.info("main", "ready on port " + std::to_string(*bound) + "; Ctrl+C to shut down");

    // ── Main Loop ────────────────────────────
    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto status = service.cluster_status();
            logger.info("main", "status: nodes " + std::to_string(status.active_nodes) + "/"
                        + std::to_string(status.total_nodes) + " active, jobs "
                        + std::to_string(status.running_jobs) + " running of "
                        + std::to_string(status.total_jobs));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("main", "shutdown requested");
    server.stop();
    service.stop();
    metrics.flush();
    logger.info("main", "tco_scheduler stopped");
    logger.flush();
    return 0;
}
