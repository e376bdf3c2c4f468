/**
 * @file main.cpp
 * @brief Coordination core daemon entry point.
 *
 * Wires the modules into a running coordinator:
 *   Config → Logger → SystemCoordinator (registry, routing, planning,
 *   scheduler, health, events) → Telemetry
 */

#include "coordinator/system_coordinator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "events/event_bus.hpp"
#include "telemetry/json_sink.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace coordination_core;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║        Coordination Core v1.0.0           ║
  ║   Routing, Planning and Fair Scheduling   ║
  ║   for Cooperating Components              ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::string log_level;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: coordination_core [OPTIONS]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>     Log output directory\n"
                      << "  --log-level <level>  debug | info | warn | error\n"
                      << "  --demo               Run a single coordination demo, then exit\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return args;
}

ComponentStatus make_component(ComponentId id, HealthStatus status,
                               std::vector<ComponentId> deps = {},
                               std::vector<std::string> caps = {}) {
    ComponentStatus component;
    component.id = std::move(id);
    component.status = status;
    component.dependencies = std::move(deps);
    component.capabilities = std::move(caps);
    component.version = "1.0.0";
    return component;
}

Operation make_operation(OperationId id, std::string type, std::vector<ComponentId> participants,
                         Priority priority = Priority::P2) {
    Operation op;
    op.id = std::move(id);
    op.type = std::move(type);
    op.initiator = "qa-generator";
    op.participants = std::move(participants);
    op.priority = priority;
    return op;
}

/**
 * @brief Run a single demo: register components, route messages, start one
 *        operation per strategy, drain the scheduler and export metrics.
 */
void run_demo(SystemCoordinator& coordinator) {
    auto& logger = coordinator.logger();
    logger.info("=== Demo Mode ===");

    std::atomic<size_t> dispatches{0};
    auto sub = coordinator.events().subscribe("operation:execute:worker-a",
        [&dispatches](const CoordinationEvent&) { dispatches.fetch_add(1); });
    if (!sub) {
        logger.warn("Demo subscription failed", {{"error", sub.error().message}});
    }

    coordinator.register_component(make_component("hub", HealthStatus::Healthy));
    coordinator.register_component(make_component("worker-a", HealthStatus::Healthy, {"hub"},
                                                  {"generation"}));
    coordinator.register_component(make_component("worker-b", HealthStatus::Healthy, {"hub"},
                                                  {"generation", "validation"}));
    coordinator.register_component(make_component("worker-c", HealthStatus::Healthy, {"hub"}));
    coordinator.register_component(make_component("exporter", HealthStatus::Starting, {"hub"}));
    coordinator.check_health({{"exporter", HealthStatus::Degraded}});

    // Messages
    UnifiedMessage broadcast;
    broadcast.source = "hub";
    broadcast.target = std::string{kBroadcastTarget};
    broadcast.payload = R"({"notice":"cycle start"})";

    UnifiedMessage request;
    request.source = "worker-a";
    request.target = "worker-b";
    request.type = MessageType::Request;
    request.payload = R"({"need":"validation"})";

    for (const auto& message : {broadcast, request}) {
        auto routed = coordinator.send_message(message);
        if (routed) {
            logger.info("Demo message routed",
                        {{"target", message.target},
                         {"mode", std::string{to_string(routed->decision.mode)}}});
        } else {
            logger.warn("Demo message refused", {{"error", routed.error().message}});
        }
    }

    // One operation per strategy
    Operation distributed = make_operation("op-distributed", "generation",
                                           {"worker-a", "worker-b", "worker-c"});
    distributed.payload = GenerationPayload{100, "demo-set"};

    Operation delegated = make_operation("op-delegated", "validation", {"exporter", "worker-b"});
    delegated.required_capabilities = {"validation"};

    Operation queued = make_operation("op-queued", "maintenance", {"exporter"}, Priority::P1);
    queued.payload = MaintenancePayload{"compact"};

    struct DemoRun {
        Operation operation;
        StartOperationOptions options;
    };
    std::vector<DemoRun> runs{
        {make_operation("op-immediate", "generation", {"worker-a", "worker-b"}), {}},
        {distributed, {}},
        {delegated, {}},
        {queued, {true, false}},
    };

    for (auto& run : runs) {
        auto started = coordinator.start_operation(run.operation, run.options);
        if (!started) {
            logger.warn("Demo operation refused", {{"operation", run.operation.id},
                                                   {"error", started.error().message}});
        }
    }

    auto pulled = coordinator.dispatch_queued(10);
    logger.info("Scheduler drained", {{"dispatched", std::to_string(pulled)}});

    auto snapshot = coordinator.state();
    for (const auto& [id, op] : snapshot->active_operations) {
        auto done = coordinator.complete_operation(id, true, std::chrono::milliseconds(250));
        if (!done) logger.warn("Demo completion failed", {{"error", done.error().message}});
    }

    for (auto mode : {RoutingMode::Direct, RoutingMode::Hub, RoutingMode::Fallback}) {
        auto drained = coordinator.drain_messages(mode, 100);
        logger.info("Drained messages", {{"mode", std::string{to_string(mode)}},
                                         {"count", std::to_string(drained.size())}});
    }

    auto report = coordinator.validate_system();
    logger.info("Validation", {{"valid", report.valid ? "true" : "false"},
                               {"warnings", std::to_string(report.warnings.size())},
                               {"errors", std::to_string(report.errors.size())}});

    auto exported = coordinator.export_metrics();
    logger.info("Demo summary",
                {{"health", std::to_string(exported.status.health)},
                 {"messages", std::to_string(exported.routing.metrics.total_messages)},
                 {"recommended_mode", std::string{to_string(exported.routing.recommended_mode)}},
                 {"worker_a_dispatches", std::to_string(dispatches.load())}});

    logger.info("=== Demo Complete ===");
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.telemetry.log_level
                  << "', using info." << std::endl;
    }

    // ── Initialize Sinks ─────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "coordination_core",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    }

    SystemCoordinator::Options options;
    options.config = config;
    options.log_sink = std::move(log_sink);
    options.log_level = level.value_or(LogLevel::Info);
    options.metrics_sink = std::move(metrics_sink);
    options.start_background = !args.demo_mode;

    SystemCoordinator coordinator(std::move(options));
    auto& logger = coordinator.logger();
    logger.info("Coordination core starting...",
                {{"config", args.config_path.string()},
                 {"log_dir", config.telemetry.log_dir.string()},
                 {"quotas", std::to_string(config.scheduler.quotas.size())}});

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        run_demo(coordinator);
        coordinator.shutdown();
        return 0;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 60 seconds at 100ms intervals)
        if (loop_count % 600 == 0 && loop_count > 0) {
            auto status = coordinator.get_system_status();
            logger.info("Status",
                        {{"health", std::to_string(status.health)},
                         {"components", std::to_string(status.components_healthy) + "/"
                                        + std::to_string(status.components_total)},
                         {"active_operations", std::to_string(status.active_operations)},
                         {"queued_messages", std::to_string(status.queued_messages)},
                         {"pending_tasks", std::to_string(status.pending_tasks)}});
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    coordinator.shutdown();
    logger.info("Coordination core stopped.");
    return 0;
}
