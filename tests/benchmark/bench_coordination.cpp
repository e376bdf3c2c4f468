/**
 * @file bench_coordination.cpp
 * @brief Performance benchmarks for routing, planning and fair scheduling.
 *
 * Measures the per-call overhead of the decision modules and the
 * coordinator's copy-on-write state updates.
 *
 * Usage: ./bench_coordination [--csv]
 */

#include "coordinator/system_coordinator.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "risk/risk_assessor.hpp"
#include "routing/routing_decider.hpp"
#include "scheduler/fairness_scheduler.hpp"
#include "strategy/execution_strategy.hpp"
#include "strategy/operation_planner.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace coordination_core;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

SystemState make_state(size_t components, size_t unhealthy = 0) {
    SystemState state;
    for (size_t i = 0; i < components; ++i) {
        ComponentStatus c;
        c.id = "worker-" + std::to_string(i);
        c.status = i < unhealthy ? HealthStatus::Degraded : HealthStatus::Healthy;
        c.capabilities = {"generation"};
        state.components.register_component(c);
    }
    return state;
}

Operation make_operation(size_t participants) {
    Operation op;
    op.id = "bench-op";
    op.type = "generation";
    op.initiator = "bench";
    for (size_t i = 0; i < participants; ++i) {
        op.participants.push_back("worker-" + std::to_string(i));
    }
    op.payload = GenerationPayload{10000, "bench"};
    return op;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_routing() {
    std::vector<BenchResult> R;
    constexpr size_t N = 5000;
    auto state = make_state(10);

    RouteRequest request;
    request.message.source = "worker-0";
    request.message.target = "worker-1";

    RoutingDecider router;
    R.push_back(run_bench("determine_mode(hub healthy)", "Routing", N,
        [&]{ auto d = router.determine_mode(request.message, true, false); (void)d; }));
    R.push_back(run_bench("determine_mode(direct)", "Routing", N,
        [&]{ auto d = router.determine_mode(request.message, false, true); (void)d; }));

    R.push_back(run_bench("route(with metrics)", "Routing", N,
        [&]{ auto r = router.route(state, request); (void)r; }, "history 500"));
    R.push_back(run_bench("routing_status", "Routing", 1000,
        [&]{ auto s = router.routing_status(); (void)s; }));

    return R;
}

std::vector<BenchResult> bench_planning() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    RiskAssessor risk;
    ExecutionStrategySelector selector;
    OperationPlanner planner(risk, selector);

    for (size_t n : {2, 8, 32}) {
        auto state = make_state(n, n / 4);
        auto op = make_operation(n);
        auto label = std::to_string(n) + " participants";

        R.push_back(run_bench("risk_assess(" + std::to_string(n) + ")", "Planning", N,
            [&]{ auto a = risk.assess(op, state); (void)a; }, label));
        R.push_back(run_bench("strategy_decide(" + std::to_string(n) + ")", "Planning", N,
            [&]{ auto d = selector.decide(op, state); (void)d; }, label));

        ExecuteOperationRequest request;
        request.operation = op;
        R.push_back(run_bench("plan(" + std::to_string(n) + ")", "Planning", N,
            [&]{ auto p = planner.plan(state, request); (void)p; }, label));
    }

    return R;
}

std::vector<BenchResult> bench_scheduler() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    SchedulerConfig config;
    config.aging_factor = 0.5;
    config.aging_interval_ms = 1;

    for (size_t depth : {10, 100, 1000}) {
        FairnessScheduler scheduler(config, {}, /*start_aging=*/false);
        for (size_t i = 0; i < depth; ++i) {
            ScheduledTask t;
            t.task_id = "seed-" + std::to_string(i);
            t.agent_id = "agent-" + std::to_string(i % 8);
            t.priority = 2.0 + static_cast<double>(i % 4);
            (void)scheduler.submit(std::move(t));
        }
        auto label = std::to_string(depth) + " pending";

        // The benchmark task outranks every seeded one, so depth stays constant
        size_t seq = 0;
        R.push_back(run_bench("submit_next_complete(" + std::to_string(depth) + ")", "Scheduler", N,
            [&]{
                ScheduledTask t;
                t.task_id = "bench-" + std::to_string(seq++);
                t.agent_id = "bench";
                t.priority = ScheduledTask::kHighestPriority;
                (void)scheduler.submit(std::move(t));
                if (auto next = scheduler.next()) {
                    (void)scheduler.complete(TaskResult{next->task_id, next->agent_id, true, Millis{1}, {}});
                }
            }, label));

        FairnessScheduler aging(config, {}, /*start_aging=*/false);
        for (size_t i = 0; i < depth; ++i) {
            ScheduledTask t;
            t.task_id = "age-" + std::to_string(i);
            t.agent_id = "agent-" + std::to_string(i % 8);
            t.priority = 5.0;
            (void)aging.submit(std::move(t));
        }
        R.push_back(run_bench("aging_pass(" + std::to_string(depth) + ")", "Scheduler", 200,
            [&]{ aging.run_aging_pass(); }, label));
    }

    return R;
}

std::vector<BenchResult> bench_coordinator() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    SystemCoordinator::Options opts;
    opts.config = default_config();
    opts.log_sink = std::make_unique<NullSink>();
    opts.start_background = false;
    SystemCoordinator coordinator(std::move(opts));

    for (size_t i = 0; i < 16; ++i) {
        ComponentStatus c;
        c.id = "worker-" + std::to_string(i);
        c.status = HealthStatus::Healthy;
        coordinator.register_component(c);
    }

    UnifiedMessage message;
    message.source = "worker-0";
    message.target = "worker-1";
    R.push_back(run_bench("send_message+drain", "Coordinator", N, [&]{
        auto r = coordinator.send_message(message); (void)r;
        auto d = coordinator.drain_messages(RoutingMode::Hub, 1); (void)d;
    }));

    size_t seq = 0;
    auto op = make_operation(2);
    op.priority = Priority::P0;
    R.push_back(run_bench("start+complete_operation", "Coordinator", N, [&]{
        op.id = "bench-" + std::to_string(seq++);
        if (coordinator.start_operation(op).has_value()) {
            auto r = coordinator.complete_operation(op.id, true, Millis{1}); (void)r;
        }
    }, "16 components"));

    R.push_back(run_bench("check_health", "Coordinator", N,
        [&]{ auto e = coordinator.check_health(); (void)e; }, "16 components"));
    R.push_back(run_bench("validate_system", "Coordinator", N,
        [&]{ auto v = coordinator.validate_system(); (void)v; }, "16 components"));

    coordinator.shutdown();
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  Coordination Core Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_routing());
    append(bench_planning());
    append(bench_scheduler());
    append(bench_coordinator());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
