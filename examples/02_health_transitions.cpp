// 02_health_transitions.cpp
//
// Walks the pool health through warning and critical and back, on a
// virtual clock with a scripted detector.
//
// Scenario:
//   - Utilization goes 20% -> 82% -> 92% -> 20% -> 20%.
//   - The pool reports healthy, warning, critical, then warning again
//     before it is allowed back to healthy.
//   - A user guard freezes recovery during a maintenance window.
//   - An operator reset lifts a critical pool back to warning.

#include <leaseguard/leaseguard.hpp>

#include <iostream>

using namespace leaseguard;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== LeaseGuard: Health Transitions Example ===\n\n";

    auto scheduler = std::make_shared<ManualScheduler>();
    auto detector = std::make_shared<ManualResourceDetector>(DetectorConfig{}, scheduler);

    PoolConfig config;
    config.recovery.min_healthy_samples = 1;
    ResourcePoolManager pool(detector, config, scheduler);
    pool.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    auto step = [&](double percent) {
        detector->set_utilization(percent, percent);
        pool.force_update();
        scheduler->advance(1s);
        std::cout << "utilization " << percent << "% -> "
                  << to_pool_label(pool.monitor().health) << "\n";
    };

    // ----------------------------------------------------------------
    // 1. Up and back down.
    // ----------------------------------------------------------------
    for (double percent : {20.0, 82.0, 92.0, 20.0, 20.0}) {
        step(percent);
    }

    // ----------------------------------------------------------------
    // 2. Freeze recovery with a user guard.
    // ----------------------------------------------------------------
    std::cout << "\n--- Maintenance window: recovery frozen ---\n";
    bool maintenance = true;
    pool.add_health_guard(
        {"Maintenance window in progress", [&](HealthStatus, HealthStatus to) {
            return !(maintenance && to == HealthStatus::Healthy);
        }});

    step(85.0);
    step(20.0);
    step(20.0);

    maintenance = false;
    std::cout << "--- Maintenance over ---\n";
    step(20.0);

    // ----------------------------------------------------------------
    // 3. Operator reset out of critical.
    // ----------------------------------------------------------------
    std::cout << "\n--- Operator reset ---\n";
    step(95.0);
    step(95.0);
    try {
        pool.reset_health("operator");
        std::cout << "after reset -> " << to_pool_label(pool.monitor().health) << "\n";
    } catch (const GuardRejectedException& e) {
        std::cout << "reset refused: " << e.what() << "\n";
    }

    // ----------------------------------------------------------------
    // 4. Transition log.
    // ----------------------------------------------------------------
    std::cout << "\n=== Transitions ===\n";
    for (const auto& t : pool.health_manager().transitions()) {
        std::cout << "  " << to_string(t.from) << " -> " << to_string(t.to)
                  << " (" << t.reason << ")\n";
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
