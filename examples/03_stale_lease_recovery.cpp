// 03_stale_lease_recovery.cpp
//
// Shows abandoned leases being reclaimed by the cleanup sweep.
//
// Scenario:
//   - cleanup_interval = 50ms, resource_timeout = 100ms on a virtual clock.
//   - One worker releases its lease in time; another forgets.
//   - After two cleanup ticks the forgotten lease is stale and its
//     late release is rejected with RESOURCE_STALE.

#include <leaseguard/leaseguard.hpp>

#include <iostream>
#include <string>

using namespace leaseguard;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== LeaseGuard: Stale Lease Recovery Example ===\n\n";

    auto scheduler = std::make_shared<ManualScheduler>();
    auto detector = std::make_shared<ManualResourceDetector>(DetectorConfig{}, scheduler);

    PoolConfig config;
    config.cleanup_interval = 50ms;
    config.resource_timeout = 100ms;
    ResourcePoolManager pool(detector, config, scheduler);

    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_expired_lease_alert_threshold(0, [](const std::string& msg) {
        std::cout << "[ALERT] " << msg << "\n";
    });
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    composite->add_monitor(metrics);
    pool.set_monitor(composite);

    pool.start();

    ResourceRequest diligent;
    diligent.id = "diligent-worker";
    ResourceRequest forgetful;
    forgetful.id = "forgetful-worker";

    auto good = pool.allocate(diligent);
    auto lost = pool.allocate(forgetful);
    std::cout << "Active leases: " << pool.monitor().active_leases << "\n";

    scheduler->advance(40ms);
    pool.release(good);
    std::cout << "diligent-worker released on time\n";

    scheduler->advance(110ms);
    scheduler->advance(100ms);
    std::cout << "Active leases after two sweeps: " << pool.monitor().active_leases << "\n";

    try {
        pool.release(lost);
    } catch (const StaleResourceException& e) {
        auto envelope = to_error_envelope(e);
        std::cout << "Late release: HTTP " << envelope.status_code << " " << envelope.message << "\n";
    }

    auto m = metrics->get_metrics();
    std::cout << "\nGranted: " << m.granted_leases
              << ", released: " << m.released_leases
              << ", expired: " << m.expired_leases << "\n";

    pool.dispose();
    std::cout << "\n=== Done ===\n";
    return 0;
}
