// 01_basic_usage.cpp
//
// Minimal LeaseGuard example: a pool of 3 slots on the real host.
// Demonstrates allocation, fail-fast exhaustion, release, and the
// error envelope a service edge would return.
//
// Scenario:
//   - A pool with max_pool_size = 3 reads the host through
//     SystemResourceDetector.
//   - Three requests are granted; the fourth gets POOL_EXHAUSTED.
//   - Releasing one lease frees a slot and a repeated shape is served
//     from the lease cache.

#include <leaseguard/leaseguard.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace leaseguard;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== LeaseGuard: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the detector and the pool.
    // ----------------------------------------------------------------
    auto scheduler = std::make_shared<ThreadScheduler>();
    auto detector = std::make_shared<SystemResourceDetector>(DetectorConfig{}, scheduler);

    PoolConfig config;
    config.max_pool_size = 3;
    config.min_pool_size = 1;
    config.resource_timeout = 10s;
    ResourcePoolManager pool(detector, config, scheduler);

    pool.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Start background cleanup and health sampling.
    // ----------------------------------------------------------------
    pool.start();

    // ----------------------------------------------------------------
    // 3. Fill the pool.
    // ----------------------------------------------------------------
    std::vector<Lease> leases;
    for (int i = 0; i < 3; ++i) {
        ResourceRequest req;
        req.id = "job-" + std::to_string(i);
        req.kind = ResourceKind::Memory;
        req.requirements.memory = 64.0 * 1024.0;
        leases.push_back(pool.allocate(req));
        std::cout << "Granted lease " << leases.back().id << " to " << req.id << "\n";
    }

    // ----------------------------------------------------------------
    // 4. One request too many fails fast.
    // ----------------------------------------------------------------
    std::cout << "\n--- job-3 asks for a fourth slot ---\n";
    try {
        ResourceRequest req;
        req.id = "job-3";
        pool.allocate(req);
    } catch (const PoolExhaustedException& e) {
        auto envelope = to_error_envelope(e);
        std::cout << "HTTP " << envelope.status_code << " " << envelope.message
                  << (envelope.retryable ? " (retry later)" : "") << "\n";
    }

    // ----------------------------------------------------------------
    // 5. Release and re-allocate the same shape.
    // ----------------------------------------------------------------
    std::cout << "\n--- Releasing job-0 and retrying with the same shape ---\n";
    pool.release(leases[0]);

    ResourceRequest retry;
    retry.id = "job-3";
    retry.kind = ResourceKind::Memory;
    retry.requirements.memory = 64.0 * 1024.0;
    auto reused = pool.allocate(retry);
    std::cout << "Lease " << reused.id << (reused.from_cache ? " served from cache" : "") << "\n";

    // ----------------------------------------------------------------
    // 6. Show the pool status.
    // ----------------------------------------------------------------
    auto status = pool.monitor();
    std::cout << "\n=== Pool Status ===\n";
    std::cout << "Health: " << to_pool_label(status.health) << "\n";
    std::cout << "Active leases: " << status.active_leases << " / " << status.max_pool_size << "\n";
    std::cout << "Utilization: " << status.utilization * 100.0 << "%\n";

    auto metrics = pool.get_metrics();
    std::cout << "Cache hit rate: " << metrics.cache_hit_rate() * 100.0 << "%\n\n";

    // ----------------------------------------------------------------
    // 7. Release everything and stop.
    // ----------------------------------------------------------------
    pool.release(leases[1]);
    pool.release(leases[2]);
    pool.release(reused);
    pool.dispose();

    std::cout << "\n=== Done ===\n";
    return 0;
}
