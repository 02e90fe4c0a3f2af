#pragma once

#include "leaseguard/config.hpp"
#include "leaseguard/scheduler.hpp"
#include "leaseguard/types.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace leaseguard {

// Raw host readings before classification
struct MemoryUsage {
    double total{0.0};
    double available{0.0};
    double used{0.0};
};

struct CpuUsage {
    std::size_t cores{0};
    double utilization{0.0};   // percent
    std::array<double, 3> load_average{{0.0, 0.0, 0.0}};
};

struct DiskUsage {
    double total{0.0};
    double available{0.0};
    double used{0.0};
};

struct ResourceUsage {
    MemoryUsage memory;
    CpuUsage cpu;
    DiskUsage disk;
};

// Periodically refreshed snapshot of host availability.
// Subclasses only provide detect(); classification and alerts live here.
class ResourceDetector {
public:
    using UpdateCallback = std::function<void(const ResourceAvailability&)>;
    using AlertCallback = std::function<void(const ResourceAlert&)>;

    explicit ResourceDetector(DetectorConfig config = {},
                              std::shared_ptr<Scheduler> scheduler = nullptr);
    virtual ~ResourceDetector();

    ResourceDetector(const ResourceDetector&) = delete;
    ResourceDetector& operator=(const ResourceDetector&) = delete;

    // Samples immediately, then every update_interval
    void start();
    void stop();

    // Stops and drops callbacks. start() afterwards throws.
    void dispose();

    bool is_running() const;

    // Cached snapshot, sampling on first use
    ResourceAvailability get_availability();

    // Sample now. Raises an alert and throws DetectorException on failure.
    ResourceAvailability refresh();

    std::optional<ResourceAvailability> last_availability() const;

    // Scheduled ticks aborted by a throwing alert subscriber
    std::size_t failed_ticks() const { return failed_ticks_.load(); }

    void on_update(UpdateCallback cb);
    void on_alert(AlertCallback cb);

    // Per-category status is the worst threshold crossed; overall is the worst category
    ResourceAvailability classify(const ResourceUsage& usage) const;

    const DetectorConfig& config() const { return config_; }

protected:
    virtual ResourceUsage detect() = 0;

private:
    void tick();
    void check_thresholds(const ResourceAvailability& availability);
    void check_threshold(const std::string& category, double current,
                         const CategoryThresholds& threshold, Timestamp at);
    void emit_alert(const ResourceAlert& alert);

    DetectorConfig config_;
    std::shared_ptr<Scheduler> scheduler_;

    mutable std::mutex mutex_;
    std::optional<ResourceAvailability> current_;
    std::optional<TimerId> timer_;
    bool disposed_{false};

    std::mutex callback_mutex_;
    std::vector<UpdateCallback> update_callbacks_;
    std::vector<AlertCallback> alert_callbacks_;

    // Serializes sampling between the timer and explicit refreshes
    std::mutex refresh_mutex_;

    std::atomic<std::size_t> failed_ticks_{0};
};

// Scripted detector: returns whatever usage was last set, or fails on demand
class ManualResourceDetector : public ResourceDetector {
public:
    explicit ManualResourceDetector(DetectorConfig config = {},
                                    std::shared_ptr<Scheduler> scheduler = nullptr);
    ~ManualResourceDetector() override;

    void set_usage(const ResourceUsage& usage);

    // Convenience: percentages over a 16 GB / 8 core / 1 TB host
    void set_utilization(double memory_percent, double cpu_percent, double disk_percent = 50.0);

    // Every detect() throws while a failure is set
    void set_failure(std::optional<std::string> message);

    std::size_t detect_count() const;

protected:
    ResourceUsage detect() override;

private:
    mutable std::mutex usage_mutex_;
    ResourceUsage usage_;
    std::optional<std::string> failure_;
    std::size_t detect_count_{0};
};

// Linux host detector: sysinfo(2) for memory, /proc/stat for cpu, statvfs(3) for disk
class SystemResourceDetector : public ResourceDetector {
public:
    explicit SystemResourceDetector(DetectorConfig config = {},
                                    std::shared_ptr<Scheduler> scheduler = nullptr,
                                    std::string disk_path = "/");
    ~SystemResourceDetector() override;

protected:
    ResourceUsage detect() override;

private:
    MemoryUsage detect_memory() const;
    CpuUsage detect_cpu();
    DiskUsage detect_disk() const;

    std::string disk_path_;

    // Previous /proc/stat totals for delta-based utilization
    std::uint64_t prev_total_{0};
    std::uint64_t prev_idle_{0};
};

} // namespace leaseguard
