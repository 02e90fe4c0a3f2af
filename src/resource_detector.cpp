#include "leaseguard/resource_detector.hpp"
#include "leaseguard/exceptions.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <sstream>
#include <thread>

#include <sys/statvfs.h>
#include <sys/sysinfo.h>
#include <unistd.h>

namespace leaseguard {

namespace {

HealthStatus status_for(double utilization, const CategoryThresholds& t) {
    if (utilization >= t.critical) return HealthStatus::Unhealthy;
    if (utilization >= t.warning) return HealthStatus::Degraded;
    return HealthStatus::Healthy;
}

double percent(double used, double total, const char* category) {
    if (!(total > 0.0)) {
        throw DetectorException(std::string("Detected ") + category + " total is not positive",
                                {{"category", category}, {"total", std::to_string(total)}});
    }
    return used / total * 100.0;
}

} // anonymous namespace

// ========== ResourceDetector ==========

ResourceDetector::ResourceDetector(DetectorConfig config, std::shared_ptr<Scheduler> scheduler)
    : config_(std::move(config))
    , scheduler_(scheduler ? std::move(scheduler) : std::make_shared<ThreadScheduler>()) {
    validate(config_);
}

ResourceDetector::~ResourceDetector() {
    stop();
}

void ResourceDetector::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            throw ValidationException("Detector has been disposed");
        }
        if (timer_.has_value()) {
            return;
        }
        timer_ = scheduler_->schedule_every(config_.update_interval, [this] { tick(); });
    }

    // Initial sample
    tick();
}

void ResourceDetector::stop() {
    std::optional<TimerId> timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timer.swap(timer_);
    }
    if (timer.has_value()) {
        scheduler_->cancel(timer.value());
    }
}

void ResourceDetector::dispose() {
    stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disposed_ = true;
    }
    std::lock_guard<std::mutex> lock(callback_mutex_);
    update_callbacks_.clear();
    alert_callbacks_.clear();
}

bool ResourceDetector::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_.has_value();
}

ResourceAvailability ResourceDetector::get_availability() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_.has_value()) {
            return current_.value();
        }
    }
    return refresh();
}

ResourceAvailability ResourceDetector::refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    ResourceAvailability availability;
    try {
        availability = classify(detect());
    } catch (const std::exception& e) {
        ResourceAlert alert;
        alert.category = "detector";
        alert.severity = HealthStatus::Unhealthy;
        alert.message = std::string("Resource detection failed: ") + e.what();
        alert.timestamp = scheduler_->now();
        emit_alert(alert);

        if (dynamic_cast<const DetectorException*>(&e) != nullptr) {
            throw;
        }
        throw DetectorException(alert.message);
    }
    availability.timestamp = scheduler_->now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = availability;
    }

    check_thresholds(availability);

    std::vector<UpdateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = update_callbacks_;
    }
    for (const auto& cb : callbacks) {
        try {
            cb(availability);
        } catch (const std::exception& e) {
            // The snapshot is still good; report the subscriber and keep going
            ResourceAlert alert;
            alert.category = "detector";
            alert.severity = HealthStatus::Degraded;
            alert.message = std::string("Update callback failed: ") + e.what();
            alert.timestamp = availability.timestamp;
            emit_alert(alert);
        }
    }

    return availability;
}

std::optional<ResourceAvailability> ResourceDetector::last_availability() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ResourceDetector::on_update(UpdateCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    update_callbacks_.push_back(std::move(cb));
}

void ResourceDetector::on_alert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    alert_callbacks_.push_back(std::move(cb));
}

ResourceAvailability ResourceDetector::classify(const ResourceUsage& usage) const {
    ResourceAvailability a;

    double mem = percent(usage.memory.used, usage.memory.total, "memory");
    double disk = percent(usage.disk.used, usage.disk.total, "disk");

    HealthStatus mem_status = status_for(mem, config_.memory);
    HealthStatus cpu_status = status_for(usage.cpu.utilization, config_.cpu);
    HealthStatus disk_status = status_for(disk, config_.disk);

    a.memory.utilization_percent = mem;
    a.memory.available_amount = usage.memory.available;
    a.memory.is_available = mem_status != HealthStatus::Unhealthy;

    a.cpu.utilization_percent = usage.cpu.utilization;
    a.cpu.available_amount = static_cast<double>(usage.cpu.cores);
    a.cpu.is_available = cpu_status != HealthStatus::Unhealthy;

    a.disk.utilization_percent = disk;
    a.disk.available_amount = usage.disk.available;
    a.disk.is_available = disk_status != HealthStatus::Unhealthy;

    a.status = std::max({mem_status, cpu_status, disk_status},
                        [](HealthStatus l, HealthStatus r) { return severity(l) < severity(r); });
    return a;
}

void ResourceDetector::tick() {
    try {
        refresh();
    } catch (const LeaseGuardException&) {
        // Already reported through the alert callbacks; keep the last snapshot
    } catch (const std::exception&) {
        // An alert subscriber threw; nothing may escape the scheduler worker
        failed_ticks_.fetch_add(1);
    }
}

void ResourceDetector::check_thresholds(const ResourceAvailability& availability) {
    check_threshold("memory", availability.memory.utilization_percent, config_.memory,
                    availability.timestamp);
    check_threshold("cpu", availability.cpu.utilization_percent, config_.cpu,
                    availability.timestamp);
    check_threshold("disk", availability.disk.utilization_percent, config_.disk,
                    availability.timestamp);
}

void ResourceDetector::check_threshold(const std::string& category, double current,
                                       const CategoryThresholds& threshold, Timestamp at) {
    ResourceAlert alert;
    alert.category = category;
    alert.current = current;
    alert.timestamp = at;

    if (current >= threshold.critical) {
        alert.severity = HealthStatus::Unhealthy;
        alert.message = category + " usage exceeded critical threshold";
        alert.threshold = threshold.critical;
    } else if (current >= threshold.warning) {
        alert.severity = HealthStatus::Degraded;
        alert.message = category + " usage exceeded warning threshold";
        alert.threshold = threshold.warning;
    } else {
        return;
    }
    emit_alert(alert);
}

void ResourceDetector::emit_alert(const ResourceAlert& alert) {
    std::vector<AlertCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = alert_callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(alert);
    }
}

// ========== ManualResourceDetector ==========

ManualResourceDetector::ManualResourceDetector(DetectorConfig config,
                                               std::shared_ptr<Scheduler> scheduler)
    : ResourceDetector(std::move(config), std::move(scheduler)) {
    set_utilization(50.0, 50.0, 50.0);
}

ManualResourceDetector::~ManualResourceDetector() {
    stop();
}

void ManualResourceDetector::set_usage(const ResourceUsage& usage) {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    usage_ = usage;
}

void ManualResourceDetector::set_utilization(double memory_percent, double cpu_percent,
                                             double disk_percent) {
    constexpr double kMemoryTotal = 16e9;
    constexpr double kDiskTotal = 1e12;

    ResourceUsage usage;
    usage.memory.total = kMemoryTotal;
    usage.memory.used = kMemoryTotal * memory_percent / 100.0;
    usage.memory.available = kMemoryTotal - usage.memory.used;
    usage.cpu.cores = 8;
    usage.cpu.utilization = cpu_percent;
    usage.disk.total = kDiskTotal;
    usage.disk.used = kDiskTotal * disk_percent / 100.0;
    usage.disk.available = kDiskTotal - usage.disk.used;
    set_usage(usage);
}

void ManualResourceDetector::set_failure(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    failure_ = std::move(message);
}

std::size_t ManualResourceDetector::detect_count() const {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    return detect_count_;
}

ResourceUsage ManualResourceDetector::detect() {
    std::lock_guard<std::mutex> lock(usage_mutex_);
    detect_count_++;
    if (failure_.has_value()) {
        throw DetectorException(failure_.value());
    }
    return usage_;
}

// ========== SystemResourceDetector ==========

SystemResourceDetector::SystemResourceDetector(DetectorConfig config,
                                               std::shared_ptr<Scheduler> scheduler,
                                               std::string disk_path)
    : ResourceDetector(std::move(config), std::move(scheduler))
    , disk_path_(std::move(disk_path)) {}

SystemResourceDetector::~SystemResourceDetector() {
    stop();
}

ResourceUsage SystemResourceDetector::detect() {
    ResourceUsage usage;
    usage.memory = detect_memory();
    usage.cpu = detect_cpu();
    usage.disk = detect_disk();
    return usage;
}

MemoryUsage SystemResourceDetector::detect_memory() const {
    struct sysinfo info {};
    if (sysinfo(&info) != 0) {
        throw DetectorException(std::string("sysinfo failed: ") + std::strerror(errno));
    }

    MemoryUsage m;
    double unit = static_cast<double>(info.mem_unit);
    m.total = static_cast<double>(info.totalram) * unit;
    m.available = static_cast<double>(info.freeram + info.bufferram) * unit;
    m.used = m.total - m.available;
    return m;
}

CpuUsage SystemResourceDetector::detect_cpu() {
    std::ifstream stat("/proc/stat");
    std::string line;
    if (!stat || !std::getline(stat, line) || line.compare(0, 4, "cpu ") != 0) {
        throw DetectorException("Unable to read aggregate cpu line from /proc/stat");
    }

    // cpu user nice system idle iowait irq softirq steal ...
    std::istringstream fields(line.substr(4));
    std::uint64_t value = 0;
    std::uint64_t total = 0;
    std::uint64_t idle = 0;
    for (int column = 0; fields >> value; ++column) {
        total += value;
        if (column == 3 || column == 4) {
            idle += value;
        }
    }

    std::uint64_t d_total = total - prev_total_;
    std::uint64_t d_idle = idle - prev_idle_;
    prev_total_ = total;
    prev_idle_ = idle;

    CpuUsage c;
    long online = sysconf(_SC_NPROCESSORS_ONLN);
    c.cores = online > 0 ? static_cast<std::size_t>(online)
                         : std::max(1u, std::thread::hardware_concurrency());
    c.utilization = d_total > 0
        ? static_cast<double>(d_total - d_idle) / static_cast<double>(d_total) * 100.0
        : 0.0;

    struct sysinfo info {};
    if (sysinfo(&info) == 0) {
        constexpr double kLoadScale = 65536.0;
        for (std::size_t i = 0; i < 3; ++i) {
            c.load_average[i] = static_cast<double>(info.loads[i]) / kLoadScale;
        }
    }
    return c;
}

DiskUsage SystemResourceDetector::detect_disk() const {
    struct statvfs fs {};
    if (statvfs(disk_path_.c_str(), &fs) != 0) {
        throw DetectorException("statvfs failed for " + disk_path_ + ": " + std::strerror(errno),
                                {{"path", disk_path_}});
    }

    DiskUsage d;
    double block = static_cast<double>(fs.f_frsize);
    d.total = static_cast<double>(fs.f_blocks) * block;
    d.available = static_cast<double>(fs.f_bavail) * block;
    d.used = d.total - static_cast<double>(fs.f_bfree) * block;
    return d;
}

} // namespace leaseguard
