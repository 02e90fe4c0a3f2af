#include "leaseguard/resource_pool_manager.hpp"
#include "leaseguard/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

namespace leaseguard {

namespace {

PoolConfig checked(PoolConfig config) {
    validate(config);
    return config;
}

// Pool thresholds drive the utilization band seen by the state machine
ThresholdConfig pool_thresholds(const PoolConfig& config) {
    ThresholdConfig t = config.thresholds;
    t.resource.utilization = MetricThresholds{config.warning_threshold,
                                              config.critical_threshold,
                                              config.recovery_threshold,
                                              MetricDirection::HigherIsWorse};
    return t;
}

ErrorContext request_context(const ResourceRequest& request) {
    return {{"requestId", request.id},
            {"type", to_string(request.kind)},
            {"priority", to_string(request.priority)}};
}

ErrorContext lease_context(const Lease& lease) {
    return {{"leaseId", std::to_string(lease.id)}, {"requestId", lease.request_id}};
}

bool known_kind(ResourceKind k) {
    switch (k) {
        case ResourceKind::Memory:
        case ResourceKind::Cpu:
        case ResourceKind::Disk:
        case ResourceKind::Generic:
            return true;
    }
    return false;
}

bool known_priority(Priority p) {
    switch (p) {
        case Priority::Low:
        case Priority::Medium:
        case Priority::High:
            return true;
    }
    return false;
}

MonitorEvent make_event(EventType type, Timestamp at, std::string message = {}) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = at;
    event.message = std::move(message);
    return event;
}

} // anonymous namespace

// ========== EventSink ==========

void ResourcePoolManager::EventSink::set(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void ResourcePoolManager::EventSink::emit(const MonitorEvent& event) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
    }
    if (monitor) {
        monitor->on_event(event);
    }
}

void ResourcePoolManager::EventSink::snapshot(const PoolSnapshot& snapshot) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
    }
    if (monitor) {
        monitor->on_snapshot(snapshot);
    }
}

// ========== ResourcePoolManager ==========

ResourcePoolManager::ResourcePoolManager(std::shared_ptr<ResourceDetector> detector,
                                         PoolConfig config,
                                         std::shared_ptr<Scheduler> scheduler)
    : config_(checked(std::move(config)))
    , scheduler_(scheduler ? std::move(scheduler) : std::make_shared<ThreadScheduler>())
    , detector_(std::move(detector))
    , sink_(std::make_shared<EventSink>())
    , cache_(config_.cache_max_size)
    , last_updated_(scheduler_->now())
    , evaluator_(pool_thresholds(config_))
    , health_manager_(pool_thresholds(config_), config_.recovery, config_.history_capacity,
                      [sched = scheduler_] { return sched->now(); })
    , breaker_(config_.circuit_breaker) {
    if (!detector_) {
        throw ValidationException("ResourcePoolManager requires a resource detector");
    }

    // Forward detector alerts for as long as the sink is alive
    std::weak_ptr<EventSink> weak_sink = sink_;
    detector_->on_alert([weak_sink](const ResourceAlert& alert) {
        if (auto sink = weak_sink.lock()) {
            MonitorEvent event;
            event.type = EventType::DetectorAlert;
            event.timestamp = alert.timestamp;
            event.to_status = alert.severity;
            event.message = alert.message;
            sink->emit(event);
        }
    });
}

ResourcePoolManager::~ResourcePoolManager() {
    dispose();
}

// ==================== Leases ====================

Lease ResourcePoolManager::allocate(const ResourceRequest& request) {
    auto started = Clock::now();

    try {
        validate_request(request);
    } catch (const ValidationException&) {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);
        metrics_.validation_failures++;
        throw;
    }

    Timestamp now = scheduler_->now();

    if (!breaker_.allow(now)) {
        PoolExhaustedException error("Circuit breaker is open", request_context(request));
        reject_allocation(request, error);
        throw error;
    }

    if (health_.load() == HealthStatus::Unhealthy) {
        if (auto shortfall = resource_shortfall(request)) {
            auto ctx = request_context(request);
            ctx.insert(shortfall->begin(), shortfall->end());
            ctx["health"] = to_pool_label(HealthStatus::Unhealthy);
            PoolExhaustedException error("System resources exhausted", ctx);
            reject_allocation(request, error);
            record_breaker_failure(now);
            throw error;
        }
    }

    Lease lease;
    bool cache_hit = false;
    bool evicted = false;
    double utilization = 0.0;
    {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);

        window_attempts_++;
        std::size_t active = leases_.size();
        if (active >= config_.max_pool_size) {
            window_failures_++;
            metrics_.allocation_failures++;
            lock.unlock();

            auto ctx = request_context(request);
            ctx["activeLeases"] = std::to_string(active);
            ctx["maxPoolSize"] = std::to_string(config_.max_pool_size);
            PoolExhaustedException error("No resources available", ctx);
            auto rejected = make_event(EventType::AllocationRejected, now, error.what());
            rejected.request_id = request.id;
            rejected.utilization = 1.0;
            emit_event(rejected);
            record_breaker_failure(now);
            throw error;
        }

        Fingerprint fp = make_fingerprint(request, config_.memory_quantum, config_.cpu_quantum);
        std::optional<LeaseShape> cached;
        if (cache_.enabled()) {
            cached = cache_.get(fp, now);
            if (!cached.has_value()) {
                evicted = cache_.put(make_shape(fp, request.requirements, config_.memory_quantum,
                                                config_.cpu_quantum, now),
                                     now);
            }
        }
        cache_hit = cached.has_value();

        lease.id = next_lease_id_++;
        lease.request_id = request.id;
        lease.kind = request.kind;
        lease.priority = request.priority;
        if (cache_hit) {
            // Reissue from the vetted shape; lifetime still follows the request
            lease.requirements = cached->requirements;
            lease.requirements.timeout = request.requirements.timeout;
            lease.reuse_count = cached->reuse_count;
        } else {
            lease.requirements = request.requirements;
        }
        lease.allocated_at = now;
        lease.expires_at = now + request.requirements.timeout.value_or(config_.resource_timeout);
        lease.from_cache = cache_hit;

        leases_.emplace(lease.id, LeaseRecord{lease, fp});
        active_leases_.store(leases_.size());

        metrics_.allocations++;
        if (cache_hit) {
            metrics_.cache_hits++;
        } else {
            metrics_.cache_misses++;
        }
        if (evicted) {
            metrics_.cache_evictions++;
        }
        metrics_.peak_active_leases = std::max(metrics_.peak_active_leases, leases_.size());

        double elapsed_us = std::chrono::duration<double, std::micro>(Clock::now() - started).count();
        latency_sum_us_ += elapsed_us;
        metrics_.average_allocation_latency_us =
            latency_sum_us_ / static_cast<double>(metrics_.allocations);

        utilization = static_cast<double>(leases_.size()) /
                      static_cast<double>(config_.max_pool_size);
    }

    // Outside the lock: breaker bookkeeping and events
    if (breaker_.record_success()) {
        emit_event(make_event(EventType::CircuitClosed, now, "Trial allocation succeeded"));
    }

    emit_event(make_event(cache_hit ? EventType::CacheHit : EventType::CacheMiss, now));
    if (evicted) {
        auto e = make_event(EventType::CacheEvicted, now, "Least recently used shape evicted");
        e.count = 1;
        emit_event(e);
    }

    auto granted = make_event(EventType::LeaseGranted, now);
    granted.lease_id = lease.id;
    granted.request_id = lease.request_id;
    granted.utilization = utilization;
    granted.duration_us =
        std::chrono::duration<double, std::micro>(Clock::now() - started).count();
    emit_event(granted);

    return lease;
}

void ResourcePoolManager::release(const Lease& lease) {
    enum class Outcome { Released, Expired, Unknown, AlreadyReleased, AlreadyStale, Mismatch };

    Timestamp now = scheduler_->now();
    Outcome outcome = Outcome::Released;
    double utilization = 0.0;

    {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);

        auto it = leases_.find(lease.id);
        if (it == leases_.end()) {
            auto retired = retired_.find(lease.id);
            if (retired == retired_.end()) {
                outcome = Outcome::Unknown;
            } else if (retired->second == LeaseState::Stale) {
                outcome = Outcome::AlreadyStale;
            } else {
                outcome = Outcome::AlreadyReleased;
            }
        } else {
            const Lease& record = it->second.lease;
            if (record.request_id != lease.request_id || record.allocated_at != lease.allocated_at) {
                outcome = Outcome::Mismatch;
            } else if (record.expires_at <= now) {
                // Sweep wins: an expired lease is stale even if the sweep has not run yet
                retire(lease.id, LeaseState::Stale);
                metrics_.stale_leases++;
                outcome = Outcome::Expired;
            } else {
                LeaseShape shape = make_shape(it->second.fingerprint, record.requirements,
                                              config_.memory_quantum, config_.cpu_quantum, now);
                retire(lease.id, LeaseState::Released);
                metrics_.releases++;
                if (cache_.enabled() && cache_.put(shape, now)) {
                    metrics_.cache_evictions++;
                }
            }
        }

        utilization = static_cast<double>(leases_.size()) /
                      static_cast<double>(config_.max_pool_size);
    }

    // Outside the lock: events, then the error for rejected releases
    switch (outcome) {
        case Outcome::Unknown:
            reject_release(lease, now, "Unknown lease");
            throw ValidationException("Unknown lease", lease_context(lease));

        case Outcome::AlreadyReleased:
            reject_release(lease, now, "Lease already released");
            throw ValidationException("Lease already released", lease_context(lease));

        case Outcome::Mismatch:
            reject_release(lease, now, "Lease handle does not match the pool record");
            throw ValidationException("Lease handle does not match the pool record",
                                      lease_context(lease));

        case Outcome::AlreadyStale:
            reject_release(lease, now, "Resource is stale");
            throw StaleResourceException(lease_context(lease));

        case Outcome::Expired: {
            auto expired = make_event(EventType::LeaseExpired, now, "Lease expired before release");
            expired.lease_id = lease.id;
            expired.request_id = lease.request_id;
            expired.utilization = utilization;
            emit_event(expired);
            reject_release(lease, now, "Resource is stale");
            throw StaleResourceException(lease_context(lease));
        }

        case Outcome::Released:
            break;
    }

    auto released = make_event(EventType::LeaseReleased, now);
    released.lease_id = lease.id;
    released.request_id = lease.request_id;
    released.utilization = utilization;
    emit_event(released);
}

std::optional<LeaseState> ResourcePoolManager::lease_state(LeaseId id) const {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    if (leases_.count(id) > 0) {
        return LeaseState::Active;
    }
    auto it = retired_.find(id);
    if (it != retired_.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ==================== Health ====================

PoolStatus ResourcePoolManager::monitor() const {
    PoolStatus status;
    status.health = health_.load();
    status.active_leases = active_leases_.load();
    status.max_pool_size = config_.max_pool_size;
    status.utilization = static_cast<double>(status.active_leases) /
                         static_cast<double>(config_.max_pool_size);
    status.last_updated = last_updated_.load();
    return status;
}

void ResourcePoolManager::force_update() {
    update_health(true);
}

TransitionResult ResourcePoolManager::reset_health(const std::string& reason) {
    std::lock_guard<std::mutex> lock(health_mutex_);
    auto result = health_manager_.reset(reason);
    sync_health(scheduler_->now());
    return result;
}

void ResourcePoolManager::transition_health(HealthStatus to, const std::string& reason) {
    std::lock_guard<std::mutex> lock(health_mutex_);
    health_manager_.transition(to, reason);
    sync_health(scheduler_->now());
}

void ResourcePoolManager::add_health_guard(GuardCondition guard) {
    health_manager_.add_guard_condition(std::move(guard));
}

std::optional<ResourceAvailability> ResourcePoolManager::last_availability() const {
    std::lock_guard<std::mutex> lock(availability_mutex_);
    return last_availability_;
}

// ==================== Maintenance ====================

std::size_t ResourcePoolManager::run_cleanup() {
    std::lock_guard<std::mutex> sweep(sweep_mutex_);

    Timestamp now = scheduler_->now();
    std::vector<Lease> expired;
    std::size_t trimmed = 0;
    double utilization = 0.0;

    {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);

        for (const auto& [id, record] : leases_) {
            if (record.lease.expires_at <= now) {
                expired.push_back(record.lease);
            }
        }
        for (const auto& lease : expired) {
            retire(lease.id, LeaseState::Stale);
        }
        metrics_.stale_leases += expired.size();

        // Idle shapes older than the lease timeout go, but never below min_pool_size
        trimmed = cache_.trim_idle(now - config_.resource_timeout, config_.min_pool_size);
        metrics_.cache_evictions += trimmed;

        utilization = static_cast<double>(leases_.size()) /
                      static_cast<double>(config_.max_pool_size);
    }

    // Outside the lock: emit events
    for (const auto& lease : expired) {
        auto e = make_event(EventType::LeaseExpired, now, "Swept to stale by cleanup");
        e.lease_id = lease.id;
        e.request_id = lease.request_id;
        emit_event(e);
    }
    if (trimmed > 0) {
        auto e = make_event(EventType::CacheEvicted, now, "Idle shapes trimmed");
        e.count = trimmed;
        emit_event(e);
    }

    auto done = make_event(EventType::CleanupCompleted, now);
    done.count = expired.size();
    done.utilization = utilization;
    emit_event(done);

    return expired.size();
}

PoolMetrics ResourcePoolManager::get_metrics() const {
    PoolMetrics m;
    {
        std::shared_lock<std::shared_mutex> lock(pool_mutex_);
        m = metrics_;
        m.active_leases = leases_.size();
        m.cached_shapes = cache_.size();
    }
    m.circuit_state = breaker_.state();
    return m;
}

// ==================== Lifecycle ====================

void ResourcePoolManager::start() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (disposed_.load()) {
            throw ValidationException("Pool has been disposed");
        }
        if (cleanup_timer_.has_value()) {
            return;
        }
        cleanup_timer_ = scheduler_->schedule_every(config_.cleanup_interval,
                                                     [this] { run_cleanup(); });
        health_timer_ = scheduler_->schedule_every(config_.health_check_interval, [this] {
            // A running detector refreshes itself; otherwise sample on the tick
            update_health(!detector_->is_running());
        });
    }

    emit_event(make_event(EventType::PoolStarted, scheduler_->now(),
                          "max_pool_size=" + std::to_string(config_.max_pool_size)));

    // Initial sample
    update_health(true);
}

void ResourcePoolManager::dispose() {
    std::optional<TimerId> cleanup;
    std::optional<TimerId> health;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (disposed_.exchange(true)) {
            return;
        }
        cleanup.swap(cleanup_timer_);
        health.swap(health_timer_);
    }

    // Waits for an in-flight tick to finish
    if (cleanup.has_value()) scheduler_->cancel(cleanup.value());
    if (health.has_value()) scheduler_->cancel(health.value());

    {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);
        cache_.clear();
    }

    emit_event(make_event(EventType::PoolDisposed, scheduler_->now()));
}

bool ResourcePoolManager::is_running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return cleanup_timer_.has_value();
}

bool ResourcePoolManager::is_disposed() const {
    return disposed_.load();
}

void ResourcePoolManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    health_manager_.set_monitor(monitor);
    sink_->set(std::move(monitor));
}

// ==================== Internal helpers ====================

void ResourcePoolManager::validate_request(const ResourceRequest& request) const {
    if (disposed_.load()) {
        throw ValidationException("Pool has been disposed", {{"requestId", request.id}});
    }
    if (request.id.empty()) {
        throw ValidationException("Request id must not be empty");
    }
    if (!known_kind(request.kind)) {
        throw ValidationException("Unknown resource type",
                                  {{"requestId", request.id},
                                   {"type", std::to_string(static_cast<int>(request.kind))}});
    }
    if (!known_priority(request.priority)) {
        throw ValidationException("Unknown priority",
                                  {{"requestId", request.id},
                                   {"priority", std::to_string(static_cast<int>(request.priority))}});
    }

    auto check = [&](const std::optional<double>& value, const char* name) {
        if (value.has_value() && !(std::isfinite(value.value()) && value.value() >= 0.0)) {
            throw ValidationException(std::string("Requirement ") + name +
                                      " must be a non-negative finite number",
                                      {{"requestId", request.id},
                                       {"requirement", name},
                                       {"value", std::to_string(value.value())}});
        }
    };
    check(request.requirements.memory, "memory");
    check(request.requirements.cpu, "cpu");

    if (request.requirements.timeout.has_value() &&
        request.requirements.timeout.value() <= Duration::zero()) {
        throw ValidationException("Requirement timeout must be positive",
                                  {{"requestId", request.id},
                                   {"requirement", "timeout"},
                                   {"value", std::to_string(to_milliseconds(
                                       request.requirements.timeout.value()))}});
    }
}

std::optional<ErrorContext> ResourcePoolManager::resource_shortfall(
    const ResourceRequest& request) const {
    std::lock_guard<std::mutex> lock(availability_mutex_);
    if (!last_availability_.has_value()) {
        return std::nullopt;
    }
    const auto& a = last_availability_.value();
    const auto& req = request.requirements;
    const auto& thresholds = detector_->config();

    if (req.memory.value_or(0.0) > 0.0) {
        if (!a.memory.is_available || a.memory.available_amount < req.memory.value()) {
            return ErrorContext{{"metric", "memory"},
                                {"required", std::to_string(req.memory.value())},
                                {"available", std::to_string(a.memory.available_amount)},
                                {"utilizationPercent", std::to_string(a.memory.utilization_percent)},
                                {"criticalThreshold", std::to_string(thresholds.memory.critical)}};
        }
    }
    if (req.cpu.value_or(0.0) > 0.0) {
        // cpu is expressed in percent of one core
        double cores = std::ceil(req.cpu.value() / 100.0);
        if (!a.cpu.is_available || a.cpu.available_amount < cores) {
            return ErrorContext{{"metric", "cpu"},
                                {"required", std::to_string(cores)},
                                {"available", std::to_string(a.cpu.available_amount)},
                                {"utilizationPercent", std::to_string(a.cpu.utilization_percent)},
                                {"criticalThreshold", std::to_string(thresholds.cpu.critical)}};
        }
    }
    return std::nullopt;
}

void ResourcePoolManager::reject_allocation(const ResourceRequest& request,
                                            const PoolExhaustedException& error) {
    {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);
        window_attempts_++;
        window_failures_++;
        metrics_.allocation_failures++;
    }
    auto e = make_event(EventType::AllocationRejected, scheduler_->now(), error.what());
    e.request_id = request.id;
    emit_event(e);
}

void ResourcePoolManager::record_breaker_failure(Timestamp now) {
    if (breaker_.record_failure(now)) {
        emit_event(make_event(EventType::CircuitOpened, now,
                              "Opened after repeated capacity failures"));
    }
}

void ResourcePoolManager::reject_release(const Lease& lease, Timestamp now,
                                         const std::string& reason) {
    auto e = make_event(EventType::ReleaseRejected, now, reason);
    e.lease_id = lease.id;
    e.request_id = lease.request_id;
    emit_event(e);
}

void ResourcePoolManager::retire(LeaseId id, LeaseState state) {
    leases_.erase(id);
    active_leases_.store(leases_.size());

    retired_[id] = state;
    retired_order_.push_back(id);
    while (retired_order_.size() > config_.retired_lease_retention) {
        retired_.erase(retired_order_.front());
        retired_order_.pop_front();
    }
}

void ResourcePoolManager::update_health(bool resample) {
    std::lock_guard<std::mutex> lock(health_mutex_);

    ResourceAvailability availability;
    try {
        availability = resample ? detector_->refresh() : detector_->get_availability();
    } catch (const std::exception& e) {
        // Keep the previous health; the detector has already raised its alert
        auto event = make_event(EventType::DetectorFailure, scheduler_->now(), e.what());
        event.to_status = health_.load();
        emit_event(event);
        return;
    }

    {
        std::lock_guard<std::mutex> avail_lock(availability_mutex_);
        last_availability_ = availability;
    }

    Timestamp now = scheduler_->now();
    health_manager_.evaluate(build_sample(availability, now));
    sync_health(now);
}

void ResourcePoolManager::sync_health(Timestamp now) {
    health_.store(health_manager_.current_status());
    last_updated_.store(now);

    sink_->snapshot(make_snapshot(now));
}

HealthState ResourcePoolManager::build_sample(const ResourceAvailability& availability,
                                              Timestamp now) {
    std::uint64_t attempts = 0;
    std::uint64_t failures = 0;
    double pool_utilization = 0.0;
    {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);
        attempts = window_attempts_;
        failures = window_failures_;
        window_attempts_ = 0;
        window_failures_ = 0;
        pool_utilization = static_cast<double>(leases_.size()) /
                           static_cast<double>(config_.max_pool_size);
    }

    double utilization = std::max({availability.memory.utilization_percent,
                                   availability.cpu.utilization_percent,
                                   pool_utilization * 100.0}) / 100.0;

    auto usage = evaluator_.evaluate_utilization_health(utilization);
    auto errors = evaluator_.evaluate_error_health(ErrorMetrics{failures, attempts});

    HealthState sample;
    sample.timestamp = now;
    sample.indicators.metrics.utilization = utilization;
    sample.indicators.metrics.error_rate =
        attempts > 0 ? static_cast<double>(failures) / static_cast<double>(attempts) : 0.0;
    sample.indicators.score = MetricEvaluator::aggregate_score({usage, errors});
    for (const auto* r : {&usage, &errors}) {
        sample.indicators.violations.insert(sample.indicators.violations.end(),
                                            r->violations.begin(), r->violations.end());
        sample.indicators.recommendations.insert(sample.indicators.recommendations.end(),
                                                 r->recommendations.begin(),
                                                 r->recommendations.end());
    }

    // The detector's own verdict wins when it is worse than the metrics
    HealthStatus from_metrics = health_manager_.classify(sample.indicators.metrics);
    sample.status = severity(availability.status) > severity(from_metrics) ? availability.status
                                                                           : from_metrics;
    return sample;
}

PoolSnapshot ResourcePoolManager::make_snapshot(Timestamp now) const {
    PoolSnapshot s;
    s.timestamp = now;
    s.health = health_.load();
    s.max_pool_size = config_.max_pool_size;
    {
        std::shared_lock<std::shared_mutex> lock(pool_mutex_);
        s.active_leases = leases_.size();
        s.cached_shapes = cache_.size();
    }
    s.utilization = static_cast<double>(s.active_leases) /
                    static_cast<double>(config_.max_pool_size);
    s.availability = last_availability();
    return s;
}

void ResourcePoolManager::emit_event(MonitorEvent event) {
    sink_->emit(event);
}

} // namespace leaseguard
