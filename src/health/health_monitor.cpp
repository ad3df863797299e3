#include "harbor/health/health_monitor.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <iterator>
#include <memory>
#include <stdexcept>

#include "harbor/discovery/error.hpp"
#include "harbor/health/probes.hpp"
#include "harbor/log/logger.hpp"

namespace harbor::health {

using discovery::errc;
using discovery::ServiceRecord;

namespace {

// Slack on top of check_timeout before a probe still running is counted as
// failed.
constexpr std::chrono::milliseconds kProbeGrace{250};

HealthMonitorOptions normalize(HealthMonitorOptions options) {
    if (options.unhealthy_threshold < 1) {
        options.unhealthy_threshold = 1;
    }
    if (options.healthy_threshold < 1) {
        options.healthy_threshold = 1;
    }
    if (options.removal_threshold < options.unhealthy_threshold) {
        HARBOR_LOG_WARN << "Health monitor removal threshold "
                        << options.removal_threshold
                        << " is below the unhealthy threshold, using "
                        << options.unhealthy_threshold;
        options.removal_threshold = options.unhealthy_threshold;
    }
    if (options.probe_concurrency == 0) {
        options.probe_concurrency = 1;
    }
    if (options.http_health_path.empty()) {
        options.http_health_path = "/health";
    }
    return options;
}

HealthCheckResult failed_result(const std::string& service_name,
                                std::string detail) {
    HealthCheckResult result;
    result.service_name = service_name;
    result.healthy = false;
    result.error = errc::probe_failed;
    result.detail = std::move(detail);
    result.timestamp = std::chrono::steady_clock::now();
    return result;
}

}  // namespace

/// Everything a probe needs, copied out of the monitor so it can run
/// without touching it.
struct HealthMonitor::PreparedProbe {
    ServiceRecord record;
    CustomCheck custom;
    ProbeStrategy strategy = ProbeStrategy::tcp;
    std::string http_target;
    std::chrono::milliseconds timeout{0};
};

/// Shared by a running probe and the round collecting it. Outlives the
/// monitor when a custom check never returns.
struct HealthMonitor::ProbeSlot {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<std::chrono::steady_clock::time_point> started;
    bool done = false;
    HealthCheckResult result;
};

ProbeStrategy probe_strategy_from_string(const std::string& name) {
    if (name == "tcp") return ProbeStrategy::tcp;
    if (name == "http") return ProbeStrategy::http;
    if (name == "custom") return ProbeStrategy::custom;
    throw std::invalid_argument("Unknown health check strategy: " + name);
}

void to_json(nlohmann::json& j, const HealthCheckResult& r) {
    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - r.timestamp);
    j = nlohmann::json{{"service", r.service_name},
                       {"healthy", r.healthy},
                       {"latency_us", r.latency.count()},
                       {"checked_ago_ms", age.count()}};
    if (!r.healthy) {
        j["error"] = r.error.message();
        j["detail"] = r.detail;
    }
}

HealthMonitor::HealthMonitor(discovery::ServiceRegistry& registry,
                             HealthMonitorOptions options,
                             discovery::PortAllocator* allocator)
    : registry_(registry),
      allocator_(allocator),
      options_(normalize(std::move(options))),
      probe_pool_(options_.probe_concurrency) {}

HealthMonitor::~HealthMonitor() {
    if (running_) {
        stop();
    }
    probe_pool_.join();
}

boost::system::error_code HealthMonitor::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        return errc::already_running;
    }
    running_ = true;
    loop_thread_ = std::thread(&HealthMonitor::run_loop, this);
    HARBOR_LOG_INFO << "Health monitor started, interval "
                    << options_.check_interval.count() << "ms, timeout "
                    << options_.check_timeout.count() << "ms";
    return {};
}

boost::system::error_code HealthMonitor::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
        return errc::not_running;
    }
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_ = false;
    }
    loop_cv_.notify_one();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    HARBOR_LOG_INFO << "Health monitor stopped";
    return {};
}

void HealthMonitor::register_custom_check(const std::string& service_name,
                                          CustomCheck check) {
    std::lock_guard<std::mutex> lock(mutex_);
    custom_checks_[service_name] = std::move(check);
}

void HealthMonitor::unregister_custom_check(const std::string& service_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    custom_checks_.erase(service_name);
}

void HealthMonitor::set_service_strategy(const std::string& service_name,
                                         ProbeStrategy strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    strategies_[service_name] = strategy;
}

ProbeStrategy HealthMonitor::get_service_strategy(
    const std::string& service_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(service_name);
    return it != strategies_.end() ? it->second : options_.default_strategy;
}

HealthCheckResult HealthMonitor::check_service_health(
    const std::string& service_name, boost::system::error_code& ec) {
    auto record = registry_.get(service_name, ec);
    if (ec) {
        return {};
    }
    return probe(record);
}

void HealthMonitor::check_all_services() {
    auto services = registry_.list(false);
    if (services.empty()) {
        return;
    }

    std::vector<std::pair<std::string, std::shared_ptr<ProbeSlot>>> pending;
    std::vector<std::string> still_running;
    pending.reserve(services.size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = in_flight_.begin(); it != in_flight_.end();) {
            bool done = false;
            {
                std::lock_guard<std::mutex> slot_lock(it->second->mutex);
                done = it->second->done;
            }
            it = done ? in_flight_.erase(it) : std::next(it);
        }
        for (const auto& record : services) {
            if (in_flight_.count(record.name) != 0) {
                still_running.push_back(record.name);
            }
        }
    }

    for (const auto& record : services) {
        if (std::find(still_running.begin(), still_running.end(), record.name) !=
            still_running.end()) {
            continue;
        }
        pending.emplace_back(record.name, launch(record));
    }

    for (const auto& name : still_running) {
        process_result(failed_result(name, "previous check still running"));
    }
    for (auto& [name, slot] : pending) {
        bool finished = false;
        auto result = collect(name, *slot, finished);
        if (finished) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto it = in_flight_.find(name);
                it != in_flight_.end() && it->second == slot) {
                in_flight_.erase(it);
            }
        }
        process_result(result);
    }
}

std::shared_ptr<HealthMonitor::ProbeSlot> HealthMonitor::launch(
    const ServiceRecord& record) {
    auto slot = std::make_shared<ProbeSlot>();
    auto prepared = prepare(record);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_[record.name] = slot;
    }

    if (prepared.custom) {
        std::thread(&HealthMonitor::run_in_slot, slot, std::move(prepared))
            .detach();
    } else {
        // Network probes are bounded by the timeout, so the pool drains.
        boost::asio::post(probe_pool_, [slot, prepared = std::move(prepared)]() {
            run_in_slot(slot, prepared);
        });
    }
    return slot;
}

HealthCheckResult HealthMonitor::collect(const std::string& service_name,
                                         ProbeSlot& slot, bool& finished) const {
    std::unique_lock<std::mutex> lock(slot.mutex);
    slot.cv.wait(lock, [&] { return slot.done || slot.started.has_value(); });
    if (!slot.done) {
        const auto deadline = *slot.started + options_.check_timeout + kProbeGrace;
        slot.cv.wait_until(lock, deadline, [&] { return slot.done; });
    }
    finished = slot.done;
    if (slot.done) {
        return slot.result;
    }

    auto result = failed_result(
        service_name, "probe did not complete within " +
                          std::to_string(options_.check_timeout.count()) + "ms");
    result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        result.timestamp - *slot.started);
    return result;
}

void HealthMonitor::run_in_slot(const std::shared_ptr<ProbeSlot>& slot,
                                const PreparedProbe& prepared) {
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->started = std::chrono::steady_clock::now();
    }
    slot->cv.notify_all();

    auto result = execute(prepared);
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->result = std::move(result);
        slot->done = true;
    }
    slot->cv.notify_all();
}

void HealthMonitor::process_result(const HealthCheckResult& result) {
    const auto& name = result.service_name;
    int successes = 0;
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_results_[name] = result;
        if (result.healthy) {
            successes = ++success_counts_[name];
            failure_counts_[name] = 0;
        } else {
            failures = ++failure_counts_[name];
            success_counts_[name] = 0;
        }
    }

    if (!result.healthy) {
        HARBOR_LOG_DEBUG << "Probe of " << name << " failed (" << failures
                         << " in a row): " << result.detail;
    }

    // Registry calls happen outside mutex_.
    if (result.healthy) {
        if (successes >= options_.healthy_threshold) {
            apply_health(name, true, successes);
        }
        return;
    }

    if (failures >= options_.unhealthy_threshold) {
        apply_health(name, false, failures);
    }
    if (options_.enable_auto_removal &&
        failures >= options_.removal_threshold) {
        remove_service(name, failures);
    }
}

std::optional<HealthCheckResult> HealthMonitor::get_last_result(
    const std::string& service_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_results_.find(service_name);
    if (it == last_results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, HealthCheckResult> HealthMonitor::get_all_results()
    const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_results_;
}

int HealthMonitor::get_failure_count(const std::string& service_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failure_counts_.find(service_name);
    return it != failure_counts_.end() ? it->second : 0;
}

int HealthMonitor::get_success_count(const std::string& service_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = success_counts_.find(service_name);
    return it != success_counts_.end() ? it->second : 0;
}

void HealthMonitor::reset_counts(const std::string& service_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_counts_.erase(service_name);
    success_counts_.erase(service_name);
}

std::vector<ServiceRecord> HealthMonitor::get_healthy_services() const {
    return registry_.list(true);
}

std::vector<ServiceRecord> HealthMonitor::get_unhealthy_services() const {
    std::vector<ServiceRecord> unhealthy;
    for (auto& record : registry_.list(false)) {
        if (!record.healthy) {
            unhealthy.push_back(std::move(record));
        }
    }
    return unhealthy;
}

void HealthMonitor::run_loop() {
    while (running_) {
        check_all_services();

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, options_.check_interval,
                          [this] { return !running_; });
    }
}

HealthCheckResult HealthMonitor::probe(const ServiceRecord& record) {
    return execute(prepare(record));
}

HealthMonitor::PreparedProbe HealthMonitor::prepare(
    const ServiceRecord& record) const {
    PreparedProbe prepared;
    prepared.record = record;
    prepared.strategy = options_.default_strategy;
    prepared.timeout = options_.check_timeout;
    prepared.http_target = options_.http_health_path;
    if (auto it = record.metadata.find("health_endpoint");
        it != record.metadata.end() && !it->second.empty()) {
        prepared.http_target = it->second;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = custom_checks_.find(record.name); it != custom_checks_.end()) {
        prepared.custom = it->second;
    }
    if (auto it = strategies_.find(record.name); it != strategies_.end()) {
        prepared.strategy = it->second;
    }
    return prepared;
}

HealthCheckResult HealthMonitor::execute(const PreparedProbe& prepared) {
    const auto started = std::chrono::steady_clock::now();

    std::string detail;
    auto ec = run_probe(prepared, detail);

    HealthCheckResult result;
    result.service_name = prepared.record.name;
    result.healthy = !ec;
    result.timestamp = std::chrono::steady_clock::now();
    result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        result.timestamp - started);
    if (ec) {
        result.error = errc::probe_failed;
        result.detail = detail.empty() ? ec.message() : detail;
    }
    return result;
}

boost::system::error_code HealthMonitor::run_probe(const PreparedProbe& prepared,
                                                   std::string& detail) {
    const auto& record = prepared.record;
    if (prepared.custom) {
        try {
            return prepared.custom(record);
        } catch (const std::exception& e) {
            detail = std::string("custom check threw: ") + e.what();
            return errc::probe_failed;
        }
    }

    switch (prepared.strategy) {
        case ProbeStrategy::http: {
            unsigned status = 0;
            auto ec = probe_http(record.host, record.port, prepared.http_target,
                                 prepared.timeout, status);
            if (ec && status != 0) {
                detail = "HTTP status " + std::to_string(status);
            }
            return ec;
        }
        case ProbeStrategy::custom:
            detail = "no custom check registered";
            return errc::probe_failed;
        case ProbeStrategy::tcp:
        default:
            return probe_tcp(record.host, record.port, prepared.timeout);
    }
}

void HealthMonitor::apply_health(const std::string& service_name, bool healthy,
                                 int count) {
    boost::system::error_code ec;
    auto record = registry_.get(service_name, ec);
    if (!ec && record.healthy != healthy) {
        ec = registry_.update_health(service_name, healthy);
        if (!ec) {
            if (healthy) {
                HARBOR_LOG_INFO << "Service " << service_name
                                << " is healthy again after " << count
                                << " successful checks";
            } else {
                HARBOR_LOG_WARN << "Service " << service_name
                                << " marked unhealthy after " << count
                                << " failed checks";
            }
        }
    }
    if (ec == errc::service_not_found) {
        HARBOR_LOG_DEBUG << "Service " << service_name
                         << " left the registry during a health check";
    } else if (ec) {
        HARBOR_LOG_WARN << "Could not update health of " << service_name
                        << ": " << ec.message();
    }
}

void HealthMonitor::remove_service(const std::string& service_name,
                                   int failures) {
    auto ec = registry_.deregister(service_name);
    if (ec == errc::service_not_found) {
        HARBOR_LOG_DEBUG << "Service " << service_name
                         << " left the registry during a health check";
    } else if (ec) {
        HARBOR_LOG_WARN << "Could not remove " << service_name << ": "
                        << ec.message();
        return;
    } else {
        HARBOR_LOG_WARN << "Removed service " << service_name << " after "
                        << failures << " failed checks";
    }

    if (allocator_ && allocator_->release_service(service_name)) {
        HARBOR_LOG_DEBUG << "Released port of " << service_name;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    failure_counts_.erase(service_name);
    success_counts_.erase(service_name);
    last_results_.erase(service_name);
}

}  // namespace harbor::health
