#pragma once

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "harbor/discovery/port_allocator.hpp"
#include "harbor/discovery/service_record.hpp"
#include "harbor/discovery/service_registry.hpp"
#include "nlohmann/json.hpp"

namespace harbor::health {

/**
 * @brief How a service is probed
 */
enum class ProbeStrategy {
    tcp,    // Connect and close
    http,   // GET the health endpoint, expect 2xx
    custom  // Registered CustomCheck
};

inline std::ostream& operator<<(std::ostream& os, ProbeStrategy strategy) {
    switch (strategy) {
        case ProbeStrategy::tcp:
            return os << "tcp";
        case ProbeStrategy::http:
            return os << "http";
        case ProbeStrategy::custom:
            return os << "custom";
        default:
            return os << "unknown";
    }
}

/**
 * @brief Parse "tcp", "http" or "custom"
 * @throws std::invalid_argument for anything else
 */
ProbeStrategy probe_strategy_from_string(const std::string& name);

/**
 * @brief User-supplied probe. An empty error_code means healthy.
 */
using CustomCheck = std::function<boost::system::error_code(
    const discovery::ServiceRecord&)>;

/**
 * @brief Outcome of one probe
 */
struct HealthCheckResult {
    std::string service_name;
    bool healthy = false;
    /// errc::probe_failed when unhealthy
    boost::system::error_code error;
    /// Underlying cause, e.g. "Connection refused" or "HTTP status 503"
    std::string detail;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::microseconds latency{0};
};

void to_json(nlohmann::json& j, const HealthCheckResult& r);

struct HealthMonitorOptions {
    std::chrono::milliseconds check_interval{5000};
    std::chrono::milliseconds check_timeout{2000};
    int unhealthy_threshold = 3;
    int healthy_threshold = 2;
    ProbeStrategy default_strategy = ProbeStrategy::tcp;
    bool enable_auto_removal = true;
    /// Raised to unhealthy_threshold when configured lower
    int removal_threshold = 5;
    std::size_t probe_concurrency = 8;
    /// Used when a service has no "health_endpoint" metadata
    std::string http_health_path = "/health";
};

/**
 * @brief Periodically probes every registered service and writes verdicts
 * back to the registry with hysteresis.
 *
 * A healthy service is marked unhealthy after unhealthy_threshold
 * consecutive failures and healthy again after healthy_threshold
 * consecutive successes. With auto removal enabled, reaching
 * removal_threshold failures deregisters the service and releases its port.
 *
 * The registry and the optional allocator must outlive the monitor.
 */
class HealthMonitor {
public:
    explicit HealthMonitor(discovery::ServiceRegistry& registry,
                           HealthMonitorOptions options = {},
                           discovery::PortAllocator* allocator = nullptr);
    ~HealthMonitor();

    // Non-copyable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Start the probe loop. The first round runs immediately.
     * @return errc::already_running when started twice
     */
    boost::system::error_code start();

    /**
     * @brief Stop the probe loop and wait for the current round
     * @return errc::not_running when not started
     */
    boost::system::error_code stop();

    bool is_running() const { return running_; }

    /**
     * @brief Register a probe for one service. It takes precedence over the
     * service's strategy.
     */
    void register_custom_check(const std::string& service_name,
                               CustomCheck check);
    void unregister_custom_check(const std::string& service_name);

    void set_service_strategy(const std::string& service_name,
                              ProbeStrategy strategy);
    ProbeStrategy get_service_strategy(const std::string& service_name) const;

    /**
     * @brief Probe one service now, on the calling thread. The result is not
     * recorded and counters are untouched.
     * @param ec errc::service_not_found when the service is not registered
     */
    HealthCheckResult check_service_health(const std::string& service_name,
                                           boost::system::error_code& ec);

    /**
     * @brief One loop round: probe all registered services concurrently and
     * record every result.
     *
     * Each probe gets check_timeout from the moment it starts, not from the
     * start of the round. Custom checks run on a thread of their own so a
     * check that never returns cannot hold a pool worker; such a service is
     * not probed again until its previous check finishes, and every round
     * in between counts as a failure for that service alone.
     */
    void check_all_services();

    /**
     * @brief Record a result, update counters and apply threshold
     * transitions to the registry.
     */
    void process_result(const HealthCheckResult& result);

    std::optional<HealthCheckResult> get_last_result(
        const std::string& service_name) const;
    std::map<std::string, HealthCheckResult> get_all_results() const;

    int get_failure_count(const std::string& service_name) const;
    int get_success_count(const std::string& service_name) const;
    void reset_counts(const std::string& service_name);

    std::vector<discovery::ServiceRecord> get_healthy_services() const;
    std::vector<discovery::ServiceRecord> get_unhealthy_services() const;

    const HealthMonitorOptions& options() const { return options_; }

private:
    struct PreparedProbe;
    struct ProbeSlot;

    void run_loop();
    HealthCheckResult probe(const discovery::ServiceRecord& record);
    PreparedProbe prepare(const discovery::ServiceRecord& record) const;
    std::shared_ptr<ProbeSlot> launch(const discovery::ServiceRecord& record);
    HealthCheckResult collect(const std::string& service_name, ProbeSlot& slot,
                              bool& finished) const;
    static HealthCheckResult execute(const PreparedProbe& prepared);
    static boost::system::error_code run_probe(const PreparedProbe& prepared,
                                               std::string& detail);
    static void run_in_slot(const std::shared_ptr<ProbeSlot>& slot,
                            const PreparedProbe& prepared);
    void apply_health(const std::string& service_name, bool healthy, int count);
    void remove_service(const std::string& service_name, int failures);

    discovery::ServiceRegistry& registry_;
    discovery::PortAllocator* allocator_;
    HealthMonitorOptions options_;

    boost::asio::thread_pool probe_pool_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int> failure_counts_;
    std::unordered_map<std::string, int> success_counts_;
    std::map<std::string, HealthCheckResult> last_results_;
    std::unordered_map<std::string, CustomCheck> custom_checks_;
    std::unordered_map<std::string, ProbeStrategy> strategies_;
    /// Probes launched by check_all_services that have not been collected
    std::unordered_map<std::string, std::shared_ptr<ProbeSlot>> in_flight_;

    std::thread loop_thread_;
    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::mutex lifecycle_mutex_;
};

}  // namespace harbor::health
