#include "harbor/daemon/daemon.hpp"

#include <boost/asio/post.hpp>
#include <csignal>

#include "harbor/log/logger.hpp"

namespace harbor::daemon {

Daemon::Daemon(discovery::DiscoveryConfig config)
    : config_(std::move(config)),
      registry_(config_.registry_options()),
      allocator_(config_.port_allocator_options()),
      broadcast_(config_.client.enable_broadcast
                     ? std::make_shared<discovery::BroadcastService>(
                           config_.broadcast_options())
                     : nullptr),
      client_(registry_, allocator_, config_.client_options(), nullptr,
              broadcast_),
      monitor_(registry_, config_.health_options(), &allocator_),
      signals_(ioc_, SIGINT, SIGTERM),
      snapshot_timer_(ioc_) {}

Daemon::~Daemon() = default;

int Daemon::run() {
    if (auto ec = registry_.start()) {
        HARBOR_LOG_ERROR << "Failed to start service registry: " << ec.message();
        return 1;
    }

    if (!register_static_services()) {
        registry_.stop();
        return 1;
    }

    if (broadcast_ && !broadcast_->is_running()) {
        if (auto ec = broadcast_->start()) {
            HARBOR_LOG_ERROR << "Failed to start broadcast discovery: "
                             << ec.message();
        }
    }

    if (config_.health.enabled) {
        for (const auto& service : config_.services) {
            if (!service.health_strategy.empty()) {
                monitor_.set_service_strategy(
                    service.name,
                    health::probe_strategy_from_string(service.health_strategy));
            }
        }
        if (auto ec = monitor_.start()) {
            HARBOR_LOG_ERROR << "Failed to start health monitor: "
                             << ec.message();
        }
    }

    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        HARBOR_LOG_INFO << "Received signal " << signo << ", shutting down";
        shutdown();
    });

    for (auto& registration : registrations_) {
        schedule_heartbeat(registration);
    }
    schedule_snapshot();

    HARBOR_LOG_INFO << "harbord running with " << registrations_.size()
                    << " static service(s)";
    ioc_.run();

    if (monitor_.is_running()) {
        monitor_.stop();
    }
    if (broadcast_ && broadcast_->is_running()) {
        broadcast_->stop();
    }
    for (const auto& registration : registrations_) {
        if (auto ec = client_.deregister(registration.record.name);
            ec && ec != discovery::errc::service_not_found) {
            HARBOR_LOG_WARN << "Failed to deregister "
                            << registration.record.name << ": " << ec.message();
        }
    }
    registry_.stop();

    HARBOR_LOG_INFO << "harbord stopped";
    return 0;
}

void Daemon::stop() {
    boost::asio::post(ioc_, [this]() { shutdown(); });
}

nlohmann::json Daemon::snapshot() const {
    nlohmann::json services = nlohmann::json::array();
    for (const auto& record : registry_.list(false)) {
        services.push_back(nlohmann::json(record));
    }

    nlohmann::json allocations = nlohmann::json::array();
    for (const auto& allocation : allocator_.list_allocations()) {
        allocations.push_back(nlohmann::json(allocation));
    }

    nlohmann::json health = nlohmann::json::object();
    for (const auto& [name, result] : monitor_.get_all_results()) {
        health[name] = result;
    }

    return nlohmann::json{{"services", services},
                          {"allocations", allocations},
                          {"health", health}};
}

bool Daemon::register_static_services() {
    for (const auto& service : config_.services) {
        auto record = discovery::DiscoveryConfig::to_record(service);
        uint16_t port = 0;
        if (auto ec = client_.register_service(record, port)) {
            HARBOR_LOG_ERROR << "Failed to register static service "
                             << service.name << ": " << ec.message();
            return false;
        }
        HARBOR_LOG_INFO << "Static service " << service.name << " listening on "
                        << record.host << ":" << port;
        announce(record, port);

        // The configured port (possibly 0) is kept so that a re-registration
        // goes through allocation again.
        auto ttl = record.ttl.count() > 0 ? record.ttl
                                          : registry_.options().default_ttl;
        StaticRegistration registration;
        registration.record = std::move(record);
        registration.heartbeat_interval = ttl / 3;
        registration.timer = std::make_unique<boost::asio::steady_timer>(ioc_);
        registrations_.push_back(std::move(registration));
    }
    return true;
}

void Daemon::announce(const discovery::ServiceRecord& record, uint16_t port) {
    if (!broadcast_) {
        return;
    }
    auto announced = record;
    announced.port = port;
    broadcast_->set_local_service(announced);
}

void Daemon::schedule_heartbeat(StaticRegistration& registration) {
    if (registration.heartbeat_interval.count() <= 0) {
        return;  // never expires
    }
    registration.timer->expires_after(registration.heartbeat_interval);
    registration.timer->async_wait(
        [this, &registration](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            const auto& name = registration.record.name;
            if (auto hb_ec = client_.heartbeat(name)) {
                // Purged or auto-removed; claim it again.
                HARBOR_LOG_WARN << "Heartbeat for " << name << " failed ("
                                << hb_ec.message() << "), re-registering";
                uint16_t port = 0;
                if (auto reg_ec =
                        client_.register_service(registration.record, port)) {
                    HARBOR_LOG_ERROR << "Re-registration of " << name
                                     << " failed: " << reg_ec.message();
                } else {
                    announce(registration.record, port);
                }
            }
            schedule_heartbeat(registration);
        });
}

void Daemon::schedule_snapshot() {
    if (config_.snapshot_interval_ms <= 0) {
        return;
    }
    snapshot_timer_.expires_after(
        std::chrono::milliseconds(config_.snapshot_interval_ms));
    snapshot_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        HARBOR_LOG_INFO << "Snapshot: " << snapshot().dump();
        schedule_snapshot();
    });
}

void Daemon::shutdown() {
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    snapshot_timer_.cancel();
    for (auto& registration : registrations_) {
        registration.timer->cancel();
    }
}

}  // namespace harbor::daemon
