// harbor/include/harbor/discovery/service_record.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "nlohmann/json.hpp"

namespace harbor::discovery {

/// @brief Holds all necessary information about a single registered service.
struct ServiceRecord {
    /// @brief The unique name of the service, e.g., "auth-api".
    std::string name;
    /// @brief Host name or IP address the service listens on.
    std::string host;
    /// @brief Listening port. Zero asks the discovery client to allocate one.
    uint16_t port = 0;
    /// @brief Transport or application protocol: tcp, udp, http, https, grpc.
    std::string protocol;
    /// @brief Service version (e.g., "1.2.0").
    std::string version;
    /// @brief Free-form attributes. "health_endpoint" overrides the HTTP
    /// probe path.
    std::map<std::string, std::string> metadata;
    /// @brief Explicit port range to allocate from when port is zero. When
    /// empty, the range is derived from the service name.
    std::string port_range_hint;
    /// @brief Health flag written by heartbeats, callers and the health
    /// monitor.
    bool healthy = true;
    std::chrono::steady_clock::time_point registered_at;
    std::chrono::steady_clock::time_point last_heartbeat;
    /// @brief Maximum silence before the record is purged. Zero never expires.
    std::chrono::milliseconds ttl{0};

    /// @brief "host:port"
    std::string address() const;

    bool is_expired(std::chrono::steady_clock::time_point now =
                        std::chrono::steady_clock::now()) const;
};

/// @brief Maps a service name onto a well-known service type ("database",
/// "cache", "grpc", "metrics", "websocket", "api"). Returns an empty string
/// when the name carries no recognizable keyword.
std::string service_type_for(const std::string& service_name);

// JSON serialization for diagnostics snapshots. Time points are rendered as
// ages in milliseconds relative to the moment of serialization.
void to_json(nlohmann::json& j, const ServiceRecord& r);

}  // namespace harbor::discovery
