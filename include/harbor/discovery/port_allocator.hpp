// harbor/include/harbor/discovery/port_allocator.hpp
#pragma once

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "harbor/discovery/error.hpp"
#include "nlohmann/json.hpp"

namespace harbor::discovery {

/// @brief Inclusive interval of port numbers.
struct PortRange {
    uint16_t low = 0;
    uint16_t high = 0;

    bool contains(uint16_t port) const { return port >= low && port <= high; }
    bool valid() const { return low >= 1 && low <= high; }
};

/// @brief One claimed port.
struct PortAllocation {
    uint16_t port = 0;
    std::string service_name;
    /// @brief Range the port was drawn from ("api", "default", "ephemeral",
    /// "custom" or "specific").
    std::string range_name;
    std::chrono::steady_clock::time_point allocated_at;
};

void to_json(nlohmann::json& j, const PortAllocation& a);

struct PortAllocatorOptions {
    /// @brief Typed ranges keyed by service type.
    std::map<std::string, PortRange> ranges{
        {"database", {5433, 5442}},  {"cache", {6380, 6389}},
        {"api", {8081, 8099}},       {"grpc", {9091, 9099}},
        {"metrics", {9101, 9109}},   {"websocket", {8001, 8020}},
    };
    /// @brief Catch-all range for unhinted allocations.
    PortRange default_range{10000, 10999};
    /// @brief Ports never handed out, whatever the range.
    std::vector<uint16_t> reserved_ports{22, 80, 443, 3306, 5432, 6379, 8080, 9090};
    /// @brief Also require candidate ports to be bindable on this host.
    bool check_os_bind = false;
    /// @brief Fall back to an OS-assigned port when the range is exhausted.
    bool allow_ephemeral = false;
};

/// @brief Hands out non-conflicting ports from named, typed ranges.
///
/// Allocation is first-fit from the low end of the range so that results are
/// deterministic. A service owns at most one port; asking again for the same
/// service returns the port it already holds. All members are thread-safe.
class PortAllocator {
public:
    static constexpr const char* DEFAULT_RANGE = "default";
    static constexpr const char* EPHEMERAL_RANGE = "ephemeral";

    explicit PortAllocator(PortAllocatorOptions options = {});

    // Non-copyable
    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;

    /// @brief Allocates the lowest free port of the hinted range.
    /// @param range_hint Range name; empty or "default" selects the default
    /// range.
    /// @return The port, or 0 with ec set to port_range_exhausted or
    /// unknown_port_range.
    uint16_t allocate(const std::string& service_name,
                      const std::string& range_hint,
                      boost::system::error_code& ec);

    /// @param created Set to true only when this call made the allocation,
    /// false when the service already held the returned port.
    uint16_t allocate(const std::string& service_name,
                      const std::string& range_hint,
                      boost::system::error_code& ec, bool& created);

    /// @brief Allocates the lowest free port of an explicit interval.
    uint16_t allocate_in_range(const std::string& service_name, uint16_t low,
                               uint16_t high, boost::system::error_code& ec);

    /// @brief Claims one specific port.
    /// @return The port, or 0 with ec set to port_already_allocated.
    uint16_t allocate_specific(const std::string& service_name, uint16_t port,
                               boost::system::error_code& ec);

    /// @brief Frees a port. Unknown or already free ports are ignored.
    void release(uint16_t port);

    /// @brief Frees the port owned by a service.
    /// @return True if the service held a port.
    bool release_service(const std::string& service_name);

    /// @brief True when the port is neither allocated nor reserved. Does not
    /// check whether the host could bind it.
    bool is_port_available(uint16_t port) const;

    std::optional<uint16_t> port_for_service(
        const std::string& service_name) const;
    std::optional<PortAllocation> allocation(uint16_t port) const;
    std::vector<PortAllocation> list_allocations() const;

    /// @brief Adds a port to the reserved set. A port that is currently
    /// allocated stays with its owner and is skipped once released.
    /// @return errc::invalid_port_range for port 0.
    boost::system::error_code add_reserved_port(uint16_t port);

    /// @return True if the port was reserved.
    bool remove_reserved_port(uint16_t port);

    std::vector<uint16_t> reserved_ports() const;

    /// @brief Range name used for a service when no hint is given.
    std::string range_for_service(const std::string& service_name) const;

    /// @brief Options as constructed. Reserved ports changed at runtime are
    /// only visible through reserved_ports().
    const PortAllocatorOptions& options() const { return _options; }

private:
    // Helpers below expect _mutex to be held exclusively.
    bool _is_free(uint16_t port) const;
    bool _is_reserved(uint16_t port) const;
    uint16_t _reserve(uint16_t port, const std::string& service_name,
                      const std::string& range_name);
    uint16_t _allocate_from_range(const std::string& service_name,
                                  const PortRange& range,
                                  const std::string& range_name,
                                  boost::system::error_code& ec);
    uint16_t _allocate_ephemeral(const std::string& service_name,
                                 boost::system::error_code& ec);

    static bool _can_bind(uint16_t port);

    PortAllocatorOptions _options;

    mutable std::shared_mutex _mutex;
    std::set<uint16_t> _reserved;
    std::map<uint16_t, PortAllocation> _allocations;
    std::unordered_map<std::string, uint16_t> _service_ports;
};

}  // namespace harbor::discovery
