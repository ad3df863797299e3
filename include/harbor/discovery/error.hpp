#pragma once

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace harbor::discovery {

/// @brief Error conditions reported by the registry, allocator, discovery
/// client and health monitor.
/// None of these are fatal: every one is an ordinary, recoverable outcome.
enum class errc {
    service_not_found = 1,
    invalid_service_info,
    port_range_exhausted,
    invalid_port_range,
    unknown_port_range,
    port_already_allocated,
    discovery_timeout,
    strategy_disabled,
    already_running,
    not_running,
    probe_failed,
    cancelled
};

/// @brief The "harbor.discovery" error category.
const boost::system::error_category& discovery_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

}  // namespace harbor::discovery

namespace boost::system {

template <>
struct is_error_code_enum<harbor::discovery::errc> : std::true_type {};

}  // namespace boost::system
