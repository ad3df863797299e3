// harbor/include/harbor/health/probes.hpp
#pragma once

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace harbor::health {

/// @brief Opens and closes a TCP connection to host:port.
/// @return Empty on success, the connect or resolve error otherwise
/// (boost::beast::error::timeout when the deadline passes).
boost::system::error_code probe_tcp(const std::string& host, uint16_t port,
                                    std::chrono::milliseconds timeout);

/// @brief Issues GET target to host:port over HTTP/1.1.
/// @return Empty on a 2xx response. A non-2xx status is reported as
/// discovery::errc::probe_failed.
/// @param status Receives the response status, or 0 when none was read.
boost::system::error_code probe_http(const std::string& host, uint16_t port,
                                     const std::string& target,
                                     std::chrono::milliseconds timeout,
                                     unsigned& status);

}  // namespace harbor::health
