// harbor/include/harbor/discovery/broadcast_service.hpp
#pragma once

#include <array>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "harbor/discovery/error.hpp"
#include "harbor/discovery/service_record.hpp"

namespace harbor::discovery {

struct BroadcastOptions {
    /// IPv4 or IPv6 multicast group
    std::string multicast_address = "239.255.0.1";
    uint16_t port = 7001;
    /// Local services are announced at this interval. Peers that stay silent
    /// for three intervals are forgotten.
    std::chrono::milliseconds announcement_interval{5000};
    std::chrono::milliseconds discovery_timeout{3000};
    /// IPv4 address of the interface to join and send on. Empty lets the OS
    /// choose.
    std::string interface_address;
    /// Multicast hop limit; 2 keeps traffic on the local network.
    int ttl = 2;
    /// Receive our own datagrams, so services on this host see each other.
    bool loopback = true;
    /// Messages stamped earlier than this are ignored.
    std::chrono::milliseconds max_message_age{60000};
};

enum class BroadcastMessageType { announce, query, response };

struct BroadcastMessage {
    BroadcastMessageType type = BroadcastMessageType::announce;
    /// Full record for announce and response, only the name for query.
    ServiceRecord service;
    std::chrono::system_clock::time_point timestamp;
};

/// @brief JSON datagram: {"type", "service", "timestamp"} with the timestamp
/// in milliseconds since the Unix epoch.
std::string encode_message(const BroadcastMessage& message);

/// @param ec errc::invalid_service_info for anything that is not a well
/// formed message.
BroadcastMessage decode_message(const std::string& payload,
                                boost::system::error_code& ec);

/// @brief Finds services on the local network over UDP multicast.
///
/// Local services are announced periodically and answered when a peer
/// queries them by name. Announcements and responses from peers fill a
/// cache that discover() and list() read. The socket is driven by a thread
/// of its own between start() and stop().
class BroadcastService {
public:
    explicit BroadcastService(BroadcastOptions options = {});
    ~BroadcastService();

    // Non-copyable
    BroadcastService(const BroadcastService&) = delete;
    BroadcastService& operator=(const BroadcastService&) = delete;

    /// @brief Joins the group and starts announcing.
    /// @return errc::already_running, or the socket error that prevented
    /// joining the group.
    boost::system::error_code start();

    /// @return errc::not_running when not started
    boost::system::error_code stop();

    bool is_running() const { return _running; }

    /// @brief Adds or replaces a service announced by this host. Announced
    /// right away when running.
    void set_local_service(const ServiceRecord& record);

    /// @return false when no local service has that name
    bool clear_local_service(const std::string& name);

    std::vector<ServiceRecord> local_services() const;

    /// @brief Returns a healthy cached record or queries the group and waits
    /// for an answer.
    /// @param ec errc::not_running, errc::invalid_service_info,
    /// errc::discovery_timeout or errc::cancelled
    ServiceRecord discover(const std::string& name,
                           std::chrono::milliseconds timeout,
                           boost::system::error_code& ec,
                           std::stop_token stop = {});

    /// @brief discover() with options().discovery_timeout
    ServiceRecord discover(const std::string& name,
                           boost::system::error_code& ec);

    /// @brief Services learned from peers, sorted by name.
    std::vector<ServiceRecord> list() const;

    /// @brief Forgets peers silent for three announcement intervals.
    /// @return Number of records removed
    std::size_t clean_expired();

    /// @brief Applies one received message: caches announcements and
    /// responses, answers queries for local services.
    void handle_message(const BroadcastMessage& message);

    /// @brief Port the socket is bound to, 0 when not running.
    uint16_t local_port() const { return _bound_port; }

    const BroadcastOptions& options() const { return _options; }

private:
    boost::system::error_code _open_socket();
    void _do_receive();
    void _schedule_announce();
    void _announce_local();
    void _send(const BroadcastMessage& message);
    bool _is_fresh(const ServiceRecord& record,
                   std::chrono::steady_clock::time_point now) const;

    BroadcastOptions _options;

    boost::asio::io_context _io_context;
    std::unique_ptr<boost::asio::ip::udp::socket> _socket;
    boost::asio::steady_timer _announce_timer;
    boost::asio::ip::udp::endpoint _group_endpoint;
    boost::asio::ip::udp::endpoint _sender;
    std::array<char, 65536> _buffer{};
    std::thread _thread;
    std::atomic<bool> _running{false};
    std::atomic<uint16_t> _bound_port{0};
    std::mutex _lifecycle_mutex;

    mutable std::mutex _mutex;
    std::condition_variable_any _discovered_cv;
    std::map<std::string, ServiceRecord> _local;
    std::map<std::string, ServiceRecord> _discovered;
};

}  // namespace harbor::discovery
