// harbor/src/discovery/broadcast_service.cpp
#include "harbor/discovery/broadcast_service.hpp"

#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>

#include "harbor/log/logger.hpp"

namespace harbor::discovery {

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace {

const char* type_name(BroadcastMessageType type) {
    switch (type) {
        case BroadcastMessageType::announce:
            return "announce";
        case BroadcastMessageType::query:
            return "query";
        case BroadcastMessageType::response:
            return "response";
    }
    return "unknown";
}

nlohmann::json record_to_wire(const ServiceRecord& record) {
    return nlohmann::json{{"name", record.name},
                          {"host", record.host},
                          {"port", record.port},
                          {"protocol", record.protocol},
                          {"version", record.version},
                          {"metadata", record.metadata},
                          {"healthy", record.healthy}};
}

ServiceRecord record_from_wire(const nlohmann::json& j) {
    ServiceRecord record;
    record.name = j.at("name").get<std::string>();
    record.host = j.value("host", std::string());
    record.port = j.value("port", uint16_t{0});
    record.protocol = j.value("protocol", std::string());
    record.version = j.value("version", std::string());
    record.metadata =
        j.value("metadata", std::map<std::string, std::string>());
    record.healthy = j.value("healthy", true);
    return record;
}

}  // namespace

std::string encode_message(const BroadcastMessage& message) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      message.timestamp.time_since_epoch())
                      .count();
    nlohmann::json j{{"type", type_name(message.type)},
                     {"service", record_to_wire(message.service)},
                     {"timestamp", millis}};
    return j.dump();
}

BroadcastMessage decode_message(const std::string& payload,
                                boost::system::error_code& ec) {
    ec = {};
    BroadcastMessage message;
    try {
        auto j = nlohmann::json::parse(payload);
        auto type = j.at("type").get<std::string>();
        if (type == "announce") {
            message.type = BroadcastMessageType::announce;
        } else if (type == "query") {
            message.type = BroadcastMessageType::query;
        } else if (type == "response") {
            message.type = BroadcastMessageType::response;
        } else {
            ec = errc::invalid_service_info;
            return {};
        }
        message.service = record_from_wire(j.at("service"));
        message.timestamp = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(j.at("timestamp").get<int64_t>()));
    } catch (const nlohmann::json::exception&) {
        ec = errc::invalid_service_info;
        return {};
    }
    if (message.service.name.empty()) {
        ec = errc::invalid_service_info;
        return {};
    }
    return message;
}

BroadcastService::BroadcastService(BroadcastOptions options)
    : _options(std::move(options)), _announce_timer(_io_context) {}

BroadcastService::~BroadcastService() {
    if (_running) {
        stop();
    }
}

boost::system::error_code BroadcastService::start() {
    std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
    if (_running) {
        return errc::already_running;
    }

    if (auto ec = _open_socket()) {
        HARBOR_LOG_ERROR << "Could not join multicast group "
                         << _options.multicast_address << ":" << _options.port
                         << ": " << ec.message();
        _socket.reset();
        return ec;
    }

    _running = true;
    _io_context.restart();
    _do_receive();
    asio::post(_io_context, [this]() { _announce_local(); });
    _schedule_announce();
    _thread = std::thread([this]() { _io_context.run(); });

    HARBOR_LOG_INFO << "Broadcast discovery started on "
                    << _group_endpoint.address().to_string() << ":"
                    << local_port();
    return {};
}

boost::system::error_code BroadcastService::stop() {
    std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
    if (!_running) {
        return errc::not_running;
    }
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _running = false;
    }
    _discovered_cv.notify_all();

    // The socket and timer belong to the io thread.
    asio::post(_io_context, [this]() {
        boost::system::error_code ignored;
        _announce_timer.cancel();
        _socket->close(ignored);
    });
    if (_thread.joinable()) {
        _thread.join();
    }
    _socket.reset();
    _bound_port = 0;

    HARBOR_LOG_INFO << "Broadcast discovery stopped";
    return {};
}

boost::system::error_code BroadcastService::_open_socket() {
    boost::system::error_code ec;
    auto group = asio::ip::make_address(_options.multicast_address, ec);
    if (ec) {
        return ec;
    }
    if (!group.is_multicast()) {
        return asio::error::invalid_argument;
    }
    asio::ip::address_v4 interface_v4;
    if (!_options.interface_address.empty()) {
        interface_v4 = asio::ip::make_address_v4(_options.interface_address, ec);
        if (ec) {
            return ec;
        }
    }

    udp::endpoint listen_endpoint(group.is_v6() ? udp::v6() : udp::v4(),
                                  _options.port);
    _socket = std::make_unique<udp::socket>(_io_context);
    _socket->open(listen_endpoint.protocol(), ec);
    if (!ec) _socket->set_option(udp::socket::reuse_address(true), ec);
    if (!ec) _socket->bind(listen_endpoint, ec);
    if (!ec) {
        if (group.is_v4() && !interface_v4.is_unspecified()) {
            _socket->set_option(
                asio::ip::multicast::join_group(group.to_v4(), interface_v4), ec);
            if (!ec) {
                _socket->set_option(
                    asio::ip::multicast::outbound_interface(interface_v4), ec);
            }
        } else {
            _socket->set_option(asio::ip::multicast::join_group(group), ec);
        }
    }
    if (!ec) _socket->set_option(asio::ip::multicast::hops(_options.ttl), ec);
    if (!ec) {
        _socket->set_option(
            asio::ip::multicast::enable_loopback(_options.loopback), ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        _socket->close(ignored);
        return ec;
    }

    _bound_port = _socket->local_endpoint(ec).port();
    if (ec) {
        return ec;
    }
    _group_endpoint = udp::endpoint(group, _bound_port);
    return {};
}

void BroadcastService::_do_receive() {
    _socket->async_receive_from(
        asio::buffer(_buffer), _sender,
        [this](boost::system::error_code ec, std::size_t bytes_received) {
            if (ec == asio::error::operation_aborted || !_running) {
                return;
            }
            if (ec) {
                HARBOR_LOG_WARN << "Broadcast receive failed: " << ec.message();
            } else {
                std::string payload(_buffer.data(), bytes_received);
                boost::system::error_code decode_ec;
                auto message = decode_message(payload, decode_ec);
                if (decode_ec) {
                    HARBOR_LOG_DEBUG << "Dropped malformed broadcast from "
                                     << _sender.address().to_string();
                } else {
                    handle_message(message);
                }
            }
            _do_receive();
        });
}

void BroadcastService::_schedule_announce() {
    _announce_timer.expires_after(_options.announcement_interval);
    _announce_timer.async_wait([this](boost::system::error_code ec) {
        if (ec || !_running) {
            return;
        }
        _announce_local();
        auto removed = clean_expired();
        if (removed > 0) {
            HARBOR_LOG_DEBUG << "Forgot " << removed
                             << " silent broadcast services";
        }
        _schedule_announce();
    });
}

void BroadcastService::_announce_local() {
    for (auto& record : local_services()) {
        BroadcastMessage message;
        message.type = BroadcastMessageType::announce;
        message.service = std::move(record);
        message.timestamp = std::chrono::system_clock::now();
        _send(message);
    }
}

void BroadcastService::_send(const BroadcastMessage& message) {
    if (!_running) {
        return;
    }
    auto payload = std::make_shared<std::string>(encode_message(message));
    auto name = message.service.name;
    asio::post(_io_context, [this, payload, name]() {
        if (!_socket || !_socket->is_open()) {
            return;
        }
        _socket->async_send_to(
            asio::buffer(*payload), _group_endpoint,
            [payload, name](boost::system::error_code ec, std::size_t) {
                if (ec && ec != asio::error::operation_aborted) {
                    HARBOR_LOG_WARN << "Broadcast send for " << name
                                    << " failed: " << ec.message();
                }
            });
    });
}

void BroadcastService::set_local_service(const ServiceRecord& record) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _local[record.name] = record;
    }
    BroadcastMessage message;
    message.type = BroadcastMessageType::announce;
    message.service = record;
    message.timestamp = std::chrono::system_clock::now();
    _send(message);
}

bool BroadcastService::clear_local_service(const std::string& name) {
    std::lock_guard<std::mutex> lock(_mutex);
    return _local.erase(name) > 0;
}

std::vector<ServiceRecord> BroadcastService::local_services() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<ServiceRecord> records;
    records.reserve(_local.size());
    for (const auto& [name, record] : _local) {
        records.push_back(record);
    }
    return records;
}

ServiceRecord BroadcastService::discover(const std::string& name,
                                         boost::system::error_code& ec) {
    return discover(name, _options.discovery_timeout, ec);
}

ServiceRecord BroadcastService::discover(const std::string& name,
                                         std::chrono::milliseconds timeout,
                                         boost::system::error_code& ec,
                                         std::stop_token stop) {
    ec = {};
    if (name.empty()) {
        ec = errc::invalid_service_info;
        return {};
    }
    if (!_running) {
        ec = errc::not_running;
        return {};
    }

    auto found = [&](ServiceRecord& out) {
        auto it = _discovered.find(name);
        if (it == _discovered.end() || !it->second.healthy ||
            !_is_fresh(it->second, std::chrono::steady_clock::now())) {
            return false;
        }
        out = it->second;
        return true;
    };

    ServiceRecord record;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (found(record)) {
            return record;
        }
    }

    BroadcastMessage query;
    query.type = BroadcastMessageType::query;
    query.service.name = name;
    query.timestamp = std::chrono::system_clock::now();
    _send(query);

    std::unique_lock<std::mutex> lock(_mutex);
    bool answered = _discovered_cv.wait_for(
        lock, stop, timeout, [&] { return !_running || found(record); });
    if (answered && _running) {
        return record;
    }
    if (stop.stop_requested()) {
        ec = errc::cancelled;
    } else if (!_running) {
        ec = errc::not_running;
    } else {
        ec = errc::discovery_timeout;
    }
    return {};
}

std::vector<ServiceRecord> BroadcastService::list() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<ServiceRecord> records;
    records.reserve(_discovered.size());
    for (const auto& [name, record] : _discovered) {
        records.push_back(record);
    }
    return records;
}

std::size_t BroadcastService::clean_expired() {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(_mutex);
    std::size_t removed = 0;
    for (auto it = _discovered.begin(); it != _discovered.end();) {
        if (_is_fresh(it->second, now)) {
            ++it;
        } else {
            it = _discovered.erase(it);
            ++removed;
        }
    }
    return removed;
}

void BroadcastService::handle_message(const BroadcastMessage& message) {
    if (message.service.name.empty()) {
        return;
    }
    if (std::chrono::system_clock::now() - message.timestamp >
        _options.max_message_age) {
        HARBOR_LOG_DEBUG << "Ignored stale broadcast " << type_name(message.type)
                         << " for " << message.service.name;
        return;
    }

    if (message.type == BroadcastMessageType::query) {
        ServiceRecord local;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _local.find(message.service.name);
            if (it == _local.end()) {
                return;
            }
            local = it->second;
        }
        BroadcastMessage response;
        response.type = BroadcastMessageType::response;
        response.service = std::move(local);
        response.timestamp = std::chrono::system_clock::now();
        _send(response);
        return;
    }

    auto record = message.service;
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _discovered.find(record.name);
        record.registered_at =
            it != _discovered.end() ? it->second.registered_at : now;
        record.last_heartbeat = now;
        record.metadata["source"] = "broadcast";
        _discovered[record.name] = std::move(record);
    }
    _discovered_cv.notify_all();
}

bool BroadcastService::_is_fresh(const ServiceRecord& record,
                                 std::chrono::steady_clock::time_point now) const {
    return now - record.last_heartbeat <= 3 * _options.announcement_interval;
}

}  // namespace harbor::discovery
