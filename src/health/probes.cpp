// harbor/src/health/probes.cpp
#include "harbor/health/probes.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <functional>

#include "harbor/discovery/dns_resolver.hpp"
#include "harbor/discovery/error.hpp"

namespace harbor::health {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Resolves within the deadline, then connects with whatever is left of it.
// No resolver lives on the probe's io_context, whose destructor would
// otherwise wait on a lookup that never returns.
bool start_connect(beast::tcp_stream& stream, const std::string& host,
                   uint16_t port, std::chrono::milliseconds timeout,
                   std::function<void(beast::error_code)> on_connect,
                   beast::error_code& ec) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto endpoints = discovery::resolve_endpoints(host, port, timeout, ec);
    if (ec) {
        return false;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        ec = beast::error::timeout;
        return false;
    }

    stream.expires_at(deadline);
    stream.async_connect(
        endpoints, [on_connect](beast::error_code ec, const tcp::endpoint&) {
            on_connect(ec);
        });
    return true;
}

void close_stream(beast::tcp_stream& stream) {
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    stream.socket().close(ignored);
}

}  // namespace

boost::system::error_code probe_tcp(const std::string& host, uint16_t port,
                                    std::chrono::milliseconds timeout) {
    net::io_context ioc;
    beast::tcp_stream stream(ioc);

    beast::error_code result = beast::error::timeout;
    beast::error_code ec;
    if (!start_connect(stream, host, port, timeout,
                       [&result](beast::error_code ec) { result = ec; }, ec)) {
        return ec;
    }
    ioc.run();

    close_stream(stream);
    return result;
}

boost::system::error_code probe_http(const std::string& host, uint16_t port,
                                     const std::string& target,
                                     std::chrono::milliseconds timeout,
                                     unsigned& status) {
    status = 0;

    net::io_context ioc;
    beast::tcp_stream stream(ioc);

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::connection, "close");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code result = beast::error::timeout;
    beast::error_code connect_ec;

    // The connect deadline also bounds the exchange.
    auto started = start_connect(
        stream, host, port, timeout,
        [&](beast::error_code ec) {
            if (ec) {
                result = ec;
                return;
            }
            http::async_write(
                stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) {
                        result = ec;
                        return;
                    }
                    http::async_read(stream, buffer, res,
                                     [&](beast::error_code ec, std::size_t) {
                                         result = ec;
                                     });
                });
        },
        connect_ec);
    if (!started) {
        return connect_ec;
    }
    ioc.run();

    close_stream(stream);

    if (result) {
        return result;
    }
    status = res.result_int();
    if (status < 200 || status >= 300) {
        return discovery::errc::probe_failed;
    }
    return {};
}

}  // namespace harbor::health
