#include "harbor/discovery/error.hpp"

#include <string>

namespace harbor::discovery {

namespace {

class discovery_error_category : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "harbor.discovery"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::service_not_found:
                return "service not found";
            case errc::invalid_service_info:
                return "invalid service information";
            case errc::port_range_exhausted:
                return "no ports available in range";
            case errc::invalid_port_range:
                return "invalid port range";
            case errc::unknown_port_range:
                return "unknown port range";
            case errc::port_already_allocated:
                return "port already allocated";
            case errc::discovery_timeout:
                return "discovery timed out";
            case errc::strategy_disabled:
                return "discovery strategy disabled";
            case errc::already_running:
                return "already running";
            case errc::not_running:
                return "not running";
            case errc::probe_failed:
                return "health probe failed";
            case errc::cancelled:
                return "operation cancelled";
        }
        return "unknown discovery error";
    }
};

}  // namespace

const boost::system::error_category& discovery_category() noexcept {
    static const discovery_error_category category{};
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), discovery_category()};
}

}  // namespace harbor::discovery
