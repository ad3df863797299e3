// harbor/src/discovery/service_record.cpp
#include "harbor/discovery/service_record.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace harbor::discovery {

namespace {

bool contains_any(const std::string& lowered,
                  std::initializer_list<const char*> keywords) {
    return std::any_of(keywords.begin(), keywords.end(),
                       [&lowered](const char* keyword) {
                           return lowered.find(keyword) != std::string::npos;
                       });
}

long long age_ms(std::chrono::steady_clock::time_point tp,
                 std::chrono::steady_clock::time_point now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - tp)
        .count();
}

}  // namespace

std::string ServiceRecord::address() const {
    return host + ":" + std::to_string(port);
}

bool ServiceRecord::is_expired(std::chrono::steady_clock::time_point now) const {
    if (ttl.count() == 0) {
        return false;
    }
    return now - last_heartbeat > ttl;
}

std::string service_type_for(const std::string& service_name) {
    std::string lowered = service_name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    // First match wins.
    if (contains_any(lowered, {"postgres", "pg", "database", "db"})) {
        return "database";
    }
    if (contains_any(lowered, {"redis", "cache", "memcache"})) {
        return "cache";
    }
    if (contains_any(lowered, {"grpc"})) {
        return "grpc";
    }
    if (contains_any(lowered, {"metrics", "prometheus", "prom"})) {
        return "metrics";
    }
    if (contains_any(lowered, {"websocket", "ws"})) {
        return "websocket";
    }
    if (contains_any(lowered, {"api", "http"})) {
        return "api";
    }
    return "";
}

void to_json(nlohmann::json& j, const ServiceRecord& r) {
    auto now = std::chrono::steady_clock::now();
    j = nlohmann::json{{"name", r.name},
                       {"host", r.host},
                       {"port", r.port},
                       {"protocol", r.protocol},
                       {"version", r.version},
                       {"metadata", r.metadata},
                       {"healthy", r.healthy},
                       {"registered_ago_ms", age_ms(r.registered_at, now)},
                       {"last_heartbeat_ago_ms", age_ms(r.last_heartbeat, now)},
                       {"ttl_ms", r.ttl.count()}};
}

}  // namespace harbor::discovery
