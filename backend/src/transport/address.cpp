#include "transport/address.hpp"
#include "errors.hpp"

#include <charconv>

TransportAddress parse_address(std::string_view addr)
{
    constexpr std::string_view scheme = "tcp://";
    if (addr.substr(0, scheme.size()) != scheme) {
        throw ConfigError("address '" + std::string(addr) + "': expected tcp://host:port");
    }
    std::string_view rest = addr.substr(scheme.size());

    std::string_view host;
    std::string_view port_sv;
    if (!rest.empty() && rest.front() == '[') {
        // [v6-literal]:port
        const auto close = rest.find(']');
        if (close == std::string_view::npos || close + 1 >= rest.size() || rest[close + 1] != ':') {
            throw ConfigError("address '" + std::string(addr) + "': malformed IPv6 literal");
        }
        host = rest.substr(1, close - 1);
        port_sv = rest.substr(close + 2);
    } else {
        const auto colon = rest.rfind(':');
        if (colon == std::string_view::npos) {
            throw ConfigError("address '" + std::string(addr) + "': missing port");
        }
        host = rest.substr(0, colon);
        port_sv = rest.substr(colon + 1);
    }
    if (host.empty()) {
        throw ConfigError("address '" + std::string(addr) + "': missing host");
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), port);
    if (ec != std::errc() || ptr != port_sv.data() + port_sv.size() || port > 65535) {
        throw ConfigError("address '" + std::string(addr) + "': invalid port");
    }

    TransportAddress out;
    out.host = (host == "*") ? std::string("0.0.0.0") : std::string(host);
    out.port = static_cast<unsigned short>(port);
    return out;
}

std::string TransportAddress::to_string() const
{
    if (host.find(':') != std::string::npos) {
        return "tcp://[" + host + "]:" + std::to_string(port);
    }
    return "tcp://" + host + ":" + std::to_string(port);
}
