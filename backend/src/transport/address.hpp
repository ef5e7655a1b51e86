#pragma once
#include <string>
#include <string_view>

// "tcp://host:port" as used by both ends of the bridge.
// "*" as host means every interface (bind side only). Port 0 lets the
// receiver pick an ephemeral port.
struct TransportAddress
{
    std::string host;
    unsigned short port{0};

    std::string to_string() const;
};

// Throws ConfigError on anything that is not tcp://host:port.
TransportAddress parse_address(std::string_view addr);
