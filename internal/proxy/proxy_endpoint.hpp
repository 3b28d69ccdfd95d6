#pragma once

#include <string>

namespace fleetq::proxy {

// host:port:user:pass split into what a browser-like client needs.
struct ProxyEndpoint {
  std::string server; // http://host:port
  std::string username;
  std::string password;
};

// Throws util::InvalidArgument unless the string is exactly four
// colon-separated fields with a non-empty host and a port in 1..65535.
ProxyEndpoint ParseProxyEndpoint(const std::string& connection);

} // namespace fleetq::proxy
