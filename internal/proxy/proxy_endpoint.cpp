#include "proxy_endpoint.hpp"

#include <charconv>
#include <vector>

#include "internal/util/errors.hpp"

namespace fleetq::proxy {

namespace {

std::vector<std::string> Split(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::string::size_type   start = 0;
  for (;;) {
    const auto pos = s.find(sep, start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace

ProxyEndpoint ParseProxyEndpoint(const std::string& connection) {
  const auto parts = Split(connection, ':');
  if (parts.size() != 4) {
    throw util::InvalidArgument("proxy '" + connection + "': expected host:port:user:pass");
  }

  const auto& host = parts[0];
  const auto& port = parts[1];
  if (host.empty()) {
    throw util::InvalidArgument("proxy '" + connection + "': empty host");
  }

  int value = 0;
  const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
  if (port.empty() || ec != std::errc() || ptr != port.data() + port.size() || value < 1 || value > 65535) {
    throw util::InvalidArgument("proxy '" + connection + "': invalid port '" + port + "'");
  }

  if (parts[2].empty() || parts[3].empty()) {
    throw util::InvalidArgument("proxy '" + connection + "': missing credentials");
  }

  return ProxyEndpoint{"http://" + host + ":" + port, parts[2], parts[3]};
}

} // namespace fleetq::proxy
