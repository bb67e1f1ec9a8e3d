#include "xfer/transport.hpp"
#include "xfer/util.hpp"

#include <cctype>
#include <string>

namespace xfer {

std::string Endpoint::to_string() const {
  const std::string p = std::to_string(port);
  if (host.find(':') != std::string::npos) return "[" + host + "]:" + p;
  return host + ":" + p;
}

static std::uint16_t parse_port(const std::string& s, const std::string& text) {
  ensure(!s.empty() && s.size() <= 5, ErrorKind::Usage, "invalid port in address '" + text + "'");
  unsigned long v = 0;
  for (char c : s) {
    ensure(std::isdigit((unsigned char)c) != 0, ErrorKind::Usage,
           "invalid port in address '" + text + "'");
    v = v * 10 + (unsigned long)(c - '0');
  }
  ensure(v >= 1 && v <= 65535, ErrorKind::Usage, "port out of range in address '" + text + "'");
  return (std::uint16_t)v;
}

Endpoint parse_endpoint(const std::string& text) {
  Endpoint ep;
  std::string port_part;

  if (!text.empty() && text[0] == '[') {
    const std::size_t close = text.find(']');
    ensure(close != std::string::npos, ErrorKind::Usage, "unterminated '[' in address '" + text + "'");
    ensure(close + 1 < text.size() && text[close + 1] == ':', ErrorKind::Usage,
           "expected ':port' after ']' in address '" + text + "'");
    ep.host = text.substr(1, close - 1);
    ensure(!ep.host.empty(), ErrorKind::Usage, "empty host in address '" + text + "'");
    port_part = text.substr(close + 2);
  } else {
    const std::size_t colon = text.rfind(':');
    ensure(colon != std::string::npos, ErrorKind::Usage,
           "address '" + text + "' must have the form host:port");
    ep.host = text.substr(0, colon);
    ensure(ep.host.find(':') == std::string::npos, ErrorKind::Usage,
           "IPv6 address '" + text + "' must be written as [addr]:port");
    port_part = text.substr(colon + 1);
  }

  ep.port = parse_port(port_part, text);
  return ep;
}

} // namespace xfer
