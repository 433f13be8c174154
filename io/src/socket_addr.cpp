/**
 * @file socket_addr.cpp
 * @brief SocketAddr parsing and formatting
 */

#include "kasync/socket_addr.hpp"

#include <charconv>

namespace kasync::io
{

// Parse a decimal number that must consume the whole field
template<typename T>
static std::optional<T> parse_field(std::string_view field, unsigned max)
{
   if (field.empty() || field.size() > 5) return std::nullopt;

   unsigned value = 0;
   auto [end, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
   if (ec != std::errc{} || end != field.data() + field.size() || value > max) return std::nullopt;
   return static_cast<T>(value);
}

std::optional<SocketAddr> SocketAddr::parse(std::string_view text)
{
   const auto colon = text.rfind(':');
   if (colon == std::string_view::npos) return std::nullopt;

   auto port = parse_field<std::uint16_t>(text.substr(colon + 1), 65535);
   if (!port) return std::nullopt;

   SocketAddr addr;
   addr.port = *port;

   std::string_view host = text.substr(0, colon);
   for (std::size_t i = 0; i < addr.ip.size(); ++i) {
      const auto dot = host.find('.');
      const bool last = (i + 1 == addr.ip.size());
      if (last != (dot == std::string_view::npos)) return std::nullopt;

      auto octet = parse_field<std::uint8_t>(host.substr(0, dot), 255);
      if (!octet) return std::nullopt;
      addr.ip[i] = *octet;

      if (!last) host.remove_prefix(dot + 1);
   }
   return addr;
}

std::string SocketAddr::to_string() const
{
   std::string out;
   for (std::size_t i = 0; i < ip.size(); ++i) {
      if (i) out += '.';
      out += std::to_string(ip[i]);
   }
   out += ':';
   out += std::to_string(port);
   return out;
}

} // namespace kasync::io
