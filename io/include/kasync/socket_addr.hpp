/**
 * @file socket_addr.hpp
 * @brief IPv4 socket address
 */

#ifndef KASYNC_SOCKET_ADDR_HPP
#define KASYNC_SOCKET_ADDR_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kasync::io
{

struct SocketAddr
{
   std::array<std::uint8_t, 4> ip{};
   std::uint16_t port{0};

   constexpr SocketAddr() = default;
   constexpr SocketAddr(std::array<std::uint8_t, 4> ip, std::uint16_t port) : ip(ip), port(port) {}

   /**
    * @brief Parse "a.b.c.d:port"
    * @return nullopt on any syntax error or out-of-range component
    */
   static std::optional<SocketAddr> parse(std::string_view text);

   [[nodiscard]] std::string to_string() const;

   bool operator==(SocketAddr const&) const = default;
};

} // namespace kasync::io

#endif // KASYNC_SOCKET_ADDR_HPP
