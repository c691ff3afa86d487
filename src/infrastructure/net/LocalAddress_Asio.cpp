#include "infrastructure/net/LocalAddress_Asio.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>

using burrow::host::domain::AddressFamily;

namespace burrow::host::infrastructure::net
{

bool is_local(const std::string& ip, AddressFamily family)
{
  using tcp = boost::asio::ip::tcp;

  // throws on malformed text
  const auto addr = boost::asio::ip::make_address(ip);

  boost::asio::io_context io;
  tcp::socket sock(io);  // closed on every exit path
  sock.open(family == AddressFamily::ipv6 ? tcp::v6() : tcp::v4());

  boost::system::error_code ec;
  sock.bind(tcp::endpoint{addr, 0}, ec);
  if (!ec) return true;
  if (ec == boost::system::errc::address_not_available) return false;
  throw boost::system::system_error(ec, "bind " + ip);
}

}  // namespace burrow::host::infrastructure::net
