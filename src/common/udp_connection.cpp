#include "common/udp_connection.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>

#include "common/debug_macros.hpp"
#include "common/utils.hpp"

//========================================================
udp_connection::udp_connection() : _sd(-1)
{
  _sd = socket(AF_INET, SOCK_DGRAM, 0);

  if (_sd < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
udp_connection::~udp_connection()
{
  if (_sd >= 0)
  {
    close(_sd);
  }
}

//========================================================
void udp_connection::bind(const std::string &ip_address, const uint16_t port_num)
{
  const auto sa = utils::to_sockaddr_in(ip_address, port_num);
  if (!sa)
  {
    throw std::runtime_error("Invalid address");
  }

  if (::bind(_sd, (const struct sockaddr *)&sa.value(), sizeof(struct sockaddr_in)) < 0)
  {
    dbg_err("Bind failed");
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
struct sockaddr_in udp_connection::local_address() const
{
  struct sockaddr_in sa;
  socklen_t          sa_len = sizeof(sa);
  std::memset(&sa, 0, sizeof(struct sockaddr_in));
  if (getsockname(_sd, (struct sockaddr *)&sa, &sa_len) < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
  return sa;
}

//========================================================
void udp_connection::send_to(const std::vector<char> &data, const struct sockaddr_in &destination)
{
  const ssize_t sent =
      ::sendto(_sd, data.data(), data.size(), 0, (const struct sockaddr *)&destination, sizeof(struct sockaddr_in));
  if (sent < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
std::vector<char> udp_connection::recv_from(struct sockaddr_in &sender, const size_t size,
                                            const std::chrono::milliseconds timeout)
{
  pollfd pfd = {
      .fd      = _sd,
      .events  = POLLIN,
      .revents = 0,
  };

  // A negative poll timeout blocks forever
  const int timeout_ms = (timeout.count() > 0) ? static_cast<int>(timeout.count()) : 0;
  const int ready      = poll(&pfd, 1, timeout_ms);
  if (ready < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
  if ((ready == 0) || !(pfd.revents & POLLIN))
  {
    throw tftpc::timeout_error("Timed out waiting for datagram");
  }

  std::vector<char> buffer(size, 0);
  socklen_t         sa_len = sizeof(sender);
  std::memset(&sender, 0, sizeof(struct sockaddr_in));

  const ssize_t received = ::recvfrom(_sd, buffer.data(), size, 0, (struct sockaddr *)&sender, &sa_len);
  if (received < 0)
  {
    throw std::runtime_error(utils::string_error(errno));
  }

  buffer.resize(static_cast<size_t>(received));
  return buffer;
}
