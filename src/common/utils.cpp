#include "common/utils.hpp"

#include <algorithm>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>

//========================================================
std::optional<struct sockaddr_in> utils::to_sockaddr_in(const std::string &addr, const uint16_t port)
{
  struct sockaddr_in sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_port   = htons(port);
  sa.sin_family = AF_INET;
  if (addr.empty())
  {
    sa.sin_addr.s_addr = INADDR_ANY;
  }
  else
  {
    if (!inet_pton(AF_INET, addr.c_str(), &(sa.sin_addr)))
    {
      return {};
    }
  }
  return sa;
}

//========================================================
std::optional<struct sockaddr_in> utils::resolve_sockaddr_in(const std::string &host, const uint16_t port)
{
  if (host.empty())
  {
    return {};
  }

  const auto numeric = to_sockaddr_in(host, port);
  if (numeric)
  {
    return numeric;
  }

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family   = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  struct addrinfo *res = nullptr;
  if ((getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0) || (res == nullptr))
  {
    return {};
  }

  struct sockaddr_in sa;
  std::memcpy(&sa, res->ai_addr, sizeof(struct sockaddr_in));
  freeaddrinfo(res);
  sa.sin_port = htons(port);
  return sa;
}

//========================================================
bool utils::same_host(const struct sockaddr_in &a, const struct sockaddr_in &b)
{
  return (a.sin_family == b.sin_family) && (a.sin_addr.s_addr == b.sin_addr.s_addr);
}

//========================================================
bool utils::same_address(const struct sockaddr_in &a, const struct sockaddr_in &b)
{
  return same_host(a, b) && (a.sin_port == b.sin_port);
}

//========================================================
std::vector<std::string> utils::extract_c_strings_from_buffer(const std::vector<char> &buffer, const size_t offset)
{
  std::vector<std::string> ret;
  if (offset >= buffer.size())
  {
    return ret;
  }

  auto start = buffer.begin() + offset;
  for (auto end = std::find(start, buffer.end(), 0); end != buffer.end(); end = std::find(start, buffer.end(), 0))
  {
    ret.emplace_back(start, end);
    start = std::next(end);
  }
  return ret;
}
