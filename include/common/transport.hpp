#pragma once

#include <chrono>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace tftpc
{

  /* Thrown by transport::recv_from when nothing arrived within the given timeout */
  class timeout_error : public std::runtime_error
  {
  public:
    explicit timeout_error(const std::string &what) : std::runtime_error(what){};
  };

  /**
   * @brief Datagram transport used by a transfer session
   *
   * Implementations own the underlying socket. recv_from blocks until a datagram arrives or the
   * timeout elapses, in which case it throws timeout_error. Any other failure is reported with
   * std::runtime_error.
   */
  class transport
  {
  public:
    virtual ~transport() = default;

    virtual void              send_to(const std::vector<char> &data, const struct sockaddr_in &destination) = 0;
    virtual std::vector<char> recv_from(struct sockaddr_in &sender, const size_t size,
                                        const std::chrono::milliseconds timeout)                            = 0;
  };

} // namespace tftpc
