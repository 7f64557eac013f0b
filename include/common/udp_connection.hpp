#pragma once

#include <netinet/in.h>
#include <string>
#include <vector>

#include "common/transport.hpp"

class udp_connection : public tftpc::transport
{
public:
  udp_connection();
  udp_connection(const udp_connection &)            = delete;
  udp_connection(udp_connection &&)                 = delete;
  udp_connection &operator=(const udp_connection &) = delete;
  udp_connection &operator=(udp_connection &&)      = delete;
  ~udp_connection() override;

  void               bind(const std::string &ip_address, const uint16_t port_num);
  struct sockaddr_in local_address() const;

  void              send_to(const std::vector<char> &data, const struct sockaddr_in &destination) override;
  std::vector<char> recv_from(struct sockaddr_in &sender, const size_t size,
                              const std::chrono::milliseconds timeout) override;

private:
  int _sd;
};
