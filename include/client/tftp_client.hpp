#pragma once

#include <string>

#include "client/tftp_client_connection.hpp"
#include "common/tftp.hpp"

namespace tftp_client
{
  static const unsigned int DEFAULT_TIMEOUT_S   = 5;
  static const uint8_t      DEFAULT_MAX_RETRIES = 5;

  struct config_t
  {
    config_t() :
        port(tftpc::DEFAULT_PORT), timeout_s(DEFAULT_TIMEOUT_S), max_retries(DEFAULT_MAX_RETRIES), local_interface(""){};
    uint16_t     port;
    unsigned int timeout_s;
    uint8_t      max_retries;
    std::string  local_interface;
  };

  /* Uploads filename, the server stores it under the same name */
  tftp_client_connection::result_t send_file(const std::string &filename, const std::string &tftp_server,
                                             const config_t &config = config_t());

  /* Downloads filename into the current directory, keeping only its base name */
  tftp_client_connection::result_t get_file(const std::string &filename, const std::string &tftp_server,
                                            const config_t &config = config_t());

}; // namespace tftp_client
