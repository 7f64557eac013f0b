#include "client/tftp_client.hpp"

#include <chrono>
#include <filesystem>

#include "common/debug_macros.hpp"
#include "common/udp_connection.hpp"
#include "common/utils.hpp"

namespace
{
  tftp_client_connection::result_t transfer(const tftpc::packet_t type, const std::string &filename,
                                            const std::string &local_path, const std::string &tftp_server,
                                            const tftp_client::config_t &config)
  {
    const auto server = utils::resolve_sockaddr_in(tftp_server, config.port);
    if (!server)
    {
      dbg_err("Failed to resolve host '{}'", tftp_server);
      tftp_client_connection::result_t result;
      result.status  = tftp_client_connection::status_t::UNKNOWN_HOST;
      result.message = fmt::format("Error: Unknown host '{}'.", tftp_server);
      return result;
    }

    udp_connection udp;
    udp.bind(config.local_interface, 0);
    dbg_dbg("Bound to {}, sending {} for '{}' to {}", udp.local_address(), tftpc::packet_type_to_string(type),
            filename, server.value());

    tftp_client_connection connection(udp, type, filename, local_path, server.value(), config.max_retries,
                                      std::chrono::seconds(config.timeout_s));
    return connection.run();
  }
}; // namespace

//========================================================
tftp_client_connection::result_t tftp_client::get_file(const std::string &filename, const std::string &tftp_server,
                                                       const config_t &config)
{
  const std::filesystem::path out_filename(filename);
  return transfer(tftpc::packet_t::READ, filename, out_filename.filename().string(), tftp_server, config);
}

//========================================================
tftp_client_connection::result_t tftp_client::send_file(const std::string &filename, const std::string &tftp_server,
                                                        const config_t &config)
{
  return transfer(tftpc::packet_t::WRITE, filename, filename, tftp_server, config);
}
