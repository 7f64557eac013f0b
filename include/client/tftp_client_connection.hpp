#pragma once

#include <arpa/inet.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "common/tftp.hpp"
#include "common/tftp_read_file.hpp"
#include "common/tftp_write_file.hpp"
#include "common/transport.hpp"

/**
 * @brief A single GET or PUT transfer against one server
 *
 * The connection does not own the transport, the caller keeps it alive for the duration of run().
 * A connection runs once, after run() returns it is in either the COMPLETED or FAILED state.
 */
class tftp_client_connection
{
public:
  enum class state_t
  {
    INIT,
    AWAITING_RESPONSE,
    TRANSFERRING,
    COMPLETED,
    FAILED
  };

  enum class status_t
  {
    SUCCESS,
    REMOTE_ERROR,
    FILE_NOT_FOUND,
    LOCAL_IO_ERROR,
    PEER_UNREACHABLE,
    UNKNOWN_HOST
  };

  struct result_t
  {
    result_t() : status(status_t::SUCCESS), error_code(0), message(""), bytes_transferred(0){};
    status_t    status;
    uint16_t    error_code;
    std::string message;
    size_t      bytes_transferred;

    bool success() const
    {
      return status == status_t::SUCCESS;
    }
  };

  /**
   * @param udp Transport used for every packet of the transfer
   * @param type packet_t::READ to download, packet_t::WRITE to upload
   * @param filename Name of the file on the server
   * @param local_path Destination of a download or source of an upload
   * @param server Address the request is sent to
   * @param max_retries Consecutive timeouts tolerated before giving up
   * @param timeout How long to wait for a reply to each packet sent
   */
  tftp_client_connection(tftpc::transport &udp, const tftpc::packet_t type, const std::string &filename,
                         const std::string &local_path, const struct sockaddr_in &server, const uint8_t max_retries,
                         const std::chrono::milliseconds timeout);
  ~tftp_client_connection();
  tftp_client_connection()                                          = delete;
  tftp_client_connection(const tftp_client_connection &)            = delete;
  tftp_client_connection(tftp_client_connection &&)                 = delete;
  tftp_client_connection &operator=(const tftp_client_connection &) = delete;
  tftp_client_connection &operator=(tftp_client_connection &&)      = delete;

  result_t run();

  state_t                   state() const;
  const result_t           &result() const;
  bool                      peer_known() const;
  const struct sockaddr_in &peer() const;

  static std::string state_to_string(const state_t state);
  static std::string status_to_string(const status_t status);

private:
  std::shared_ptr<spdlog::logger> _logger;
  tftpc::transport               &_udp;
  const tftpc::packet_t           _type;
  const std::string               _filename;
  const std::string               _local_path;
  const struct sockaddr_in        _server;
  struct sockaddr_in              _peer;
  std::string                     _peer_str;
  bool                            _peer_known;
  tftp_read_file                  _file_reader;
  tftp_write_file                 _file_writer;
  tftpc::data_packet_t            _data_pkt;
  std::vector<char>               _last_pkt;
  state_t                         _state;
  result_t                        _result;
  const uint8_t                         _max_retries;
  const std::chrono::milliseconds       _timeout;
  std::chrono::steady_clock::time_point _deadline;
  uint8_t                               _timeout_count;
  uint16_t                        _block_number;
  size_t                          _blocks_accepted;
  bool                            _final_block;

  bool open_local_file();
  void send_request();
  void send_packet(std::vector<char> data);
  void retransmit();
  void send_error(const tftpc::error_t code, const std::string &msg);

  std::optional<std::vector<char>> receive(struct sockaddr_in &sender);
  void                             handle_timeout();
  bool                             is_from_peer(const struct sockaddr_in &sender, const std::vector<char> &data);
  void                             learn_peer(const struct sockaddr_in &sender);

  void handle_data(const std::vector<char> &data, const struct sockaddr_in &sender);
  void handle_ack(const std::vector<char> &data, const struct sockaddr_in &sender);
  void handle_error(const std::vector<char> &data);
  void send_next_block();

  void complete(const std::string &msg);
  void fail(const status_t status, const std::string &msg, const uint16_t error_code = 0);
};
