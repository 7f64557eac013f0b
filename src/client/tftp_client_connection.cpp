#include "client/tftp_client_connection.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "common/debug_macros.hpp"
#include "common/utils.hpp"

namespace
{
  const char DOWNLOAD_COMPLETE_MSG[] = "File transfer completed.";
  const char UPLOAD_COMPLETE_MSG[]   = "File upload completed.";
  const char UNREACHABLE_MSG[]       = "Error: Transfer timed out, peer unreachable.";
}; // namespace

//========================================================
tftp_client_connection::tftp_client_connection(tftpc::transport &udp, const tftpc::packet_t type,
                                               const std::string &filename, const std::string &local_path,
                                               const struct sockaddr_in &server, const uint8_t max_retries,
                                               const std::chrono::milliseconds timeout) :
    _logger(spdlog::get(TFTPC_LOGGER_NAME)),
    _udp(udp),
    _type(type),
    _filename(filename),
    _local_path(local_path),
    _server(server),
    _peer(server),
    _peer_str(utils::sockaddr_to_str(server)),
    _peer_known(false),
    _file_reader(),
    _file_writer(),
    _data_pkt(),
    _last_pkt{},
    _state(state_t::INIT),
    _result(),
    _max_retries(max_retries),
    _timeout(timeout),
    _deadline(),
    _timeout_count(0),
    _block_number(0),
    _blocks_accepted(0),
    _final_block(false)
{
  if (!_logger)
  {
    _logger = spdlog::default_logger();
  }

  switch (_type)
  {
  case tftpc::packet_t::READ: {
    _block_number = 1;
    break;
  }
  case tftpc::packet_t::WRITE: {
    _block_number = 0;
    break;
  }
  case tftpc::packet_t::DATA:
  case tftpc::packet_t::ACK:
  case tftpc::packet_t::ERROR:
  case tftpc::packet_t::UNKNOWN:
  default: {
    throw std::invalid_argument("A transfer must be a read or a write request");
  }
  }
}

//========================================================
tftp_client_connection::~tftp_client_connection() = default;

//========================================================
/**
 * @brief Runs the transfer to completion
 *
 * Returns once the transfer completed or failed. Failures reported by the server, local file
 * problems and an unresponsive server end up in the returned result. Socket errors from the
 * transport are thrown, a partially downloaded file is removed first.
 */
tftp_client_connection::result_t tftp_client_connection::run()
{
  if (_state != state_t::INIT)
  {
    throw std::logic_error("Transfer has already been run");
  }

  if (!open_local_file())
  {
    return _result;
  }

  try
  {
    send_request();

    while ((_state == state_t::AWAITING_RESPONSE) || (_state == state_t::TRANSFERRING))
    {
      struct sockaddr_in sender;
      const auto         data = receive(sender);
      if (!data)
      {
        continue;
      }

      const auto opcode = tftpc::deserialise_opcode(data.value());
      if (!opcode)
      {
        log_warn(_logger, "Ignoring malformed datagram of {} bytes from {}", data->size(), sender);
        continue;
      }

      switch (opcode.value())
      {
      case tftpc::packet_t::DATA: {
        handle_data(data.value(), sender);
        break;
      }
      case tftpc::packet_t::ACK: {
        handle_ack(data.value(), sender);
        break;
      }
      case tftpc::packet_t::ERROR: {
        handle_error(data.value());
        break;
      }
      case tftpc::packet_t::READ:
      case tftpc::packet_t::WRITE:
      case tftpc::packet_t::UNKNOWN:
      default: {
        log_warn(_logger, "Ignoring unexpected {} packet from {}", tftpc::packet_type_to_string(opcode.value()),
                 sender);
        break;
      }
      }
    }
  }
  catch (const std::exception &err)
  {
    log_error(_logger, "Transfer of '{}' aborted in '{}' : {}", _filename, state_to_string(_state), err.what());
    _state = state_t::FAILED;
    _file_writer.discard();
    throw;
  }

  if ((_state == state_t::FAILED) && (_type == tftpc::packet_t::READ))
  {
    _file_writer.discard();
  }
  _file_reader.close();
  return _result;
}

//========================================================
tftp_client_connection::state_t tftp_client_connection::state() const
{
  return _state;
}

//========================================================
const tftp_client_connection::result_t &tftp_client_connection::result() const
{
  return _result;
}

//========================================================
bool tftp_client_connection::peer_known() const
{
  return _peer_known;
}

//========================================================
const struct sockaddr_in &tftp_client_connection::peer() const
{
  return _peer;
}

//========================================================
/**
 * @brief Opens the download destination or the upload source
 *
 * Done before the request is sent so a missing source never causes network traffic.
 */
bool tftp_client_connection::open_local_file()
{
  if (_type == tftpc::packet_t::READ)
  {
    try
    {
      _file_writer.open(_local_path);
    }
    catch (const std::exception &err)
    {
      log_error(_logger, "Failed to open file '{}' for writing : {}", _local_path, err.what());
      fail(status_t::LOCAL_IO_ERROR, fmt::format("Error: Cannot write file '{}': {}.", _local_path, err.what()));
      return false;
    }
    return true;
  }

  std::error_code ec;
  if (!std::filesystem::exists(_local_path, ec))
  {
    log_error(_logger, "File '{}' does not exist", _local_path);
    fail(status_t::FILE_NOT_FOUND, fmt::format("Error: File '{}' not found.", _local_path),
         static_cast<uint16_t>(tftpc::error_t::FILE_NOT_FOUND));
    return false;
  }
  if (std::filesystem::is_directory(_local_path, ec))
  {
    log_error(_logger, "'{}' is a directory", _local_path);
    fail(status_t::LOCAL_IO_ERROR, fmt::format("Error: Cannot read file '{}': Is a directory.", _local_path));
    return false;
  }

  try
  {
    _file_reader.open(_local_path);
  }
  catch (const std::exception &err)
  {
    log_error(_logger, "Failed to open file '{}' for reading : {}", _local_path, err.what());
    fail(status_t::LOCAL_IO_ERROR, fmt::format("Error: Cannot read file '{}': {}.", _local_path, err.what()));
    return false;
  }
  return true;
}

//========================================================
void tftp_client_connection::send_request()
{
  const tftpc::rw_packet_t request(_filename, _type);
  send_packet(tftpc::serialise_rw_packet(request));
  _state = state_t::AWAITING_RESPONSE;
  log_debug(_logger, "Sent {} for '{}' to {}", tftpc::packet_type_to_string(_type), _filename, _server);
}

//========================================================
/**
 * @brief Sends a packet to the server and remembers it for retransmission
 *
 * Goes to the request address until the server's transfer ID is known, to the peer afterwards.
 */
void tftp_client_connection::send_packet(std::vector<char> data)
{
  _last_pkt = std::move(data);
  retransmit();
}

//========================================================
void tftp_client_connection::retransmit()
{
  _udp.send_to(_last_pkt, _peer_known ? _peer : _server);
  _deadline = std::chrono::steady_clock::now() + _timeout;
}

//========================================================
void tftp_client_connection::send_error(const tftpc::error_t code, const std::string &msg)
{
  if (!_peer_known)
  {
    return;
  }
  _udp.send_to(tftpc::serialise_error_packet(tftpc::error_packet_t(code, msg)), _peer);
  log_trace(_logger, "Sent error {} '{}' to {}", static_cast<uint16_t>(code), msg, _peer_str);
}

//========================================================
/**
 * @brief Waits for the next datagram from the server
 *
 * The wait ends at the deadline set when the last packet was sent, datagrams that are ignored
 * do not extend it. A timeout retransmits the last packet, or fails the transfer once the
 * retries are used up. Returns nullopt when there is nothing to process.
 */
std::optional<std::vector<char>> tftp_client_connection::receive(struct sockaddr_in &sender)
{
  const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(_deadline - std::chrono::steady_clock::now());
  if (remaining.count() <= 0)
  {
    handle_timeout();
    return {};
  }

  std::vector<char> data;
  try
  {
    data = _udp.recv_from(sender, tftpc::DATA_PKT_MAX_SIZE, remaining);
  }
  catch (const tftpc::timeout_error &)
  {
    handle_timeout();
    return {};
  }

  if (!is_from_peer(sender, data))
  {
    return {};
  }
  return data;
}

//========================================================
void tftp_client_connection::handle_timeout()
{
  if (_timeout_count >= _max_retries)
  {
    log_error(_logger, "No reply after {} retransmits, ending transfer [{}]", _timeout_count, _peer_str);
    fail(status_t::PEER_UNREACHABLE, UNREACHABLE_MSG);
    return;
  }

  _timeout_count += 1;
  log_warn(_logger, "Timed out in '{}': retransmitting last packet ({}/{}) [{}]", state_to_string(_state),
           _timeout_count, _max_retries, _peer_str);
  retransmit();
}

//========================================================
/**
 * @brief Checks a datagram belongs to this transfer
 *
 * Before the first reply anything from the server host is accepted. Afterwards only the learned
 * transfer ID is, strays get an UNKNOWN_TID error as RFC 1350 asks unless they are errors
 * themselves.
 */
bool tftp_client_connection::is_from_peer(const struct sockaddr_in &sender, const std::vector<char> &data)
{
  if (!_peer_known)
  {
    if (!utils::same_host(sender, _server))
    {
      log_warn(_logger, "Ignoring datagram from {}, request was sent to {}", sender, _server);
      return false;
    }
    return true;
  }

  if (utils::same_address(sender, _peer))
  {
    return true;
  }

  log_warn(_logger, "Datagram from unknown transfer ID {} [{}]", sender, _peer_str);
  if (tftpc::deserialise_opcode(data) != tftpc::packet_t::ERROR)
  {
    _udp.send_to(
        tftpc::serialise_error_packet(tftpc::error_packet_t(tftpc::error_t::UNKNOWN_TID, "Unknown transfer ID")),
        sender);
  }
  return false;
}

//========================================================
void tftp_client_connection::learn_peer(const struct sockaddr_in &sender)
{
  if (_peer_known)
  {
    return;
  }
  _peer       = sender;
  _peer_known = true;
  _peer_str   = utils::sockaddr_to_str(_peer);
  log_debug(_logger, "Server transfer ID is {}", _peer_str);
}

//========================================================
void tftp_client_connection::handle_data(const std::vector<char> &data, const struct sockaddr_in &sender)
{
  if (_type != tftpc::packet_t::READ)
  {
    log_warn(_logger, "Ignoring DATA packet during an upload [{}]", _peer_str);
    return;
  }

  const auto data_packet = tftpc::deserialise_data_packet(data);
  if (!data_packet)
  {
    log_warn(_logger, "Ignoring malformed DATA packet of {} bytes [{}]", data.size(), _peer_str);
    return;
  }

  if (data_packet->block_number == _block_number)
  {
    learn_peer(sender);
    _timeout_count = 0;
    _state         = state_t::TRANSFERRING;
    log_trace(_logger, "Received block {} of {} bytes [{}]", _block_number, data_packet->data.size(), _peer_str);

    const bool final_block = data_packet->data.size() < tftpc::DATA_PKT_DATA_MAX_SIZE;

    // Buffered writes only fail on flush, so the last block is not acknowledged before the close
    _file_writer.write(data_packet->data);
    if (_file_writer.error() || (final_block && !_file_writer.close()))
    {
      log_error(_logger, "Error occured when writing block {} to '{}'", _block_number, _local_path);
      send_error(tftpc::error_t::DISK_FULL, "Disk full or allocation exceeded");
      fail(status_t::LOCAL_IO_ERROR, fmt::format("Error: Failed writing to '{}'.", _local_path));
      return;
    }

    send_packet(tftpc::serialise_ack_packet(tftpc::ack_packet_t(_block_number)));

    _result.bytes_transferred += data_packet->data.size();
    ++_blocks_accepted;
    ++_block_number;

    if (final_block)
    {
      log_trace(_logger, "Final block is {} ({} bytes)", static_cast<uint16_t>(_block_number - 1),
                data_packet->data.size());
      complete(DOWNLOAD_COMPLETE_MSG);
    }
  }
  else if ((_blocks_accepted > 0) && (data_packet->block_number == static_cast<uint16_t>(_block_number - 1)))
  {
    // Our ack was lost, the last packet sent is the ack to this block
    log_trace(_logger, "Received duplicate of block {}, re-sending its ack [{}]", data_packet->block_number,
              _peer_str);
    retransmit();
  }
  else
  {
    log_warn(_logger, "Received unexpected block number ({}) expected {}, ignoring [{}]", data_packet->block_number,
             _block_number, _peer_str);
  }
}

//========================================================
void tftp_client_connection::handle_ack(const std::vector<char> &data, const struct sockaddr_in &sender)
{
  if (_type != tftpc::packet_t::WRITE)
  {
    log_warn(_logger, "Ignoring ACK packet during a download [{}]", _peer_str);
    return;
  }

  const auto ack_packet = tftpc::deserialise_ack_packet(data);
  if (!ack_packet)
  {
    log_warn(_logger, "Ignoring malformed ACK packet of {} bytes [{}]", data.size(), _peer_str);
    return;
  }

  if (ack_packet->block_number == _block_number)
  {
    learn_peer(sender);
    _timeout_count = 0;
    _result.bytes_transferred += _data_pkt.data.size();
    log_trace(_logger, "Received ack to block {} [{}]", _block_number, _peer_str);

    if (_final_block)
    {
      log_trace(_logger, "Received final ack ({}) [{}]", _block_number, _peer_str);
      complete(UPLOAD_COMPLETE_MSG);
      return;
    }
    send_next_block();
  }
  else if (_peer_known && (ack_packet->block_number == static_cast<uint16_t>(_block_number - 1)))
  {
    // Answering a duplicate ack would double every packet from here on (RFC 1123 4.2.3.1)
    log_trace(_logger, "Received duplicate ack to block {}, ignoring [{}]", ack_packet->block_number, _peer_str);
  }
  else if (_peer_known)
  {
    log_warn(_logger, "Received ack to block {} expected {}, re-sending block {} [{}]", ack_packet->block_number,
             _block_number, _block_number, _peer_str);
    retransmit();
  }
  else
  {
    log_warn(_logger, "Ignoring ack to block {} before the write request was acknowledged", ack_packet->block_number);
  }
}

//========================================================
void tftp_client_connection::send_next_block()
{
  _file_reader.read_in_to(_data_pkt.data, tftpc::DATA_PKT_DATA_MAX_SIZE);
  if (_file_reader.error())
  {
    log_error(_logger, "Read error occured on file '{}'", _local_path);
    send_error(tftpc::error_t::NOT_DEFINED, "Failed to read local file");
    fail(status_t::LOCAL_IO_ERROR, fmt::format("Error: Failed reading from '{}'.", _local_path));
    return;
  }

  ++_block_number;
  _data_pkt.block_number = _block_number;
  _final_block           = _data_pkt.data.size() < tftpc::DATA_PKT_DATA_MAX_SIZE;

  if (_final_block)
  {
    log_trace(_logger, "Sending final block {} ({} bytes) [{}]", _block_number, _data_pkt.data.size(), _peer_str);
  }
  else
  {
    log_trace(_logger, "Sending data packet, block {} [{}]", _block_number, _peer_str);
  }

  send_packet(tftpc::serialise_data_packet(_data_pkt));
  _state = state_t::TRANSFERRING;
}

//========================================================
void tftp_client_connection::handle_error(const std::vector<char> &data)
{
  const auto error_packet = tftpc::deserialise_error_packet(data);
  if (!error_packet)
  {
    log_warn(_logger, "Ignoring malformed ERROR packet of {} bytes [{}]", data.size(), _peer_str);
    return;
  }

  log_warn(_logger, "Server replied with error {} : '{}' [{}]", error_packet->error_code, error_packet->error_msg,
           _peer_str);
  fail(status_t::REMOTE_ERROR, fmt::format("Error: {}", tftpc::error_code_to_string(error_packet->error_code)),
       error_packet->error_code);
}

//========================================================
void tftp_client_connection::complete(const std::string &msg)
{
  _state          = state_t::COMPLETED;
  _result.status  = status_t::SUCCESS;
  _result.message = msg;
  log_debug(_logger, "Transfer of '{}' complete, {} bytes", _filename, _result.bytes_transferred);
}

//========================================================
void tftp_client_connection::fail(const status_t status, const std::string &msg, const uint16_t error_code)
{
  _state             = state_t::FAILED;
  _result.status     = status;
  _result.message    = msg;
  _result.error_code = error_code;
  log_debug(_logger, "Transfer of '{}' failed : {}", _filename, status_to_string(status));
}

//========================================================
std::string tftp_client_connection::state_to_string(const state_t state)
{
  switch (state)
  {
  case state_t::INIT:
    return std::string("Init");
  case state_t::AWAITING_RESPONSE:
    return std::string("Awaiting response");
  case state_t::TRANSFERRING:
    return std::string("Transferring");
  case state_t::COMPLETED:
    return std::string("Completed");
  case state_t::FAILED:
    return std::string("Failed");
  default:
    return std::string("UNKNOWN");
  }
}

//========================================================
std::string tftp_client_connection::status_to_string(const status_t status)
{
  switch (status)
  {
  case status_t::SUCCESS:
    return std::string("Success");
  case status_t::REMOTE_ERROR:
    return std::string("Remote error");
  case status_t::FILE_NOT_FOUND:
    return std::string("File not found");
  case status_t::LOCAL_IO_ERROR:
    return std::string("Local I/O error");
  case status_t::PEER_UNREACHABLE:
    return std::string("Peer unreachable");
  case status_t::UNKNOWN_HOST:
    return std::string("Unknown host");
  default:
    return std::string("UNKNOWN");
  }
}
