#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tftpc
{

  static const size_t   DATA_PKT_MAX_SIZE      = 516;
  static const size_t   DATA_PKT_DATA_MAX_SIZE = 512;
  static const size_t   ACK_PKT_MAX_SIZE       = 4;
  static const size_t   HEADER_SIZE            = 4;
  static const uint16_t DEFAULT_PORT           = 69;

  static const char OCTET_MODE[] = "octet";

  enum class packet_t : uint16_t
  {
    UNKNOWN = 0,
    READ,
    WRITE,
    DATA,
    ACK,
    ERROR
  };

  enum class error_t : uint16_t
  {
    NOT_DEFINED,
    FILE_NOT_FOUND,
    ACCESS_ERROR,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_EXISTS,
    NO_USER
  };

  std::string error_code_to_string(const uint16_t code);
  std::string packet_type_to_string(const packet_t type);

  struct rw_packet_t
  {
    rw_packet_t() : type(packet_t::READ), filename(""), mode(OCTET_MODE){};
    rw_packet_t(const std::string &f, const packet_t t) : type(t), filename(f), mode(OCTET_MODE){};
    packet_t    type;
    std::string filename;
    std::string mode;
  };

  struct data_packet_t
  {
    data_packet_t() : data{}, block_number(0){};
    std::vector<char> data;
    uint16_t          block_number;
  };

  struct ack_packet_t
  {
    explicit ack_packet_t(const uint16_t bn) : block_number(bn){};
    uint16_t block_number;
  };

  struct error_packet_t
  {
    error_packet_t() : error_msg(""), error_code(0){};
    error_packet_t(const error_t code, const std::string &msg) :
        error_msg(msg), error_code(static_cast<uint16_t>(code)){};
    std::string error_msg;
    uint16_t    error_code;
  };

  std::vector<char> serialise_rw_packet(const rw_packet_t &packet);
  std::vector<char> serialise_data_packet(const data_packet_t &packet);
  std::vector<char> serialise_ack_packet(const ack_packet_t &packet);
  std::vector<char> serialise_error_packet(const error_packet_t &packet);

  /**
   * @brief Reads the opcode of a raw datagram
   *
   * @return nullopt if the datagram is shorter than an opcode, packet_t::UNKNOWN if the
   * opcode is not one of the five RFC 1350 packet types.
   */
  std::optional<packet_t> deserialise_opcode(const std::vector<char> &data);

  std::optional<rw_packet_t>    deserialise_rw_packet(const std::vector<char> &data);
  std::optional<data_packet_t>  deserialise_data_packet(const std::vector<char> &data);
  std::optional<ack_packet_t>   deserialise_ack_packet(const std::vector<char> &data);
  std::optional<error_packet_t> deserialise_error_packet(const std::vector<char> &data);

} // namespace tftpc
