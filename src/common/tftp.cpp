#include "common/tftp.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "common/utils.hpp"

namespace
{
  const char UNKNOWN_ERROR_STR[] = "Unknown error";

  uint16_t read_u16(const std::vector<char> &data, const size_t offset)
  {
    return (static_cast<uint16_t>(static_cast<unsigned char>(data.at(offset))) << 8) |
           static_cast<uint16_t>(static_cast<unsigned char>(data.at(offset + 1)));
  }

  void write_u16(std::vector<char> &data, const uint16_t value)
  {
    data.push_back(static_cast<char>(value >> 8));
    data.push_back(static_cast<char>(value & 0xFF));
  }

  bool has_opcode(const std::vector<char> &data, const tftpc::packet_t type)
  {
    const auto opcode = tftpc::deserialise_opcode(data);
    return opcode && (opcode.value() == type);
  }
}; // namespace

//========================================================
std::vector<char> tftpc::serialise_rw_packet(const rw_packet_t &packet)
{
  if ((packet.type != packet_t::READ) && (packet.type != packet_t::WRITE))
  {
    throw std::invalid_argument("Request packet must be a read or write request");
  }
  if (packet.filename.empty() || (packet.filename.find('\0') != std::string::npos))
  {
    throw std::invalid_argument("Request filename must be non empty and contain no null bytes");
  }
  if (packet.mode.find('\0') != std::string::npos)
  {
    throw std::invalid_argument("Request mode must contain no null bytes");
  }

  const size_t packet_size =
      2 + packet.filename.size() + 1 + packet.mode.size() + 1; // opcode + filename + null byte + mode + null_byte
  std::vector<char> ret;
  ret.reserve(packet_size);
  write_u16(ret, static_cast<uint16_t>(packet.type));
  ret.insert(ret.end(), packet.filename.begin(), packet.filename.end());
  ret.push_back(0);
  ret.insert(ret.end(), packet.mode.begin(), packet.mode.end());
  ret.push_back(0);
  return ret;
}

//========================================================
std::optional<tftpc::rw_packet_t> tftpc::deserialise_rw_packet(const std::vector<char> &data)
{
  const auto opcode = deserialise_opcode(data);
  if (!opcode || ((opcode.value() != packet_t::READ) && (opcode.value() != packet_t::WRITE)))
  {
    return {};
  }

  std::vector<std::string> params = utils::extract_c_strings_from_buffer(data, 2);
  if ((params.size() < 2) || params[0].empty())
  {
    return {};
  }

  rw_packet_t packet;
  packet.type     = opcode.value();
  packet.filename = std::move(params[0]);
  packet.mode     = std::move(params[1]);
  std::transform(packet.mode.begin(), packet.mode.end(), packet.mode.begin(), ::tolower);
  return packet;
}

//========================================================
std::vector<char> tftpc::serialise_data_packet(const data_packet_t &packet)
{
  if (packet.data.size() > DATA_PKT_DATA_MAX_SIZE)
  {
    throw std::invalid_argument("Data packet payload exceeds 512 bytes");
  }

  const size_t      packet_size = HEADER_SIZE + packet.data.size(); // opcode + block_number + data
  std::vector<char> ret;
  ret.reserve(packet_size);
  write_u16(ret, static_cast<uint16_t>(packet_t::DATA));
  write_u16(ret, packet.block_number);
  ret.insert(ret.end(), packet.data.begin(), packet.data.end());
  return ret;
}

//========================================================
std::optional<tftpc::data_packet_t> tftpc::deserialise_data_packet(const std::vector<char> &data)
{
  if ((data.size() < HEADER_SIZE) || !has_opcode(data, packet_t::DATA))
  {
    return {};
  }

  data_packet_t packet;
  packet.block_number = read_u16(data, 2);
  packet.data.assign(data.begin() + HEADER_SIZE, data.end());
  return packet;
}

//========================================================
std::vector<char> tftpc::serialise_ack_packet(const ack_packet_t &packet)
{
  std::vector<char> ret;
  ret.reserve(ACK_PKT_MAX_SIZE);
  write_u16(ret, static_cast<uint16_t>(packet_t::ACK));
  write_u16(ret, packet.block_number);
  return ret;
}

//========================================================
std::optional<tftpc::ack_packet_t> tftpc::deserialise_ack_packet(const std::vector<char> &data)
{
  // Anything past the block number is ignored
  if ((data.size() < ACK_PKT_MAX_SIZE) || !has_opcode(data, packet_t::ACK))
  {
    return {};
  }
  return ack_packet_t(read_u16(data, 2));
}

//========================================================
std::vector<char> tftpc::serialise_error_packet(const error_packet_t &packet)
{
  const size_t      packet_size = HEADER_SIZE + packet.error_msg.size() + 1; // opcode + errno + error_msg + null
  std::vector<char> ret;
  ret.reserve(packet_size);
  write_u16(ret, static_cast<uint16_t>(packet_t::ERROR));
  write_u16(ret, packet.error_code);
  ret.insert(ret.end(), packet.error_msg.begin(), packet.error_msg.end());
  ret.push_back(0);
  return ret;
}

//========================================================
std::optional<tftpc::error_packet_t> tftpc::deserialise_error_packet(const std::vector<char> &data)
{
  if ((data.size() < HEADER_SIZE) || !has_opcode(data, packet_t::ERROR))
  {
    return {};
  }

  error_packet_t packet;
  packet.error_code = read_u16(data, 2);

  // Some servers omit the terminating null, take whatever is left in that case
  const auto null  = std::find(data.begin() + HEADER_SIZE, data.end(), 0);
  packet.error_msg = std::string(data.begin() + HEADER_SIZE, null);
  return packet;
}

//========================================================
std::optional<tftpc::packet_t> tftpc::deserialise_opcode(const std::vector<char> &data)
{
  if (data.size() < 2)
  {
    return {};
  }

  const uint16_t opcode = read_u16(data, 0);
  switch (static_cast<packet_t>(opcode))
  {
  case packet_t::READ:
  case packet_t::WRITE:
  case packet_t::DATA:
  case packet_t::ACK:
  case packet_t::ERROR: {
    return static_cast<packet_t>(opcode);
  }
  case packet_t::UNKNOWN:
  default: {
    return packet_t::UNKNOWN;
  }
  }
}

//========================================================
std::string tftpc::packet_type_to_string(const packet_t type)
{
  switch (type)
  {
  case packet_t::READ:
    return std::string("RRQ");
  case packet_t::WRITE:
    return std::string("WRQ");
  case packet_t::DATA:
    return std::string("DATA");
  case packet_t::ACK:
    return std::string("ACK");
  case packet_t::ERROR:
    return std::string("ERROR");
  case packet_t::UNKNOWN:
  default:
    return std::string("UNKNOWN");
  }
}

//========================================================
std::string tftpc::error_code_to_string(const uint16_t code)
{
  if (code > static_cast<uint16_t>(error_t::NO_USER))
  {
    return std::string(UNKNOWN_ERROR_STR);
  }

  switch (static_cast<error_t>(code))
  {
  case error_t::NOT_DEFINED: {
    return std::string("Not defined, see error message (if any).");
  }
  case error_t::FILE_NOT_FOUND: {
    return std::string("File not found.");
  }
  case error_t::ACCESS_ERROR: {
    return std::string("Access violation.");
  }
  case error_t::DISK_FULL: {
    return std::string("Disk full or allocation exceeded.");
  }
  case error_t::ILLEGAL_OPERATION: {
    return std::string("Illegal TFTP operation.");
  }
  case error_t::UNKNOWN_TID: {
    return std::string("Unknown transfer ID.");
  }
  case error_t::FILE_EXISTS: {
    return std::string("File already exists.");
  }
  case error_t::NO_USER: {
    return std::string("No such user.");
  }
  }
  return std::string(UNKNOWN_ERROR_STR);
}
