#include "common/tftp_write_file.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "common/debug_macros.hpp"
#include "common/utils.hpp"

//========================================================
tftp_write_file::tftp_write_file() : _fd(NULL), _filename{}
{
}

//========================================================
tftp_write_file::tftp_write_file(const std::string &filename) : _fd(NULL), _filename{}
{
  open(filename);
}

//========================================================
tftp_write_file::~tftp_write_file()
{
  close();
}

//========================================================
void tftp_write_file::open(const std::string &filename)
{
  close();
  _fd = fopen(filename.c_str(), "wb");
  if (_fd == NULL)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
  _filename = filename;
}

//========================================================
/**
 * @brief Flushes and closes the file
 *
 * @return false if buffered data could not be written out, true otherwise or if nothing was open
 */
bool tftp_write_file::close()
{
  if (_fd == NULL)
  {
    return true;
  }

  const bool ok = !ferror(_fd) && (fflush(_fd) == 0);
  const int  rc = fclose(_fd);
  _fd           = NULL;
  if (!ok || (rc != 0))
  {
    dbg_err("Failed to close '{}' : {}", _filename, utils::string_error(errno));
    return false;
  }
  return true;
}

//========================================================
/**
 * @brief Closes and deletes the file, used to drop the output of a failed download
 */
void tftp_write_file::discard()
{
  close();
  if (_filename.empty())
  {
    return;
  }

  // Never unlink something that is not a plain file, such as a device given as destination
  std::error_code ec;
  if (!std::filesystem::is_regular_file(_filename, ec))
  {
    _filename.clear();
    return;
  }
  std::filesystem::remove(_filename, ec);
  if (ec)
  {
    dbg_warn("Failed to remove partial file '{}' : {}", _filename, ec.message());
  }
  else
  {
    dbg_trace("Removed partial file '{}'", _filename);
  }
  _filename.clear();
}

//========================================================
bool tftp_write_file::error() const
{
  return (_fd == NULL) || ferror(_fd);
}

//========================================================
void tftp_write_file::write(const std::vector<char> &data)
{
  size_t bytes_written = 0;
  while ((_fd != NULL) && !ferror(_fd) && (bytes_written < data.size()))
  {
    bytes_written += fwrite(data.data() + bytes_written, 1, data.size() - bytes_written, _fd);
  }
  dbg_trace("Wrote {} bytes to file", bytes_written);
}
