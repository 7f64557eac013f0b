#include "common/tftp_read_file.hpp"

#include <stdexcept>

#include "common/utils.hpp"

//========================================================
tftp_read_file::tftp_read_file() : _fd(NULL)
{
}

//========================================================
tftp_read_file::tftp_read_file(const std::string &filename) : _fd(NULL)
{
  open(filename);
}

//========================================================
tftp_read_file::~tftp_read_file()
{
  close();
}

//========================================================
void tftp_read_file::open(const std::string &filename)
{
  close();
  _fd = fopen(filename.c_str(), "rb");
  if (_fd == NULL)
  {
    throw std::runtime_error(utils::string_error(errno));
  }
}

//========================================================
void tftp_read_file::close()
{
  if (_fd != NULL)
  {
    fclose(_fd);
    _fd = NULL;
  }
}

//========================================================
bool tftp_read_file::error() const
{
  return (_fd == NULL) || ferror(_fd);
}

//========================================================
/**
 * @brief Reads up to size_bytes from the file, ret is resized to the number of bytes read
 *
 * A short read only happens at the end of the file or on error, check error() to tell them apart.
 */
void tftp_read_file::read_in_to(std::vector<char> &ret, const size_t size_bytes)
{
  size_t read_bytes = 0;
  ret.resize(size_bytes);

  while ((_fd != NULL) && !ferror(_fd) && !feof(_fd) && (read_bytes < size_bytes))
  {
    read_bytes += fread(ret.data() + read_bytes, 1, size_bytes - read_bytes, _fd);
  }
  ret.resize(read_bytes);
}
