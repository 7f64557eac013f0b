#pragma once

#include <stdio.h>
#include <string>
#include <vector>

/* Source file of an upload, read in octet mode */
class tftp_read_file
{
public:
  tftp_read_file();
  explicit tftp_read_file(const std::string &filename);
  tftp_read_file(const tftp_read_file &t)            = delete;
  tftp_read_file(tftp_read_file &&t)                 = delete;
  tftp_read_file &operator=(const tftp_read_file &) = delete;
  tftp_read_file &operator=(tftp_read_file &&)      = delete;
  ~tftp_read_file();

  void open(const std::string &filename);
  void read_in_to(std::vector<char> &ret, const size_t size_bytes);
  void close();
  bool error() const;

private:
  FILE *_fd;
};
