#pragma once

#include <stdio.h>
#include <string>
#include <vector>

/* Destination file of a download, written in octet mode */
class tftp_write_file
{
public:
  tftp_write_file();
  explicit tftp_write_file(const std::string &filename);
  tftp_write_file(const tftp_write_file &t)           = delete;
  tftp_write_file(tftp_write_file &&t)                = delete;
  tftp_write_file &operator=(const tftp_write_file &) = delete;
  tftp_write_file &operator=(tftp_write_file &&)      = delete;
  ~tftp_write_file();

  void open(const std::string &filename);
  void write(const std::vector<char> &data);
  bool close();
  void discard();
  bool error() const;

private:
  FILE       *_fd;
  std::string _filename;
};
