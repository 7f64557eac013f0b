#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace test_utils
{

  template <typename T> std::vector<T> join_vectors(const std::vector<std::vector<T>> &data)
  {
    std::vector<T> ret;
    for (const auto &d : data)
    {
      ret.insert(ret.end(), d.begin(), d.end());
    }
    return ret;
  }

  inline std::vector<char> string_to_vector(const std::string &str)
  {
    return std::vector<char>(str.begin(), str.end());
  }

  inline std::vector<char> string_to_vector_null(const std::string &str)
  {
    std::vector<char> ret(str.begin(), str.end());
    ret.push_back(0);
    return ret;
  }

  /* Deterministic payload where neighbouring blocks differ */
  inline std::vector<char> make_payload(const size_t size)
  {
    std::vector<char> ret(size);
    for (size_t i = 0; i < size; ++i)
    {
      ret[i] = static_cast<char>((i * 7 + i / 512) & 0xFF);
    }
    return ret;
  }

  inline void write_file(const std::filesystem::path &path, const std::vector<char> &data)
  {
    std::ofstream out(path, std::ios_base::binary | std::ios_base::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
  }

  inline std::vector<char> read_file(const std::filesystem::path &path)
  {
    std::ifstream in(path, std::ios_base::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  /* Fresh, empty directory under the system temp directory */
  inline std::filesystem::path make_temp_dir(const std::string &name)
  {
    const auto dir = std::filesystem::temp_directory_path() / ("tftpc_tests_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
  }
} // namespace test_utils
