#include "tabedit/io_util.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace tabedit {

std::string read_file(const std::string& filename) {
  std::FILE* fp = std::fopen(filename.c_str(), "rb");
  if (fp == nullptr) {
    throw std::runtime_error("could not load file '" + filename + "': " + std::strerror(errno));
  }

  std::fseek(fp, 0, SEEK_END);
  long len = std::ftell(fp);
  if (len < 0) {
    std::fclose(fp);
    throw std::runtime_error("could not determine size of '" + filename + "'");
  }
  std::rewind(fp);

  std::string data(static_cast<size_t>(len), '\0');
  size_t readb = std::fread(&data[0], 1, data.size(), fp);
  std::fclose(fp);
  if (readb != data.size()) {
    throw std::runtime_error("could not read the data from '" + filename + "'");
  }
  return data;
}

std::string read_stdin() {
  // Read stdin in chunks since we don't know the size upfront
  const size_t chunk_size = 64 * 1024;
  std::string data;
  std::vector<char> buffer(chunk_size);

  while (true) {
    size_t bytes_read = std::fread(buffer.data(), 1, chunk_size, stdin);
    if (bytes_read > 0) {
      data.append(buffer.data(), bytes_read);
    }
    if (bytes_read < chunk_size) {
      if (std::ferror(stdin)) {
        throw std::runtime_error("could not read from stdin");
      }
      break;  // EOF reached
    }
  }
  return data;
}

void write_file(const std::string& filename, std::string_view content) {
  std::FILE* fp = std::fopen(filename.c_str(), "wb");
  if (fp == nullptr) {
    throw std::runtime_error("could not open '" + filename + "' for writing: " +
                             std::strerror(errno));
  }
  size_t written = std::fwrite(content.data(), 1, content.size(), fp);
  bool close_failed = std::fclose(fp) != 0;
  if (written != content.size() || close_failed) {
    throw std::runtime_error("could not write the data to '" + filename + "'");
  }
}

std::string create_temp_file(const std::string& prefix) {
  const char* tmpdir = std::getenv("TMPDIR");
  std::string dir = (tmpdir != nullptr && tmpdir[0] != '\0') ? tmpdir : "/tmp";
  if (dir.back() == '/') {
    dir.pop_back();
  }

  std::string pattern = dir + "/" + prefix + "_XXXXXX";
  std::vector<char> tmpname(pattern.begin(), pattern.end());
  tmpname.push_back('\0');

  int fd = mkstemp(tmpname.data());
  if (fd < 0) {
    throw std::runtime_error("could not create temporary file in '" + dir + "': " +
                             std::strerror(errno));
  }
  close(fd);
  return std::string(tmpname.data());
}

std::string_view strip_utf8_bom(std::string_view data) {
  if (data.size() >= 3 && static_cast<unsigned char>(data[0]) == 0xEF &&
      static_cast<unsigned char>(data[1]) == 0xBB && static_cast<unsigned char>(data[2]) == 0xBF) {
    return data.substr(3);
  }
  return data;
}

} // namespace tabedit
