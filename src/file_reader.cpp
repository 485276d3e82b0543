#include "file_reader.hpp"
#include "text_util.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  int fd = ::open(path.string().c_str(), O_RDONLY);
  if (fd < 0) { msg = "can not open file: " + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd, &st) != 0) { ::close(fd); msg = "can not read file stat: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { ::close(fd); msg = "read " + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd, 0);
  if (mem == MAP_FAILED) { ::close(fd); msg = "can not mmap file: " + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);

  size_t start = 0;
  for (size_t i = 0; i <= n; ++i) {
    if (i == n || data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      if (i < n || end > start) out_lines.emplace_back(data + start, end - start);
      start = i + 1;
    }
  }

  ::munmap(mem, n);
  ::close(fd);
  msg = "read " + path.string();
  return true;
}

std::vector<std::string> rc_command_lines(const std::vector<std::string>& lines) {
  std::vector<std::string> out;
  for (const auto& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s = trim(s.substr(1));
    if (!s.empty()) out.push_back(s);
  }
  return out;
}
