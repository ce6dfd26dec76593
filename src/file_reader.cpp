#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "posix_fd.hpp"

static std::string errno_text(const char* what, const std::filesystem::path& path) {
  return std::string(what) + path.string() + ": " + std::strerror(errno);
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg,
                    size_t max_bytes) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK));
  if (!fd.valid()) { msg = errno_text("can not open file: ", path); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = errno_text("can not read file stat: ", path); return false; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { out_lines.emplace_back(""); msg = std::string("opened file: ") + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = errno_text("can not mmap file: ", path); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);

  bool truncated = n > max_bytes;
  size_t limit = truncated ? max_bytes : n;
  size_t start = 0;
  for (size_t i = 0; i < limit; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data + start, end - start);
      start = i + 1;
    }
  }
  if (start < limit) {
    size_t end = limit;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
  }

  ::munmap(mem, n);
  if (out_lines.empty()) out_lines.emplace_back("");
  if (truncated) msg = std::string("opened file (truncated to ") + std::to_string(max_bytes) + " bytes): " + path.string();
  else msg = std::string("opened file: ") + path.string();
  return true;
}
