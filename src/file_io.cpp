#include "file_io.hpp"
#include "config.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string_view>

namespace {

class UniqueFd {
public:
  explicit UniqueFd(int fd = -1) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  // Closes now and reports close(2) failures, which matter for writes.
  bool close_checked() {
    int fd = fd_;
    fd_ = -1;
    return fd < 0 || ::close(fd) == 0;
  }
  void reset() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
private:
  int fd_;
};

class Mapping {
public:
  Mapping(void* mem, size_t n) : mem_(mem), n_(n) {}
  Mapping(const Mapping&) = delete;
  Mapping& operator=(const Mapping&) = delete;
  ~Mapping() { if (mem_ != MAP_FAILED) ::munmap(mem_, n_); }
  bool valid() const { return mem_ != MAP_FAILED; }
  const char* data() const { return static_cast<const char*>(mem_); }
private:
  void* mem_;
  size_t n_;
};

std::string errno_text(const char* what, const std::filesystem::path& path) {
  return std::string(what) + " " + path.string() + ": " + std::strerror(errno);
}

void split_lines(const char* data, size_t n, std::vector<std::string>& out) {
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out.emplace_back(data + start, end - start);
    start = i + 1;
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out.emplace_back(data + start, end - start);
  }
}

}  // namespace

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = errno_text("can not open file", path); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = errno_text("can not read file stat", path); return false; }
  if (S_ISDIR(st.st_mode)) { errno = EISDIR; msg = errno_text("can not open file", path); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = "opened file: " + path.string(); return true; }
  Mapping map(::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0), n);
  if (!map.valid()) { msg = errno_text("can not mmap file", path); return false; }
  (void)::madvise(const_cast<char*>(map.data()), n, MADV_SEQUENTIAL);
  split_lines(map.data(), n, out_lines);
  msg = "opened file: " + path.string();
  return true;
}

bool write_lines(const std::filesystem::path& path,
                 const std::vector<std::string_view>& lines,
                 std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) { msg = errno_text("write file failed:", tmp); return false; }
  std::string buf;
  buf.reserve(static_cast<size_t>(SCRIBE_WRITE_CHUNK_SIZE));
  auto flush_buf = [&]() -> bool {
    const char* p = buf.data();
    size_t remain = buf.size();
    while (remain > 0) {
      ssize_t w = ::write(ufd.get(), p, remain);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += w;
      remain -= static_cast<size_t>(w);
    }
    buf.clear();
    return true;
  };
  auto fail = [&](const char* what, const std::filesystem::path& p) {
    msg = errno_text(what, p);
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return false;
  };
  for (std::string_view s : lines) {
    if (buf.size() + s.size() + 1 > static_cast<size_t>(SCRIBE_WRITE_CHUNK_SIZE) && !buf.empty()) {
      if (!flush_buf()) return fail("write file failed:", tmp);
    }
    buf.append(s);
    buf.push_back('\n');
  }
  if (!buf.empty() && !flush_buf()) return fail("write file failed:", tmp);
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail("write file failed:", tmp);
#else
  if (::fdatasync(ufd.get()) != 0) return fail("write file failed:", tmp);
#endif
  if (!ufd.close_checked()) return fail("write file failed:", tmp);
  if (::rename(tmp.string().c_str(), path.string().c_str()) != 0) return fail("write file failed:", path);
  size_t bytes = 0;
  for (std::string_view s : lines) bytes += s.size() + 1;
  msg = "\"" + path.string() + "\" " + std::to_string(lines.size()) + "L " + std::to_string(bytes) + "B written";
  return true;
}
