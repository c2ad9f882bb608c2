#include "utilities/atomic_file.hpp"

#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace sharedict {

namespace {

[[noreturn]] void throwErrno(const std::string &what) {
  throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

void writeFileAtomically(const std::string &path,
                         std::span<const std::byte> data, bool sync) {
  const std::string tmp = path + ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
    throwErrno("open " + tmp);

  const std::byte *p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      errno = err;
      throwErrno("write " + tmp);
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  if (sync && ::fsync(fd) != 0) {
    int err = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    errno = err;
    throwErrno("fsync " + tmp);
  }
  if (::close(fd) != 0) {
    int err = errno;
    ::unlink(tmp.c_str());
    errno = err;
    throwErrno("close " + tmp);
  }
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    int err = errno;
    ::unlink(tmp.c_str());
    errno = err;
    throwErrno("rename " + tmp + " -> " + path);
  }
}

std::vector<std::byte> readFileBytes(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throw std::system_error(ENOENT, std::generic_category(), "open " + path);
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  if (in.bad())
    throw std::system_error(EIO, std::generic_category(), "read " + path);
  std::vector<std::byte> out(tmp.size());
  for (size_t i = 0; i < tmp.size(); ++i)
    out[i] = static_cast<std::byte>(tmp[i]);
  return out;
}

} // namespace sharedict
