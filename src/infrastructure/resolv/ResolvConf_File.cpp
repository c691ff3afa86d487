#include "infrastructure/resolv/ResolvConf_File.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cerrno>
#include <cstring>

using burrow::host::application::ports::ReadStatus;
using burrow::host::application::ports::ResolvConfRead;

namespace burrow::host::infrastructure::resolv
{

namespace
{
class FdGuard
{
 public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard()
  {
    if (fd_ >= 0) ::close(fd_);
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const
  {
    return fd_;
  }

 private:
  int fd_{-1};
};

ResolvConfRead absent(int err)
{
  ResolvConfRead rd;
  rd.status = ReadStatus::absent;
  rd.reason = std::strerror(err);
  return rd;
}

[[noreturn]] void throw_io(int err, const std::string& what)
{
  throw boost::system::system_error(
      boost::system::error_code(err, boost::system::system_category()), what);
}
}  // namespace

bool ResolvConf_File::is_absent_error(int err)
{
  switch (err)
  {
    case ENOENT:
    case ENOTDIR:
    case EACCES:
    case EPERM:
    case ELOOP:
    case ENAMETOOLONG:
    case EISDIR:
      return true;
    default:
      return false;
  }
}

ResolvConfRead ResolvConf_File::read(const std::string& path)
{
  FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() < 0)
  {
    const int err = errno;
    if (is_absent_error(err)) return absent(err);
    throw_io(err, "open " + path);
  }

  std::string content;
  char buf[4096];
  for (;;)
  {
    const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
    if (n == 0) break;
    if (n < 0)
    {
      const int err = errno;
      if (err == EINTR) continue;
      // a directory opens fine and only fails here
      if (err == EISDIR) return absent(err);
      throw_io(err, "read " + path);
    }
    content.append(buf, static_cast<size_t>(n));
  }

  ResolvConfRead rd;
  rd.status = ReadStatus::ok;
  // lines end at \n, \r\n or a bare \r
  size_t start = 0;
  while (start < content.size())
  {
    size_t eol = content.find_first_of("\r\n", start);
    if (eol == std::string::npos) eol = content.size();
    rd.lines.push_back(content.substr(start, eol - start));
    start = eol + 1;
    if (eol < content.size() && content[eol] == '\r' && start < content.size() &&
        content[start] == '\n')
      ++start;
  }
  return rd;
}

}  // namespace burrow::host::infrastructure::resolv
