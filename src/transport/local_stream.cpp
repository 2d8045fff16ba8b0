#include "transport/local_stream.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <boost/system/system_error.hpp>

#include <cerrno>

namespace qbeecli::transport {

namespace {

void AssignDuplicate(boost::asio::posix::stream_descriptor &desc, int fd,
                     const char *what) {
  const int copy = ::dup(fd);
  if (copy < 0) {
    throw boost::system::system_error(
        boost::system::error_code(errno, boost::system::system_category()),
        what);
  }
  boost::system::error_code ec;
  desc.assign(copy, ec);
  if (ec) {
    // Regular files cannot be registered with the reactor.
    ::close(copy);
    throw boost::system::system_error(ec, what);
  }
}

}  // namespace

DescriptorStream::DescriptorStream(boost::asio::any_io_executor executor,
                                   int in_fd, int out_fd)
    : in_(executor), out_(executor), in_fd_(in_fd), out_fd_(out_fd),
      in_flags_(::fcntl(in_fd, F_GETFL)),
      out_flags_(::fcntl(out_fd, F_GETFL)) {
  AssignDuplicate(in_, in_fd, "stdin");
  AssignDuplicate(out_, out_fd, "stdout");
}

DescriptorStream::~DescriptorStream() { CloseAndRestore(); }

void DescriptorStream::CloseAndRestore() {
  boost::system::error_code ignored;
  in_.close(ignored);
  out_.close(ignored);
  if (restored_) {
    return;
  }
  restored_ = true;
  // Asio switched the shared open file descriptions to O_NONBLOCK.
  if (out_flags_ >= 0) {
    ::fcntl(out_fd_, F_SETFL, out_flags_);
  }
  if (in_flags_ >= 0) {
    ::fcntl(in_fd_, F_SETFL, in_flags_);
  }
}

}  // namespace qbeecli::transport
