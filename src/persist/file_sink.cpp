#include "persist/file_sink.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace persist {

PosixFileSink::PosixFileSink() = default;
PosixFileSink::~PosixFileSink() { close(); }

IoResult PosixFileSink::open(const std::string& path) noexcept {
    close();
    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0640);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return {false, errno};
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return {false, err};
    }
    fd_ = fd;
    size_bytes_ = static_cast<std::uint64_t>(st.st_size);
    return {true, 0};
}

void PosixFileSink::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_bytes_ = 0;
}

IoResult PosixFileSink::writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept {
    bytes_written = 0;
    if (fd_ < 0) {
        return {false, EBADF};
    }
    ssize_t ret = -1;
    do {
        ret = ::writev(fd_, iov, iovcnt);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        return {false, errno};
    }
    bytes_written = static_cast<std::size_t>(ret);
    size_bytes_ += static_cast<std::uint64_t>(ret);
    return {true, 0};
}

IoResult PosixFileSink::sync() noexcept {
    if (fd_ < 0) {
        return {false, EBADF};
    }
    if (::fdatasync(fd_) != 0) {
        return {false, errno};
    }
    return {true, 0};
}

bool PosixFileSink::is_open() const noexcept { return fd_ >= 0; }

} // namespace persist
