#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/uio.h>

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

// Append-only file handle used by the journal writer. Abstract so tests can
// script short writes and failures.
class IFileSink {
public:
    virtual ~IFileSink() = default;
    virtual IoResult open(const std::string& path) noexcept = 0;
    virtual void close() noexcept = 0;
    virtual IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept = 0;
    virtual IoResult sync() noexcept = 0;
    virtual std::uint64_t current_size() const noexcept = 0;
    virtual bool is_open() const noexcept = 0;
};

class PosixFileSink : public IFileSink {
public:
    PosixFileSink();
    ~PosixFileSink() override;

    PosixFileSink(const PosixFileSink&) = delete;
    PosixFileSink& operator=(const PosixFileSink&) = delete;

    IoResult open(const std::string& path) noexcept override;
    void close() noexcept override;
    IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override;
    IoResult sync() noexcept override;
    std::uint64_t current_size() const noexcept override { return size_bytes_; }
    bool is_open() const noexcept override;

private:
    int fd_{-1};
    std::uint64_t size_bytes_{0};
};

} // namespace persist
