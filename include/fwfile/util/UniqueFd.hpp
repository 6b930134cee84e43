#pragma once
/// @file UniqueFd.hpp
/// @brief RAII wrapper for POSIX file descriptors (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <system_error>

namespace FwFile {
namespace detail {

/// @brief RAII wrapper for POSIX file descriptors
///
/// Manages file descriptors with std::unique_ptr-like semantics and
/// offers whole-buffer read/write loops that retry on EINTR and short I/O.
///
/// @note This class is for internal library use.
class UniqueFd {
  public:
    /// @brief Default constructor. Initializes with invalid fd(-1)
    UniqueFd() noexcept = default;

    /// @brief Takes ownership of a file descriptor
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    ~UniqueFd() { reset(); }

    // Copy prohibited
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /// @brief Opens a path with O_CLOEXEC added to flags
    /// @return Owning wrapper; invalid with ec set on failure
    static UniqueFd open(const std::string& path, int flags, mode_t mode, std::error_code& ec) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        UniqueFd fd(::open(path.c_str(), flags, mode));
        if (!fd)
            ec = std::error_code(errno, std::generic_category());
        return fd;
    }

    int get() const noexcept { return fd_; }

    bool valid() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept { return valid(); }

    /// @brief Releases ownership (returns fd without closing)
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// @brief Closes current fd and replaces with new one
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = newFd;
    }

    /// @brief Closes the fd and reports the close() result
    /// @details Needed on write paths where a deferred write error surfaces at close.
    bool close(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

    /// @brief Reads from the current offset until EOF, appending to out
    bool readAll(std::string& out, std::error_code& ec) const {
        ec.clear();
        char buf[4096];
        while (true) {
            ssize_t n = ::read(fd_, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                ec = std::error_code(errno, std::generic_category());
                return false;
            }
            if (n == 0)
                return true;
            out.append(buf, static_cast<size_t>(n));
        }
    }

    /// @brief Writes every byte of data, looping over short writes
    bool writeAll(const std::string& data, std::error_code& ec) const {
        ec.clear();
        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                ec = std::error_code(errno, std::generic_category());
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace FwFile
