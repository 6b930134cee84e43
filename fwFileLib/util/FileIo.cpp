#include "fwfile/util/FileIo.hpp"

#include "fwfile/util/Logger.hpp"
#include "fwfile/util/UniqueFd.hpp"

#include <cstdio>
#include <filesystem>
#include <sys/stat.h>
#include <utility>
#include <vector>

namespace FwFile::util {

namespace fs = std::filesystem;

namespace {

/// @brief Removes the temporary file unless committed
class TempFileGuard {
  public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!committed_)
            ::unlink(path_.c_str());
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void commit() noexcept { committed_ = true; }
    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
    bool committed_ = false;
};

} // namespace

bool readWholeFile(const std::string& path, std::string& out, std::error_code& ec) {
    out.clear();
    detail::UniqueFd fd = detail::UniqueFd::open(path, O_RDONLY, 0, ec);
    if (ec) {
        FW_LOG_DEBUG("open '{}' for read failed: {}", path, ec.message());
        return false;
    }
    if (!fd.readAll(out, ec)) {
        FW_LOG_ERROR("read '{}' failed: {}", path, ec.message());
        return false;
    }
    return true;
}

bool atomicWriteFile(const std::string& path, const std::string& data, std::error_code& ec) {
    ec.clear();

    // 대상이 symlink이면 rename이 링크 자체를 교체해 버리므로 거부한다.
    struct stat lst{};
    bool targetExists = false;
    if (::lstat(path.c_str(), &lst) == 0) {
        if (S_ISLNK(lst.st_mode)) {
            ec = std::make_error_code(std::errc::operation_not_permitted);
            FW_LOG_ERROR("refusing to replace '{}': target is a symbolic link", path);
            return false;
        }
        targetExists = true;
    }

    fs::path target(path);
    std::string dir = target.parent_path().string();
    if (dir.empty())
        dir = ".";

    // rename은 같은 파일시스템 안에서만 원자적이므로 임시 파일은 대상과 같은 디렉토리에 만든다.
    std::string tmpl = dir + "/" + target.filename().string() + ".tmp.XXXXXX";
    std::vector<char> tmplBuf(tmpl.begin(), tmpl.end());
    tmplBuf.push_back('\0');

    detail::UniqueFd fd(::mkstemp(tmplBuf.data()));
    if (!fd) {
        ec = std::error_code(errno, std::generic_category());
        FW_LOG_ERROR("mkstemp '{}' failed: {}", tmpl, ec.message());
        return false;
    }
    TempFileGuard tmp(tmplBuf.data());

    if (!fd.writeAll(data, ec)) {
        FW_LOG_ERROR("write '{}' failed: {}", tmp.path(), ec.message());
        return false;
    }
    if (::fsync(fd.get()) != 0) {
        ec = std::error_code(errno, std::generic_category());
        FW_LOG_ERROR("fsync '{}' failed: {}", tmp.path(), ec.message());
        return false;
    }
    if (targetExists && ::fchmod(fd.get(), lst.st_mode & 07777) != 0) {
        ec = std::error_code(errno, std::generic_category());
        FW_LOG_ERROR("fchmod '{}' failed: {}", tmp.path(), ec.message());
        return false;
    }
    if (!fd.close(ec)) {
        FW_LOG_ERROR("close '{}' failed: {}", tmp.path(), ec.message());
        return false;
    }

    if (std::rename(tmp.path().c_str(), path.c_str()) != 0) {
        ec = std::error_code(errno, std::generic_category());
        FW_LOG_ERROR("rename '{}' -> '{}' failed: {}", tmp.path(), path, ec.message());
        return false;
    }
    tmp.commit();

    // rename 자체를 영속화하려면 디렉토리 엔트리도 fsync 해야 한다.
    // 이 시점에서 교체는 이미 끝났으므로 실패해도 성공으로 보고한다.
    std::error_code dirEc;
    detail::UniqueFd dirFd = detail::UniqueFd::open(dir, O_RDONLY | O_DIRECTORY, 0, dirEc);
    if (dirEc) {
        FW_LOG_WARN("'{}' replaced, but open directory '{}' failed: {}", path, dir,
                    dirEc.message());
    } else if (::fsync(dirFd.get()) != 0) {
        FW_LOG_WARN("'{}' replaced, but fsync directory '{}' failed: {}", path, dir,
                    std::error_code(errno, std::generic_category()).message());
    }
    return true;
}

} // namespace FwFile::util
