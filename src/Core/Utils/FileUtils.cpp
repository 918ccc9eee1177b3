/**
 * @file FileUtils.cpp
 * @brief File helpers implementation
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/FileUtils.hpp>
#include <Warden/Core/ErrorHandler.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Warden {

namespace {

ErrorInfo openError(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return makeError(ErrorCode::FileNotFound);
        case EACCES:
        case EPERM:
            return makeError(ErrorCode::FileAccessDenied);
        case ELOOP:
            return makeError(ErrorCode::AccessDenied, "Refusing to follow a symbolic link");
        default:
            return makeError(ErrorCode::IOError, std::strerror(err));
    }
}

} // anonymous namespace

Result<std::string> readFileSecure(const std::filesystem::path& path, size_t maxBytes) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return openError(errno);
    }

    struct stat st;
    if (::fstat(fd, &st) < 0) {
        int err = errno;
        ::close(fd);
        return makeError(ErrorCode::IOError, std::strerror(err));
    }

    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return makeError(ErrorCode::InvalidPath, "Not a regular file");
    }

    if (static_cast<uint64_t>(st.st_size) > maxBytes) {
        ::close(fd);
        return makeError(ErrorCode::FileTooLarge);
    }

    // Read to EOF; the file may have grown since fstat
    std::string data;
    data.reserve(static_cast<size_t>(st.st_size));
    char buffer[8192];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            return makeError(ErrorCode::FileReadError, std::strerror(err));
        }
        if (n == 0) {
            break;
        }
        if (data.size() + static_cast<size_t>(n) > maxBytes) {
            ::close(fd);
            return makeError(ErrorCode::FileTooLarge);
        }
        data.append(buffer, static_cast<size_t>(n));
    }

    ::close(fd);
    return data;
}

Result<void> writeFileAtomic(const std::filesystem::path& path, std::string_view data, mode_t mode) {
    std::string tempPath = path.string() + ".tmp.XXXXXX";
    std::vector<char> templ(tempPath.begin(), tempPath.end());
    templ.push_back('\0');

    int fd = ::mkstemp(templ.data());
    if (fd < 0) {
        return openError(errno);
    }
    tempPath.assign(templ.data());

    auto fail = [&](ErrorCode code, int err) -> Result<void> {
        ::close(fd);
        ::unlink(tempPath.c_str());
        return makeError(code, std::strerror(err));
    };

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail(ErrorCode::FileWriteError, errno);
        }
        written += static_cast<size_t>(n);
    }

    if (::fchmod(fd, mode) != 0) {
        return fail(ErrorCode::FileWriteError, errno);
    }
    if (::fsync(fd) != 0) {
        return fail(ErrorCode::FileWriteError, errno);
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tempPath.c_str());
        return makeError(ErrorCode::FileWriteError, std::strerror(err));
    }

    if (::rename(tempPath.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tempPath.c_str());
        return makeError(ErrorCode::FileWriteError, std::strerror(err));
    }

    return {};
}

bool fileExists(const std::filesystem::path& path) noexcept {
    struct stat st;
    return ::lstat(path.c_str(), &st) == 0;
}

} // namespace Warden
