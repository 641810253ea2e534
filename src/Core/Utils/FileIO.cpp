/**
 * @file FileIO.cpp
 * @brief Implementation of safe file reading and exclusive file creation
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/FileIO.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstdlib>

namespace Gsa::IO {

namespace {

ErrorCode errnoToErrorCode(int err, ErrorCode fallback) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::FileAccessDenied;
        case EEXIST:
            return ErrorCode::FileAlreadyExists;
        case ELOOP:
            return ErrorCode::AccessDenied;
        case ENAMETOOLONG:
            return ErrorCode::InvalidPath;
        default:
            return fallback;
    }
}

} // namespace

Result<std::string> canonicalizePath(const std::string& path) {
    if (path.empty()) {
        return ErrorCode::InvalidPath;
    }

    char* resolved = realpath(path.c_str(), nullptr);
    if (!resolved) {
        return errnoToErrorCode(errno, ErrorCode::InvalidPath);
    }
    std::string result(resolved);
    free(resolved);
    return result;
}

Result<bool> isPathWithin(const std::string& canonicalPath,
                          const std::string& allowedDirectory) {
    if (allowedDirectory.empty()) {
        return true;  // No restriction
    }

    auto allowedResult = canonicalizePath(allowedDirectory);
    if (allowedResult.isFailure()) {
        return allowedResult.error();
    }

    std::string allowed = allowedResult.value();
    if (allowed.empty() || allowed.back() != '/') {
        allowed += '/';
    }

    // Prefix match on a directory boundary, so /etc/app does not admit /etc/apple
    if (canonicalPath.length() < allowed.length()) {
        return false;
    }

    return canonicalPath.compare(0, allowed.length(), allowed) == 0;
}

Result<ByteBuffer> readFileSecurely(const std::string& path,
                                    size_t maxSize,
                                    const std::string& allowedDirectory) {
    auto canonResult = canonicalizePath(path);
    if (canonResult.isFailure()) {
        return canonResult.error();
    }
    const std::string& canonPath = canonResult.value();

    auto allowedResult = isPathWithin(canonPath, allowedDirectory);
    if (allowedResult.isFailure()) {
        return allowedResult.error();
    }
    if (!allowedResult.value()) {
        return ErrorCode::AccessDenied;
    }

    // O_NOFOLLOW: refuse a symlink swapped in after canonicalization
    int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return errnoToErrorCode(errno, ErrorCode::FileReadError);
    }

    // Size from the open descriptor, not the path
    struct stat st;
    if (fstat(fd, &st) < 0) {
        close(fd);
        return ErrorCode::IOError;
    }

    if (!S_ISREG(st.st_mode)) {
        close(fd);
        return ErrorCode::InvalidPath;
    }

    if (static_cast<size_t>(st.st_size) > maxSize) {
        close(fd);
        return ErrorCode::FileTooLarge;
    }

    ByteBuffer data(static_cast<size_t>(st.st_size));
    size_t total = 0;
    while (total < data.size()) {
        ssize_t bytesRead = read(fd, data.data() + total, data.size() - total);
        if (bytesRead < 0) {
            if (errno == EINTR) {
                continue;
            }
            close(fd);
            return ErrorCode::FileReadError;
        }
        if (bytesRead == 0) {
            break;
        }
        total += static_cast<size_t>(bytesRead);
    }
    close(fd);

    if (total != data.size()) {
        return ErrorCode::FileReadError;
    }

    return data;
}

Result<void> writeFileExclusive(const std::string& path, ByteSpan data) {
    if (path.empty()) {
        return ErrorCode::InvalidPath;
    }

    // O_EXCL makes the existence check and the creation one atomic step
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errnoToErrorCode(errno, ErrorCode::FileWriteError);
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            close(fd);
            unlink(path.c_str());
            return ErrorCode::FileWriteError;
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        unlink(path.c_str());
        return ErrorCode::FileWriteError;
    }

    return Result<void>::Success();
}

} // namespace Gsa::IO
