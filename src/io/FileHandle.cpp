#include "FileHandle.hpp"
#include "../core/CopyError.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

FileHandle::FileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

std::unique_ptr<FileHandle> FileHandle::open_source(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw CopyError(ErrorKind::SourceUnreadable, "cannot open " + path + ": " + strerror(errno));
    }
    auto handle = std::make_unique<FileHandle>(fd, path);

    struct stat st;
    if (fstat(fd, &st) != 0) {
        throw CopyError(ErrorKind::SourceUnreadable, "cannot stat " + path + ": " + strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw CopyError(ErrorKind::SourceUnreadable, path + " is not a regular file");
    }
    return handle;
}

std::unique_ptr<FileHandle> FileHandle::open_destination(const std::string& path, mode_t mode) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        throw CopyError(ErrorKind::DestUnwritable, "cannot create " + path + ": " + strerror(errno));
    }
    return std::make_unique<FileHandle>(fd, path);
}

bool FileHandle::same_file(const std::string& other_path) const {
    struct stat mine;
    struct stat other;
    if (fstat(fd_, &mine) != 0 || stat(other_path.c_str(), &other) != 0) {
        return false;
    }
    return mine.st_dev == other.st_dev && mine.st_ino == other.st_ino;
}

ssize_t FileHandle::read_at(void* buffer, size_t length, int64_t offset) {
    ssize_t n;
    do {
        n = pread(fd_, buffer, length, static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);
    return n;
}

ssize_t FileHandle::write_at(const void* buffer, size_t length, int64_t offset) {
    ssize_t n;
    do {
        n = pwrite(fd_, buffer, length, static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);
    return n;
}

int64_t FileHandle::size() const {
    struct stat st;
    if (fstat(fd_, &st) != 0) {
        return -1;
    }
    return static_cast<int64_t>(st.st_size);
}

int FileHandle::resize(int64_t length) {
    int rc;
    do {
        rc = ftruncate(fd_, static_cast<off_t>(length));
    } while (rc != 0 && errno == EINTR);
    return rc;
}
