#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>

// Owns a file descriptor and exposes positional I/O only, so one handle can
// be shared by every worker without a shared file position.
class FileHandle {
protected:
    int fd_ = -1;
    std::string path_;

public:
    FileHandle(int fd, std::string path);
    virtual ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    // Throw CopyError(SourceUnreadable / DestUnwritable)
    static std::unique_ptr<FileHandle> open_source(const std::string& path);
    static std::unique_ptr<FileHandle> open_destination(const std::string& path, mode_t mode);

    // pread/pwrite semantics: bytes transferred, 0 at end of file, -1 with errno set
    virtual ssize_t read_at(void* buffer, size_t length, int64_t offset);
    virtual ssize_t write_at(const void* buffer, size_t length, int64_t offset);

    // -1 with errno set on failure
    virtual int64_t size() const;
    virtual int resize(int64_t length);

    // True when other_path exists and names this same inode
    bool same_file(const std::string& other_path) const;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }
};
