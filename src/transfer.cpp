#include "transfer.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace transfer {

namespace {

std::string describe_errno(const std::string& action, const std::filesystem::path& filepath) {
    return action + " " + filepath.string() + ": " + std::strerror(errno);
}

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

} // namespace

const char* stage_name(TransferStage stage) {
    switch (stage) {
        case TransferStage::CREATE: return "create";
        case TransferStage::WRITE:  return "write";
        case TransferStage::FLUSH:  return "flush";
        case TransferStage::SYNC:   return "sync";
    }
    return "unknown";
}

void write_file(const std::filesystem::path& filepath, const std::string& data) {
    FileDescriptor file(::open(filepath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (file.get() < 0) {
        throw TransferError(TransferStage::CREATE, describe_errno("cannot create", filepath));
    }

    const char* cursor = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(file.get(), cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransferError(TransferStage::WRITE, describe_errno("cannot write", filepath));
        }
        cursor += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(file.get()) != 0) {
        throw TransferError(TransferStage::SYNC, describe_errno("cannot sync", filepath));
    }

    // close() is where deferred write errors (e.g. NFS quota) are reported
    if (::close(file.release()) != 0) {
        throw TransferError(TransferStage::FLUSH, describe_errno("cannot flush", filepath));
    }
}

} // namespace transfer
