#include "source_file.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace ua {

SourceFile::~SourceFile() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

Status SourceFile::open(const std::string& path) {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Status(ErrorCode::IoError, "cannot open " + path + ": " + std::strerror(errno));
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        int err = errno;
        close(fd);
        return Status(ErrorCode::IoError, "cannot stat " + path + ": " + std::strerror(err));
    }
    if (!S_ISREG(st.st_mode)) {
        close(fd);
        return Status(ErrorCode::ConfigurationError, path + " is not a regular file");
    }

    fd_ = fd;
    path_ = path;
    size_ = st.st_size;
    mtime_ = st.st_mtime;
    return Status::OK();
}

Status SourceFile::readRange(int64_t offset, int64_t length, std::vector<uint8_t>* data) const {
    if (fd_ < 0) {
        return Status(ErrorCode::IoError, "source file is not open");
    }
    if (offset < 0 || length < 0 || offset + length > size_) {
        return Status(ErrorCode::IoError,
                      "range [" + std::to_string(offset) + ", " + std::to_string(offset + length) +
                      ") is outside " + path_);
    }

    data->resize(static_cast<size_t>(length));
    int64_t done = 0;
    while (done < length) {
        ssize_t n = pread(fd_, data->data() + done, static_cast<size_t>(length - done),
                          static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Status(ErrorCode::IoError, "read failed on " + path_ + ": " + std::strerror(errno));
        }
        if (n == 0) {
            return Status(ErrorCode::IoError,
                          path_ + " shrank while uploading (short read at offset " +
                          std::to_string(offset + done) + ")");
        }
        done += n;
    }
    return Status::OK();
}

} // namespace ua
