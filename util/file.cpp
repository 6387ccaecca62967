#include "file.h"
#include "platform.h"

#include <fmt/format.h>
#include <fmt/std.h>

#include <system_error>

#if defined(_unix_)
#   include <errno.h>
#   include <fcntl.h>
#   include <sys/stat.h>
#   include <unistd.h>
#endif

namespace {

constexpr mode_t DefaultFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;

[[noreturn]] void ThrowErrno(const std::string_view action, const std::filesystem::path& path) {
    throw std::system_error(errno, std::system_category(), fmt::format("cannot {} '{}'", action, path));
}

/// Closes the descriptor on scope exit.
class ScopedDescriptor {
public:
    explicit ScopedDescriptor(const int fd)
        : fd_(fd) {
    }

    ~ScopedDescriptor() {
        ::close(fd_);
    }

    int Get() const {
        return fd_;
    }

private:
    ScopedDescriptor(const ScopedDescriptor&) = delete;

    ScopedDescriptor& operator=(const ScopedDescriptor&) = delete;

private:
    const int fd_;
};

int OpenOrThrow(const std::filesystem::path& path, const int flags, const std::string_view action) {
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC, DefaultFileMode);
    if (fd == -1) {
        ThrowErrno(action, path);
    }
    return fd;
}

} // namespace

void StringToFile(const std::filesystem::path& path, const std::string_view value) {
    const ScopedDescriptor fd(OpenOrThrow(path, O_CREAT | O_TRUNC | O_WRONLY, "open file for writing"));

    for (const char *p = value.data(), *end = value.data() + value.size(); p != end;) {
        const ssize_t ret = ::write(fd.Get(), p, end - p);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            ThrowErrno("write data to", path);
        }
        p += ret;
    }
}

std::string StringFromFile(const std::filesystem::path& path) {
    const ScopedDescriptor fd(OpenOrThrow(path, O_RDONLY, "open file for reading"));
    std::string result;

    if (struct stat st { }; ::fstat(fd.Get(), &st) == 0) {
        result.reserve(st.st_size);
    }

    char buf[4096];

    while (true) {
        const ssize_t ret = ::read(fd.Get(), buf, sizeof(buf));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            ThrowErrno("read data from", path);
        }
        if (ret == 0) {
            break;
        }
        result.append(buf, ret);
    }

    return result;
}
