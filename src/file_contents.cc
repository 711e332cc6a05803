#include <array>
#include <cerrno>
#include <coderun/errmsg.hh>
#include <coderun/file_contents.hh>
#include <coderun/file_descriptor.hh>
#include <coderun/macros/throw.hh>
#include <cstdint>
#include <fcntl.h>
#include <unistd.h>

size_t write_all(int fd, const void* buf, size_t count) noexcept {
    ssize_t k = 0;
    size_t pos = 0;
    const auto* buff = static_cast<const uint8_t*>(buf);
    errno = 0;
    while (pos < count) {
        k = write(fd, buff + pos, count - pos);
        if (k >= 0) {
            pos += k;
        } else if (errno != EINTR) {
            return pos; // Error
        }
    }

    errno = 0; // No error (need to set again because errno may equal to EINTR)
    return count;
}

std::string get_file_contents(int fd) {
    std::string res;
    std::array<char, 65536> buff{};
    for (;;) {
        ssize_t len = read(fd, buff.data(), buff.size());
        // Interrupted by signal
        if (len < 0 && errno == EINTR) {
            continue;
        }
        // Error
        if (len < 0) {
            THROW("read() failed", errmsg());
        }
        if (len == 0) {
            return res;
        }
        res.append(buff.data(), len);
    }
}

std::string get_file_contents(const std::string& pathname) {
    FileDescriptor fd{open(pathname.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd.is_open()) {
        THROW("Failed to open file `", pathname, '`', errmsg());
    }
    return get_file_contents(fd);
}

void put_file_contents(const std::string& pathname, std::string_view data) {
    FileDescriptor fd{open(pathname.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (!fd.is_open()) {
        THROW("Failed to open file `", pathname, '`', errmsg());
    }
    if (write_all(fd, data.data(), data.size()) != data.size()) {
        THROW("write() failed", errmsg());
    }
}
