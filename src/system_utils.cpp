#include "system_utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

namespace procutil {

bool write_new_file(const std::filesystem::path& path, const std::string& data, mode_t mode,
                    std::string* error) {
    UniqueFd fd(open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode));
    if (!fd) {
        if (error)
            *error = std::strerror(errno);
        return false;
    }
    // open() masks the mode with the umask; make sure the bits are exact.
    if (fchmod(fd.get(), mode) != 0) {
        if (error)
            *error = std::strerror(errno);
        return false;
    }
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd.get(), data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            if (error)
                *error = std::strerror(errno);
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

std::string read_all(int fd) {
    std::string out;
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

} // namespace procutil
