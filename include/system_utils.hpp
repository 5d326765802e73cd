#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open and similar system calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Create @a path exclusively and write @a data to it.
 *
 * The file is created with @a mode (subject to the umask being unable to add
 * bits) and fails if it already exists.
 *
 * @return `true` on success; on failure @a error receives `strerror(errno)`.
 */
bool write_new_file(const std::filesystem::path& path, const std::string& data, mode_t mode,
                    std::string* error = nullptr);

/**
 * @brief Read from @a fd until end of file.
 */
std::string read_all(int fd);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
