#ifndef LOCAL_SECRETS_FILE_IO_HPP
#define LOCAL_SECRETS_FILE_IO_HPP

#include <cerrno>
#include <string>
#include <filesystem>
#include <stdexcept>

#include <hmac_cpp/hmac_utils.hpp>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace local_secrets::file_io {

    /// \brief Write `data` to `path` through `<path>.tmp` + rename, mode 0600.
    /// \throws std::runtime_error naming the failed step (never the content).
    inline void atomic_write_file(const std::string& path, const std::string& data) {
        namespace fs = std::filesystem;
        fs::path target(path);
        fs::path tmp = target;
        tmp += ".tmp";

        int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (fd < 0) throw std::runtime_error("open");
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t written = ::write(fd, p, left);
            if (written < 0) {
                if (errno == EINTR) continue;
                ::close(fd);
                ::unlink(tmp.c_str());
                throw std::runtime_error("write");
            }
            p += written;
            left -= static_cast<size_t>(written);
        }
        if (::fsync(fd) != 0) {
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::runtime_error("fsync");
        }
        if (::close(fd) != 0) {
            ::unlink(tmp.c_str());
            throw std::runtime_error("close");
        }
        std::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            ::unlink(tmp.c_str());
            throw std::runtime_error("rename");
        }
        if (::chmod(target.c_str(), 0600) != 0) {
            ::unlink(target.c_str());
            throw std::runtime_error("chmod");
        }
    }

    /// \brief Read the whole file into `out`.
    /// \return false when the file does not exist.
    /// \throws std::runtime_error on any other I/O failure.
    inline bool read_file(const std::string& path, std::string& out) {
        out.clear();
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            if (errno == ENOENT) return false;
            throw std::runtime_error("open");
        }
        // Reserve up front so appends do not leave reallocated copies behind.
        struct stat st {};
        if (::fstat(fd, &st) == 0 && st.st_size > 0) out.reserve(static_cast<size_t>(st.st_size));
        char buf[4096];
        for (;;) {
            ssize_t r = ::read(fd, buf, sizeof(buf));
            if (r < 0) {
                if (errno == EINTR) continue;
                hmac_cpp::secure_zero(buf, sizeof(buf));
                ::close(fd);
                throw std::runtime_error("read");
            }
            if (r == 0) break;
            out.append(buf, static_cast<size_t>(r));
        }
        hmac_cpp::secure_zero(buf, sizeof(buf));
        ::close(fd);
        return true;
    }

} // namespace local_secrets::file_io

#endif // LOCAL_SECRETS_FILE_IO_HPP
