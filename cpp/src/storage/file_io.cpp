#include "chunkpipe/storage/file_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <new>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace chunkpipe::storage {

using namespace chunkpipe::core;

Status errno_status(StatusDomain domain, int err) noexcept {
    if (err == ENOSPC || err == EDQUOT) {
        return make_status(domain, StatusCode::TempSpace, static_cast<u32>(err));
    }
    if (err == ENOENT) {
        return make_status(domain, StatusCode::NotFound, static_cast<u32>(err));
    }
    return make_status(domain, StatusCode::Io, static_cast<u32>(err));
}

Status read_full(int fd, u8* buf, size_t len, size_t* n) noexcept {
    if (n == nullptr || (buf == nullptr && len > 0)) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    size_t got = 0;
    while (got < len) {
        const ssize_t r = ::read(fd, buf + got, len - got);
        if (r < 0) {
            if (errno == EINTR) continue;
            *n = got;
            return make_status(StatusDomain::Core, StatusCode::Io, static_cast<u32>(errno));
        }
        if (r == 0) break;  // EOF
        got += static_cast<size_t>(r);
    }
    *n = got;
    return ok_status();
}

Status write_all(int fd, const u8* data, size_t len) noexcept {
    size_t written = 0;
    while (written < len) {
        const ssize_t w = ::write(fd, data + written, len - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            return errno_status(StatusDomain::Core, errno);
        }
        written += static_cast<size_t>(w);
    }
    return ok_status();
}

Status copy_file(const char* src, const char* dst, u32 block_size, bool durable) noexcept {
    if (src == nullptr || dst == nullptr || block_size == 0) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    const int in = ::open(src, O_RDONLY | O_CLOEXEC);
    if (in < 0) {
        return errno_status(StatusDomain::Core, errno);
    }
    const int out = ::open(dst, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (out < 0) {
        const int err = errno;
        ::close(in);
        return errno_status(StatusDomain::Core, err);
    }

    std::vector<u8> buf;
    try {
        buf.resize(block_size);
    } catch (const std::bad_alloc&) {
        ::close(in);
        ::close(out);
        return make_status(StatusDomain::Core, StatusCode::Unavailable);
    }

    Status s = ok_status();
    for (;;) {
        size_t n = 0;
        s = read_full(in, buf.data(), buf.size(), &n);
        if (!is_ok(s) || n == 0) break;
        s = write_all(out, buf.data(), n);
        if (!is_ok(s) || n < buf.size()) break;
    }

    if (is_ok(s) && durable && ::fsync(out) != 0) {
        s = errno_status(StatusDomain::Core, errno);
    }
    ::close(in);
    if (::close(out) != 0 && is_ok(s)) {
        s = errno_status(StatusDomain::Core, errno);
    }
    if (!is_ok(s)) {
        ::unlink(dst);  // Cleanup partial write
    }
    return s;
}

Status read_file(const char* path, std::vector<u8>* out) noexcept {
    if (path == nullptr || out == nullptr) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return errno_status(StatusDomain::Core, errno);
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return errno_status(StatusDomain::Core, err);
    }

    try {
        out->resize(static_cast<size_t>(st.st_size));
    } catch (const std::bad_alloc&) {
        ::close(fd);
        return make_status(StatusDomain::Core, StatusCode::Unavailable);
    }

    size_t n = 0;
    const Status s = read_full(fd, out->data(), out->size(), &n);
    ::close(fd);
    if (!is_ok(s)) {
        return s;
    }
    out->resize(n);
    return ok_status();
}

Status write_file(const char* path, BufferView data, bool durable) noexcept {
    if (path == nullptr || (data.data == nullptr && data.len > 0)) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    const int fd = ::open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_status(StatusDomain::Core, errno);
    }
    Status s = write_all(fd, data.data, data.len);
    if (is_ok(s) && durable && ::fsync(fd) != 0) {
        s = errno_status(StatusDomain::Core, errno);
    }
    if (::close(fd) != 0 && is_ok(s)) {
        s = errno_status(StatusDomain::Core, errno);
    }
    if (!is_ok(s)) {
        ::unlink(path);
    }
    return s;
}

Status remove_file(const std::string& path) noexcept {
    if (path.empty()) {
        return ok_status();
    }
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return errno_status(StatusDomain::Core, errno);
    }
    return ok_status();
}

bool file_exists(const char* path) noexcept {
    struct stat st{};
    return path != nullptr && ::stat(path, &st) == 0;
}

Status create_directories(const char* path) noexcept {
    if (path == nullptr || path[0] == '\0') {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    if (::mkdir(path, 0755) == 0 || errno == EEXIST) {
        return ok_status();
    }
    if (errno != ENOENT) {
        return errno_status(StatusDomain::Core, errno);
    }

    // Parent doesn't exist, recurse
    char tmp[1024];
    const int n = std::snprintf(tmp, sizeof(tmp), "%s", path);
    if (n < 0 || static_cast<size_t>(n) >= sizeof(tmp)) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }
    char* last_slash = std::strrchr(tmp, '/');
    if (last_slash == nullptr || last_slash == tmp) {
        return errno_status(StatusDomain::Core, ENOENT);
    }
    *last_slash = '\0';

    const Status s = create_directories(tmp);
    if (!is_ok(s)) return s;

    if (::mkdir(path, 0755) != 0 && errno != EEXIST) {
        return errno_status(StatusDomain::Core, errno);
    }
    return ok_status();
}

} // namespace chunkpipe::storage
