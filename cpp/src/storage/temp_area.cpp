#include "chunkpipe/storage/temp_area.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/storage/file_io.hpp"

namespace chunkpipe::storage {

using namespace chunkpipe::core;

namespace {
    std::atomic<u32> g_area_seq{0};
} // namespace

TempArea::~TempArea() noexcept {
    close();
}

Status TempArea::open(const std::string& base_dir, bool check_free_space) noexcept {
    if (is_open()) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }
    if (base_dir.empty()) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }

    for (int attempt = 0; attempt < 16; ++attempt) {
        char name[1024];
        const int n = std::snprintf(name, sizeof(name), "%s/chunkpipe-%ld-%u",
            base_dir.c_str(), static_cast<long>(::getpid()), g_area_seq.fetch_add(1));
        if (n < 0 || static_cast<size_t>(n) >= sizeof(name)) {
            return make_status(StatusDomain::Stream, StatusCode::Invalid);
        }
        if (::mkdir(name, 0700) == 0) {
            try {
                dir_ = name;
            } catch (const std::bad_alloc&) {
                ::rmdir(name);
                return make_status(StatusDomain::Stream, StatusCode::Unavailable);
            }
            check_free_space_ = check_free_space;
            log_emit(LogLevel::Debug, "temp area %s", name);
            return ok_status();
        }
        if (errno != EEXIST) {
            return errno_status(StatusDomain::Stream, errno);
        }
    }
    return make_status(StatusDomain::Stream, StatusCode::Conflict);
}

void TempArea::close() noexcept {
    if (dir_.empty()) {
        return;
    }
    DIR* d = ::opendir(dir_.c_str());
    if (d != nullptr) {
        while (dirent* e = ::readdir(d)) {
            if (std::strcmp(e->d_name, ".") == 0 || std::strcmp(e->d_name, "..") == 0) {
                continue;
            }
            const std::string p = dir_ + "/" + e->d_name;
            if (::unlink(p.c_str()) != 0 && errno != ENOENT) {
                log_emit(LogLevel::Warn, "could not remove temp file %s: %s", p.c_str(), std::strerror(errno));
            }
        }
        ::closedir(d);
    }
    if (::rmdir(dir_.c_str()) != 0 && errno != ENOENT) {
        log_emit(LogLevel::Warn, "could not remove temp area %s: %s", dir_.c_str(), std::strerror(errno));
    }
    dir_.clear();
}

std::string TempArea::path_for(const std::string& name) const {
    return dir_ + "/" + name;
}

Status TempArea::ensure_free(u64 bytes) const noexcept {
    if (!check_free_space_ || bytes == 0) {
        return ok_status();
    }
    struct statvfs vfs{};
    if (::statvfs(dir_.c_str(), &vfs) != 0) {
        return errno_status(StatusDomain::Stream, errno);
    }
    const u64 avail = static_cast<u64>(vfs.f_bavail) * static_cast<u64>(vfs.f_frsize);
    if (avail < bytes) {
        return make_status(StatusDomain::Stream, StatusCode::TempSpace, ENOSPC);
    }
    return ok_status();
}

u32 TempArea::file_count() const noexcept {
    if (dir_.empty()) {
        return 0;
    }
    DIR* d = ::opendir(dir_.c_str());
    if (d == nullptr) {
        return 0;
    }
    u32 count = 0;
    while (dirent* e = ::readdir(d)) {
        if (std::strcmp(e->d_name, ".") != 0 && std::strcmp(e->d_name, "..") != 0) {
            ++count;
        }
    }
    ::closedir(d);
    return count;
}

} // namespace chunkpipe::storage
