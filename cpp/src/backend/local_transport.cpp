#include "chunkpipe/backend/local_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/storage/hashing.hpp"

namespace chunkpipe::backend {

using namespace chunkpipe::core;

// ========================================================================
// Internal Helpers
// ========================================================================

static constexpr char kPartialSuffix[] = ".partial";

// Keys are flat object names; anything that could escape root is rejected.
static bool key_valid(const std::string& key) {
    if (key.empty() || key == "." || key == "..") return false;
    return key.find('/') == std::string::npos;
}

static bool ends_with(const std::string& s, const char* suffix) {
    const size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

// Local I/O status -> transport status. Only contention-style errnos are worth a retry.
static Status transport_status(Status s) {
    if (is_ok(s)) return s;
    switch (s.code) {
        case StatusCode::NotFound:
            return make_status(StatusDomain::Transport, StatusCode::NotFound, s.aux);
        case StatusCode::Invalid:
            return make_status(StatusDomain::Transport, StatusCode::Invalid, s.aux);
        default:
            break;
    }
    const int err = static_cast<int>(s.aux);
    if (err == EAGAIN || err == EBUSY || err == EINTR || err == ETIMEDOUT) {
        return make_status(StatusDomain::Transport, StatusCode::TransportTransient, s.aux);
    }
    return make_status(StatusDomain::Transport, StatusCode::Transport, s.aux);
}

// ========================================================================
// Public API Implementation
// ========================================================================

LocalTransport::LocalTransport(std::string root, u32 block_size)
    : root_(std::move(root)), block_size_(block_size == 0 ? (1u << 16) : block_size) {
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

std::string LocalTransport::object_path(const std::string& remote_key) const {
    return root_ + "/" + remote_key;
}

Status LocalTransport::upload(const std::string& local_path, const std::string& remote_key) noexcept {
    if (!key_valid(remote_key) || local_path.empty()) {
        return make_status(StatusDomain::Transport, StatusCode::Invalid);
    }

    try {
        Status s = storage::create_directories(root_.c_str());
        if (!is_ok(s)) {
            return transport_status(s);
        }

        const std::string final_path = object_path(remote_key);
        const std::string partial_path = final_path + kPartialSuffix;

        s = storage::copy_file(local_path.c_str(), partial_path.c_str(), block_size_, true);
        if (!is_ok(s)) {
            return transport_status(s);
        }

        if (::rename(partial_path.c_str(), final_path.c_str()) != 0) {
            const int err = errno;
            ::unlink(partial_path.c_str());
            return transport_status(storage::errno_status(StatusDomain::Transport, err));
        }
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

Status LocalTransport::download(const std::string& remote_key, const std::string& local_path) noexcept {
    if (!key_valid(remote_key) || local_path.empty()) {
        return make_status(StatusDomain::Transport, StatusCode::Invalid);
    }
    try {
        const std::string path = object_path(remote_key);
        return transport_status(storage::copy_file(path.c_str(), local_path.c_str(), block_size_, false));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

Status LocalTransport::list(const std::string& remote_prefix, std::vector<std::string>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Transport, StatusCode::Invalid);
    }
    out->clear();

    DIR* d = ::opendir(root_.c_str());
    if (d == nullptr) {
        if (errno == ENOENT) {
            return ok_status();  // Nothing stored yet
        }
        return transport_status(storage::errno_status(StatusDomain::Transport, errno));
    }

    try {
        while (dirent* e = ::readdir(d)) {
            const std::string name = e->d_name;
            if (name == "." || name == "..") continue;
            if (ends_with(name, kPartialSuffix)) continue;
            if (name.compare(0, remote_prefix.size(), remote_prefix) != 0) continue;
            out->push_back(name);
        }
    } catch (const std::bad_alloc&) {
        ::closedir(d);
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
    ::closedir(d);

    std::sort(out->begin(), out->end());
    return ok_status();
}

Status LocalTransport::remove(const std::string& remote_key) noexcept {
    if (!key_valid(remote_key)) {
        return make_status(StatusDomain::Transport, StatusCode::Invalid);
    }
    try {
        const std::string path = object_path(remote_key);
        if (::unlink(path.c_str()) != 0) {
            return transport_status(storage::errno_status(StatusDomain::Transport, errno));
        }
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

Status LocalTransport::head_checksum(const std::string& remote_key, Hash256* out, bool* present) noexcept {
    if (!key_valid(remote_key) || out == nullptr || present == nullptr) {
        return make_status(StatusDomain::Transport, StatusCode::Invalid);
    }
    *present = false;
    try {
        const std::string path = object_path(remote_key);
        const Status s = storage::hash_file(path.c_str(), block_size_, out, nullptr);
        if (!is_ok(s)) {
            return transport_status(s);
        }
        *present = true;
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

} // namespace chunkpipe::backend
