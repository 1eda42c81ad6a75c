#include "chunkpipe/backend/rclone_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "chunkpipe/core/log.hpp"

namespace chunkpipe::backend {

using namespace chunkpipe::core;

Status rclone_exit_status(int exit_code) noexcept {
    switch (exit_code) {
        case 0:
            return ok_status();
        case 3:
        case 4:
            return make_status(StatusDomain::Transport, StatusCode::NotFound, static_cast<u32>(exit_code));
        case 2:
        case 5:
            return make_status(StatusDomain::Transport, StatusCode::TransportTransient, static_cast<u32>(exit_code));
        case 127:
            return make_status(StatusDomain::Transport, StatusCode::Unavailable, static_cast<u32>(exit_code));
        default:
            return make_status(StatusDomain::Transport, StatusCode::Transport, static_cast<u32>(exit_code));
    }
}

RcloneTransport::RcloneTransport(std::string remote, std::string rclone_binary)
    : remote_(std::move(remote)), binary_(std::move(rclone_binary)) {
    while (remote_.size() > 1 && remote_.back() == '/') {
        remote_.pop_back();
    }
}

std::string RcloneTransport::remote_path(const std::string& remote_key) const {
    if (!remote_.empty() && remote_.back() == ':') {
        return remote_ + remote_key;
    }
    return remote_ + "/" + remote_key;
}

Status RcloneTransport::run(const std::vector<std::string>& args, std::string* captured) noexcept {
    // Everything the child needs is built before fork().
    std::vector<char*> argv;
    try {
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(binary_.c_str()));
        for (const std::string& a : args) {
            argv.push_back(const_cast<char*>(a.c_str()));
        }
        argv.push_back(nullptr);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }

    int out_pipe[2] = {-1, -1};
    if (captured != nullptr && ::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return make_status(StatusDomain::Transport, StatusCode::Io, static_cast<u32>(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        if (captured != nullptr) {
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
        }
        return make_status(StatusDomain::Transport, StatusCode::TransportTransient, static_cast<u32>(err));
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            (void)::dup2(devnull, STDIN_FILENO);
            if (captured == nullptr) {
                // stdout may carry replay data; keep rclone output off it.
                (void)::dup2(STDERR_FILENO, STDOUT_FILENO);
            }
            if (devnull > 2) ::close(devnull);
        }
        if (captured != nullptr) {
            (void)::dup2(out_pipe[1], STDOUT_FILENO);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    Status s = ok_status();
    if (captured != nullptr) {
        ::close(out_pipe[1]);
        char buf[4096];
        for (;;) {
            const ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                s = make_status(StatusDomain::Transport, StatusCode::Io, static_cast<u32>(errno));
                break;
            }
            if (n == 0) break;
            try {
                captured->append(buf, static_cast<size_t>(n));
            } catch (const std::bad_alloc&) {
                s = make_status(StatusDomain::Transport, StatusCode::Unavailable);
                break;
            }
        }
        ::close(out_pipe[0]);
    }

    int wstatus = 0;
    while (::waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR) {
            return make_status(StatusDomain::Transport, StatusCode::Io, static_cast<u32>(errno));
        }
    }
    if (!is_ok(s)) {
        return s;
    }
    if (WIFSIGNALED(wstatus)) {
        return make_status(StatusDomain::Transport, StatusCode::TransportTransient, static_cast<u32>(WTERMSIG(wstatus)));
    }
    return rclone_exit_status(WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : 1);
}

Status RcloneTransport::upload(const std::string& local_path, const std::string& remote_key) noexcept {
    try {
        const Status s = run({"copyto", "--retries=1", local_path, remote_path(remote_key)}, nullptr);
        if (!is_ok(s)) {
            log_status(LogLevel::Debug, "rclone copyto (upload)", s);
        }
        return s;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

Status RcloneTransport::download(const std::string& remote_key, const std::string& local_path) noexcept {
    try {
        const Status s = run({"copyto", "--retries=1", remote_path(remote_key), local_path}, nullptr);
        if (!is_ok(s)) {
            log_status(LogLevel::Debug, "rclone copyto (download)", s);
        }
        return s;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

Status RcloneTransport::list(const std::string& remote_prefix, std::vector<std::string>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Transport, StatusCode::Invalid);
    }
    out->clear();
    try {
        std::string text;
        const Status s = run({"lsf", "--files-only", "--retries=1", remote_}, &text);
        if (s.code == StatusCode::NotFound) {
            return ok_status();  // Destination does not exist yet
        }
        if (!is_ok(s)) {
            return s;
        }
        size_t pos = 0;
        while (pos < text.size()) {
            size_t eol = text.find('\n', pos);
            if (eol == std::string::npos) eol = text.size();
            std::string line = text.substr(pos, eol - pos);
            pos = eol + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            if (line.compare(0, remote_prefix.size(), remote_prefix) != 0) continue;
            out->push_back(std::move(line));
        }
        std::sort(out->begin(), out->end());
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

Status RcloneTransport::remove(const std::string& remote_key) noexcept {
    try {
        return run({"deletefile", "--retries=1", remote_path(remote_key)}, nullptr);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transport, StatusCode::Unavailable);
    }
}

Status RcloneTransport::head_checksum(const std::string& remote_key, Hash256* out, bool* present) noexcept {
    (void)remote_key;
    if (out == nullptr || present == nullptr) {
        return make_status(StatusDomain::Transport, StatusCode::Invalid);
    }
    *present = false;
    return ok_status();
}

} // namespace chunkpipe::backend
