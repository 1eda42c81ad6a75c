#pragma once

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "chunkpipe/core/config.hpp"
#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"
#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/transfer/transport.hpp"

namespace chunkpipe::test {

    using chunkpipe::core::Hash256;
    using chunkpipe::core::Status;
    using chunkpipe::core::u32;
    using chunkpipe::core::u64;
    using chunkpipe::core::u8;

    // Fresh directory under /tmp, removed with everything in it on destruction.
    class ScratchDir {
    public:
        ScratchDir() {
            char tmpl[] = "/tmp/chunkpipe_test_XXXXXX";
            const char* p = ::mkdtemp(tmpl);
            EXPECT_NE(p, nullptr);
            path_ = p != nullptr ? p : "/tmp";
        }
        ~ScratchDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        ScratchDir(const ScratchDir&) = delete;
        ScratchDir& operator=(const ScratchDir&) = delete;

        [[nodiscard]] const std::string& path() const { return path_; }
        [[nodiscard]] std::string sub(const std::string& name) const {
            const std::string p = path_ + "/" + name;
            std::filesystem::create_directories(p);
            return p;
        }

    private:
        std::string path_;
    };

    inline std::vector<u8> pattern_bytes(size_t n, u32 seed = 1) {
        std::vector<u8> out(n);
        u32 x = seed * 2654435761u + 1;
        for (size_t i = 0; i < n; ++i) {
            x ^= x << 13;
            x ^= x >> 17;
            x ^= x << 5;
            out[i] = static_cast<u8>(x);
        }
        return out;
    }

    // Writes data to path and returns a read fd positioned at its start.
    inline int input_fd_for(const std::string& path, const std::vector<u8>& data) {
        const Status s = chunkpipe::storage::write_file(path.c_str(),
            {data.data(), static_cast<u32>(data.size())}, false);
        EXPECT_TRUE(chunkpipe::core::is_ok(s));
        return ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    }

    inline std::vector<u8> slurp(const std::string& path) {
        std::vector<u8> out;
        const Status s = chunkpipe::storage::read_file(path.c_str(), &out);
        EXPECT_TRUE(chunkpipe::core::is_ok(s)) << path;
        return out;
    }

    // Regular files in dir whose names carry no suffix (chunk data files).
    inline u32 count_chunk_files(const std::string& dir) {
        u32 n = 0;
        std::error_code ec;
        for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
            const std::string name = e.path().filename().string();
            if (name.find('.') == std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    inline chunkpipe::core::PipeConfig test_config(const std::string& destination, const std::string& temp_dir) {
        chunkpipe::core::PipeConfig cfg = chunkpipe::core::config_defaults();
        cfg.destination = destination;
        cfg.temp_dir = temp_dir;
        cfg.chunk_size = 4096;
        cfg.block_size = 512;
        cfg.temp_check_free_space = false;
        cfg.retry_backoff_ms = 0;
        cfg.retry_backoff_max_ms = 0;
        cfg.log_level = chunkpipe::core::LogLevel::Error;
        return cfg;
    }

    // Decorates another transport with injected failures and call accounting.
    class FlakyTransport final : public chunkpipe::transfer::TransportClient {
    public:
        explicit FlakyTransport(chunkpipe::transfer::TransportClient& inner) : inner_(inner) {}

        // The first n uploads of every key fail with TransportTransient.
        void fail_uploads_transiently(u32 n) { transient_uploads_ = n; }
        // Every upload of key fails permanently.
        void fail_upload_permanently(const std::string& key) {
            std::lock_guard<std::mutex> lock(mutex_);
            permanent_keys_.insert(key);
        }
        // Called on every upload attempt, before it is forwarded.
        void on_upload(std::function<void(const std::string&)> probe) { probe_ = std::move(probe); }

        [[nodiscard]] u32 upload_calls() const { return upload_calls_.load(); }
        [[nodiscard]] u32 download_calls() const { return download_calls_.load(); }
        [[nodiscard]] u32 remove_calls() const { return remove_calls_.load(); }
        [[nodiscard]] u32 mutating_calls() const { return upload_calls_.load() + remove_calls_.load(); }
        [[nodiscard]] u32 max_concurrent_uploads() const { return max_concurrent_.load(); }

        Status upload(const std::string& local_path, const std::string& remote_key) noexcept override {
            ++upload_calls_;
            const u32 now = ++concurrent_;
            u32 prev = max_concurrent_.load();
            while (now > prev && !max_concurrent_.compare_exchange_weak(prev, now)) {
            }
            if (probe_) {
                probe_(remote_key);
            }
            Status s = decide(remote_key);
            if (chunkpipe::core::is_ok(s)) {
                s = inner_.upload(local_path, remote_key);
            }
            --concurrent_;
            return s;
        }

        Status download(const std::string& remote_key, const std::string& local_path) noexcept override {
            ++download_calls_;
            return inner_.download(remote_key, local_path);
        }

        Status list(const std::string& remote_prefix, std::vector<std::string>* out) noexcept override {
            return inner_.list(remote_prefix, out);
        }

        Status remove(const std::string& remote_key) noexcept override {
            ++remove_calls_;
            return inner_.remove(remote_key);
        }

        Status head_checksum(const std::string& remote_key, Hash256* out, bool* present) noexcept override {
            if (hide_checksums_) {
                *present = false;
                return chunkpipe::core::ok_status();
            }
            return inner_.head_checksum(remote_key, out, present);
        }

        // Behave like a remote that cannot report digests.
        void hide_checksums() { hide_checksums_ = true; }

    private:
        Status decide(const std::string& key) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (permanent_keys_.count(key) != 0) {
                return chunkpipe::core::make_status(chunkpipe::core::StatusDomain::Transport,
                    chunkpipe::core::StatusCode::Transport);
            }
            u32& attempts = attempts_[key];
            if (attempts++ < transient_uploads_) {
                return chunkpipe::core::make_status(chunkpipe::core::StatusDomain::Transport,
                    chunkpipe::core::StatusCode::TransportTransient);
            }
            return chunkpipe::core::ok_status();
        }

        chunkpipe::transfer::TransportClient& inner_;
        std::mutex mutex_;
        std::map<std::string, u32> attempts_;
        std::set<std::string> permanent_keys_;
        u32 transient_uploads_{0};
        bool hide_checksums_{false};
        std::function<void(const std::string&)> probe_;
        std::atomic<u32> upload_calls_{0};
        std::atomic<u32> download_calls_{0};
        std::atomic<u32> remove_calls_{0};
        std::atomic<u32> concurrent_{0};
        std::atomic<u32> max_concurrent_{0};
    };

} // namespace chunkpipe::test
