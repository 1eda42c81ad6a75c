#include "chunkpipe/storage/hashing.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "chunkpipe/storage/file_io.hpp"

namespace chunkpipe::storage {
    chunkpipe::core::Status hash_compute(BufferView data, chunkpipe::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return chunkpipe::core::make_status(chunkpipe::core::StatusDomain::Core, chunkpipe::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr) {
            return chunkpipe::core::make_status(chunkpipe::core::StatusDomain::Core, chunkpipe::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return chunkpipe::core::ok_status();
    }

    chunkpipe::core::Status hash_file(const char* path,
        u32 block_size,
        chunkpipe::core::Hash256* out,
        u64* size_out) noexcept {
        using chunkpipe::core::StatusCode;
        using chunkpipe::core::StatusDomain;
        if (path == nullptr || out == nullptr || block_size == 0) {
            return chunkpipe::core::make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            const int err = errno;
            return chunkpipe::core::make_status(StatusDomain::Core,
                err == ENOENT ? StatusCode::NotFound : StatusCode::Io,
                static_cast<chunkpipe::core::u32>(err));
        }

        std::vector<u8> buf;
        try {
            buf.resize(block_size);
        } catch (const std::bad_alloc&) {
            ::close(fd);
            return chunkpipe::core::make_status(StatusDomain::Core, StatusCode::Unavailable);
        }

        StreamHasher hasher;
        u64 total = 0;
        for (;;) {
            size_t n = 0;
            const chunkpipe::core::Status s = read_full(fd, buf.data(), buf.size(), &n);
            if (!chunkpipe::core::is_ok(s)) {
                ::close(fd);
                return s;
            }
            if (n == 0) {
                break;
            }
            hasher.update(buf.data(), n);
            total += n;
            if (n < buf.size()) {
                break;
            }
        }
        ::close(fd);

        *out = hasher.finish();
        if (size_out != nullptr) {
            *size_out = total;
        }
        return chunkpipe::core::ok_status();
    }

    void hash_to_hex(const chunkpipe::core::Hash256& hash, char* out, size_t out_size) noexcept {
        static const char hex[] = "0123456789abcdef";
        if (out == nullptr || out_size == 0) {
            return;
        }
        size_t pos = 0;
        for (size_t i = 0; i < hash.b.size() && pos + 2 < out_size; ++i) {
            out[pos++] = hex[(hash.b[i] >> 4) & 0xF];
            out[pos++] = hex[hash.b[i] & 0xF];
        }
        out[pos] = '\0';
    }

    bool hash_from_hex(const char* hex, chunkpipe::core::Hash256* out) noexcept {
        if (hex == nullptr || out == nullptr || std::strlen(hex) != 64) {
            return false;
        }
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        chunkpipe::core::Hash256 h{};
        for (size_t i = 0; i < h.b.size(); ++i) {
            const int hi = nibble(hex[i * 2]);
            const int lo = nibble(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return true;
    }

    StreamHasher::StreamHasher() noexcept {
        blake3_hasher_init(&hasher_);
    }

    void StreamHasher::update(const u8* data, size_t len) noexcept {
        if (data != nullptr && len > 0) {
            blake3_hasher_update(&hasher_, data, len);
        }
    }

    chunkpipe::core::Hash256 StreamHasher::finish() const noexcept {
        // blake3_hasher_finalize does not consume the state, so finish() can be called mid-stream.
        chunkpipe::core::Hash256 out{};
        blake3_hasher_finalize(&hasher_, out.b.data(), out.b.size());
        return out;
    }

    void StreamHasher::reset() noexcept {
        blake3_hasher_init(&hasher_);
    }
} // namespace chunkpipe::storage
