#include "chunkpipe/stream/chunk_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <new>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/storage/layout.hpp"
#include "chunkpipe/storage/temp_area.hpp"

namespace chunkpipe::stream {

using namespace chunkpipe::core;

namespace {

Status stream_status(Status s, u64 index) {
    if (is_ok(s)) return s;
    // Keep errno in aux for I/O codes; other codes name the chunk.
    if (s.code == StatusCode::Io || s.code == StatusCode::TempSpace) {
        return make_status(StatusDomain::Stream, s.code, s.aux);
    }
    return make_status(StatusDomain::Stream, s.code, static_cast<u32>(index));
}

} // namespace

ChunkWriter::ChunkWriter(storage::TempArea& temp, u64 chunk_size, u32 block_size)
    : temp_(temp), chunk_size_(chunk_size), block_size_(block_size), block_(block_size == 0 ? 1 : block_size) {}

Status ChunkWriter::next_chunk(int input_fd, ChunkDescriptor* out, bool* end_of_stream) noexcept {
    if (out == nullptr || end_of_stream == nullptr || chunk_size_ == 0 || block_size_ == 0) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid);
    }
    *end_of_stream = false;

    const u64 index = next_index_;
    if (index >= storage::kMaxChunks) {
        return make_status(StatusDomain::Stream, StatusCode::Invalid, static_cast<u32>(index));
    }
    if (eof_ && index > 0) {
        *end_of_stream = true;
        return ok_status();
    }

    // Probe before creating anything so a stream ending on a boundary leaves no empty chunk.
    size_t n = 0;
    size_t want = static_cast<size_t>(std::min<u64>(block_size_, chunk_size_));
    Status s = storage::read_full(input_fd, block_.data(), want, &n);
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "read input", s);
        return stream_status(s, index);
    }
    if (n < want) {
        eof_ = true;
    }
    if (n == 0 && index > 0) {
        *end_of_stream = true;
        return ok_status();
    }

    s = temp_.ensure_free(chunk_size_);
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "temp space", s);
        return stream_status(s, index);
    }

    std::string path;
    try {
        path = temp_.path_for(storage::layout_data_key(index));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Stream, StatusCode::Unavailable, static_cast<u32>(index));
    }

    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        s = storage::errno_status(StatusDomain::Stream, errno);
        log_status(LogLevel::Error, path.c_str(), s);
        return s;
    }

    storage::StreamHasher chunk_hasher;
    u64 written = 0;
    for (;;) {
        if (n > 0) {
            s = storage::write_all(fd, block_.data(), n);
            if (!is_ok(s)) break;
            chunk_hasher.update(block_.data(), n);
            stream_hasher_.update(block_.data(), n);
            written += n;
        }
        if (eof_ || written == chunk_size_) break;

        want = static_cast<size_t>(std::min<u64>(block_size_, chunk_size_ - written));
        s = storage::read_full(input_fd, block_.data(), want, &n);
        if (!is_ok(s)) break;
        if (n < want) {
            eof_ = true;
        }
    }

    if (is_ok(s) && ::fsync(fd) != 0) {
        s = storage::errno_status(StatusDomain::Stream, errno);
    }
    if (::close(fd) != 0 && is_ok(s)) {
        s = storage::errno_status(StatusDomain::Stream, errno);
    }
    if (!is_ok(s)) {
        (void)storage::remove_file(path);
        log_status(LogLevel::Error, path.c_str(), s);
        return stream_status(s, index);
    }

    out->index = index;
    out->size = written;
    out->checksum = chunk_hasher.finish();
    out->local_path = std::move(path);
    out->state = ChunkState::Built;
    out->has_parity = false;

    bytes_read_ += written;
    ++next_index_;
    return ok_status();
}

} // namespace chunkpipe::stream
