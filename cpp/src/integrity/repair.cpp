#include "chunkpipe/integrity/repair.hpp"

#include <new>
#include <vector>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/storage/hashing.hpp"
#include "chunkpipe/storage/layout.hpp"
#include "chunkpipe/storage/temp_area.hpp"

namespace chunkpipe::integrity {

using namespace chunkpipe::core;
using chunkpipe::storage::BufferView;

namespace {

Status integrity_status(StatusCode code, u64 index) {
    return make_status(StatusDomain::Integrity, code, static_cast<u32>(index));
}

BufferView view_of(const std::vector<u8>& v) {
    return BufferView{v.data(), static_cast<u32>(v.size())};
}

} // namespace

Status RepairEngine::repair(u64 index, const std::string& local_copy, RepairResult* out) noexcept {
    if (out == nullptr) {
        return integrity_status(StatusCode::Invalid, index);
    }
    *out = RepairResult{index, RepairOutcome::Unrepairable};

    ChunkRecord rec{};
    Status s = manifest_.find(index, &rec);
    if (!is_ok(s)) {
        return s;
    }
    if (!rec.has_parity) {
        out->outcome = RepairOutcome::NoParityAvailable;
        log_emit(LogLevel::Warn, "chunk %llu has no parity; cannot repair", static_cast<unsigned long long>(index));
        return integrity_status(StatusCode::NoParity, index);
    }

    try {
        const std::string data_key = storage::layout_data_key(index);
        const std::string parity_key = storage::layout_parity_key(index);
        const std::string parity_path = temp_.path_for(parity_key + ".fetch");
        const std::string corrupt_path = local_copy.empty() ? temp_.path_for(data_key + ".fetch") : local_copy;
        const std::string fixed_path = temp_.path_for(data_key + ".fixed");

        std::vector<u8> parity;
        std::vector<u8> corrupted;
        std::vector<u8> repaired;

        auto cleanup = [&] {
            (void)storage::remove_file(parity_path);
            (void)storage::remove_file(fixed_path);
            if (local_copy.empty()) {
                (void)storage::remove_file(corrupt_path);
            }
        };

        s = transfer::with_retries(retry_, nullptr, "download", parity_key,
            [&] { return transport_.download(parity_key, parity_path); });
        if (s.code == StatusCode::NotFound) {
            cleanup();
            out->outcome = RepairOutcome::NoParityAvailable;
            log_emit(LogLevel::Warn, "parity object %s is missing", parity_key.c_str());
            return integrity_status(StatusCode::NoParity, index);
        }
        if (is_ok(s)) {
            s = storage::read_file(parity_path.c_str(), &parity);
        }
        if (is_ok(s) && local_copy.empty()) {
            s = transfer::with_retries(retry_, nullptr, "download", data_key,
                [&] { return transport_.download(data_key, corrupt_path); });
        }
        if (is_ok(s)) {
            s = storage::read_file(corrupt_path.c_str(), &corrupted);
        }
        if (!is_ok(s)) {
            cleanup();
            return s;
        }

        log_emit(LogLevel::Info, "repairing chunk %llu", static_cast<unsigned long long>(index));
        s = redundancy_.decode(view_of(corrupted), view_of(parity), &repaired);
        if (!is_ok(s)) {
            cleanup();
            log_emit(LogLevel::Error, "chunk %llu is unrepairable", static_cast<unsigned long long>(index));
            return integrity_status(StatusCode::Unrepairable, index);
        }

        Hash256 got{};
        s = storage::hash_compute(view_of(repaired), &got);
        if (!is_ok(s) || got != rec.checksum || repaired.size() != rec.size) {
            cleanup();
            log_emit(LogLevel::Error, "chunk %llu: reconstruction does not match the manifest",
                static_cast<unsigned long long>(index));
            return integrity_status(StatusCode::Unrepairable, index);
        }

        // Put the good bytes back at the destination before touching the local copy.
        s = storage::write_file(fixed_path.c_str(), view_of(repaired), true);
        if (is_ok(s)) {
            s = transfer::with_retries(retry_, nullptr, "upload", data_key,
                [&] { return transport_.upload(fixed_path, data_key); });
        }
        if (is_ok(s)) {
            std::vector<u8> body;
            s = manifest_encode_record(rec, &body);
            if (is_ok(s)) {
                s = storage::write_file(fixed_path.c_str(), view_of(body), true);
            }
            if (is_ok(s)) {
                const std::string checksum_key = storage::layout_checksum_key(index);
                s = transfer::with_retries(retry_, nullptr, "upload", checksum_key,
                    [&] { return transport_.upload(fixed_path, checksum_key); });
            }
        }
        if (is_ok(s)) {
            s = manifest_.record(rec.index, rec.size, rec.checksum, rec.has_parity);
        }
        if (is_ok(s) && !local_copy.empty()) {
            s = storage::write_file(local_copy.c_str(), view_of(repaired), true);
        }
        cleanup();
        if (!is_ok(s)) {
            return s;
        }

        out->outcome = RepairOutcome::Repaired;
        log_emit(LogLevel::Info, "chunk %llu repaired", static_cast<unsigned long long>(index));
        return ok_status();
    } catch (const std::bad_alloc&) {
        return integrity_status(StatusCode::Unavailable, index);
    }
}

} // namespace chunkpipe::integrity
