#include "chunkpipe/backend/xor_parity.hpp"

#include <algorithm>
#include <cstring>
#include <new>

#include "chunkpipe/storage/endian.hpp"
#include "chunkpipe/storage/hashing.hpp"

namespace chunkpipe::backend {

using namespace chunkpipe::core;
using chunkpipe::storage::BufferView;

namespace {

struct ParityHeader {
    u32 shard_size{0};
    u32 group{0};
    u64 data_len{0};
    u32 shard_count{0};
    u32 parity_count{0};
};

Status redundancy_status(StatusCode code) {
    return make_status(StatusDomain::Redundancy, code);
}

u32 ceil_div(u64 a, u64 b) {
    return static_cast<u32>((a + b - 1) / b);
}

// XORs data shard i (zero padded past data_len) into acc.
void xor_shard(const u8* data, u64 data_len, u32 shard_size, u32 i, u8* acc) {
    const u64 off = static_cast<u64>(i) * shard_size;
    const u64 n = std::min<u64>(shard_size, data_len - off);
    for (u64 j = 0; j < n; ++j) {
        acc[j] ^= data[off + j];
    }
}

Hash256 shard_hash(const u8* data, u64 data_len, u32 shard_size, u32 i) {
    const u64 off = static_cast<u64>(i) * shard_size;
    const u64 n = std::min<u64>(shard_size, data_len - off);
    storage::StreamHasher h;
    h.update(data + off, static_cast<size_t>(n));
    return h.finish();
}

bool parse_header(BufferView in, ParityHeader* out) {
    if (in.data == nullptr || in.len < kParityHeaderBytes) return false;
    const u8* p = in.data;
    if (storage::get_u32_be(p + 0) != kParityMagic) return false;
    if (storage::get_u32_be(p + 4) != kParityVersion) return false;
    ParityHeader h{};
    h.shard_size = storage::get_u32_be(p + 8);
    h.group = storage::get_u32_be(p + 12);
    h.data_len = storage::get_u64_be(p + 16);
    h.shard_count = storage::get_u32_be(p + 24);
    h.parity_count = storage::get_u32_be(p + 28);
    if (h.shard_size == 0 || h.group == 0) return false;
    if (h.shard_count != ceil_div(h.data_len, h.shard_size)) return false;
    if (h.parity_count != ceil_div(h.shard_count, h.group)) return false;
    const u64 need = kParityHeaderBytes + (static_cast<u64>(h.shard_count) + h.parity_count) * 32 +
                     static_cast<u64>(h.parity_count) * h.shard_size;
    if (need != in.len) return false;
    *out = h;
    return true;
}

} // namespace

Status XorParityEngine::encode(BufferView chunk, std::vector<u8>* parity) noexcept {
    if (parity == nullptr || (chunk.data == nullptr && chunk.len > 0)) {
        return redundancy_status(StatusCode::Invalid);
    }
    if (plan_.shard_size == 0 || plan_.group == 0) {
        return redundancy_status(StatusCode::Invalid);
    }

    const u64 data_len = chunk.len;
    const u32 shards = ceil_div(data_len, plan_.shard_size);
    const u32 parities = ceil_div(shards, plan_.group);
    const u64 total = kParityHeaderBytes + (static_cast<u64>(shards) + parities) * 32 +
                      static_cast<u64>(parities) * plan_.shard_size;

    try {
        parity->assign(static_cast<size_t>(total), 0);
    } catch (const std::bad_alloc&) {
        return redundancy_status(StatusCode::Unavailable);
    }

    u8* p = parity->data();
    storage::put_u32_be(p + 0, kParityMagic);
    storage::put_u32_be(p + 4, kParityVersion);
    storage::put_u32_be(p + 8, plan_.shard_size);
    storage::put_u32_be(p + 12, plan_.group);
    storage::put_u64_be(p + 16, data_len);
    storage::put_u32_be(p + 24, shards);
    storage::put_u32_be(p + 28, parities);

    u8* data_hashes = p + kParityHeaderBytes;
    u8* parity_hashes = data_hashes + static_cast<size_t>(shards) * 32;
    u8* parity_shards = parity_hashes + static_cast<size_t>(parities) * 32;

    for (u32 i = 0; i < shards; ++i) {
        const Hash256 h = shard_hash(chunk.data, data_len, plan_.shard_size, i);
        std::memcpy(data_hashes + static_cast<size_t>(i) * 32, h.b.data(), 32);
        xor_shard(chunk.data, data_len, plan_.shard_size, i,
            parity_shards + static_cast<size_t>(i / plan_.group) * plan_.shard_size);
    }
    for (u32 g = 0; g < parities; ++g) {
        const Hash256 h = shard_hash(parity_shards, static_cast<u64>(parities) * plan_.shard_size, plan_.shard_size, g);
        std::memcpy(parity_hashes + static_cast<size_t>(g) * 32, h.b.data(), 32);
    }
    return ok_status();
}

Status XorParityEngine::decode(BufferView corrupted, BufferView parity, std::vector<u8>* repaired) noexcept {
    if (repaired == nullptr || (corrupted.data == nullptr && corrupted.len > 0)) {
        return redundancy_status(StatusCode::Invalid);
    }
    ParityHeader h{};
    if (!parse_header(parity, &h)) {
        return redundancy_status(StatusCode::Invalid);
    }
    // Parity only covers in-place damage; truncation or growth cannot be undone.
    if (corrupted.len != h.data_len) {
        return redundancy_status(StatusCode::Unrepairable);
    }

    try {
        repaired->assign(corrupted.data, corrupted.data + corrupted.len);
    } catch (const std::bad_alloc&) {
        return redundancy_status(StatusCode::Unavailable);
    }

    const u8* data_hashes = parity.data + kParityHeaderBytes;
    const u8* parity_hashes = data_hashes + static_cast<size_t>(h.shard_count) * 32;
    const u8* parity_shards = parity_hashes + static_cast<size_t>(h.parity_count) * 32;
    const u64 parity_bytes = static_cast<u64>(h.parity_count) * h.shard_size;

    std::vector<u8> rebuilt;
    for (u32 g = 0; g < h.parity_count; ++g) {
        const u32 first = g * h.group;
        const u32 last = std::min(first + h.group, h.shard_count);

        u32 bad = 0;
        u32 bad_index = 0;
        for (u32 i = first; i < last; ++i) {
            const Hash256 got = shard_hash(repaired->data(), h.data_len, h.shard_size, i);
            if (std::memcmp(got.b.data(), data_hashes + static_cast<size_t>(i) * 32, 32) != 0) {
                ++bad;
                bad_index = i;
            }
        }
        if (bad == 0) continue;
        if (bad > 1) {
            return redundancy_status(StatusCode::Unrepairable);
        }

        const Hash256 ph = shard_hash(parity_shards, parity_bytes, h.shard_size, g);
        if (std::memcmp(ph.b.data(), parity_hashes + static_cast<size_t>(g) * 32, 32) != 0) {
            return redundancy_status(StatusCode::Unrepairable);
        }

        try {
            rebuilt.assign(parity_shards + static_cast<size_t>(g) * h.shard_size,
                parity_shards + static_cast<size_t>(g + 1) * h.shard_size);
        } catch (const std::bad_alloc&) {
            return redundancy_status(StatusCode::Unavailable);
        }
        for (u32 i = first; i < last; ++i) {
            if (i != bad_index) {
                xor_shard(repaired->data(), h.data_len, h.shard_size, i, rebuilt.data());
            }
        }

        const u64 off = static_cast<u64>(bad_index) * h.shard_size;
        const u64 n = std::min<u64>(h.shard_size, h.data_len - off);
        std::memcpy(repaired->data() + off, rebuilt.data(), static_cast<size_t>(n));

        const Hash256 check = shard_hash(repaired->data(), h.data_len, h.shard_size, bad_index);
        if (std::memcmp(check.b.data(), data_hashes + static_cast<size_t>(bad_index) * 32, 32) != 0) {
            return redundancy_status(StatusCode::Unrepairable);
        }
    }
    return ok_status();
}

} // namespace chunkpipe::backend
