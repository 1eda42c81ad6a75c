#include "chunkpipe/transfer/destination.hpp"

#include <new>
#include <string>
#include <vector>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/storage/layout.hpp"

namespace chunkpipe::transfer {

using namespace chunkpipe::core;

Status destination_in_use(TransportClient& transport, const RetryPolicy& retry, bool* in_use) noexcept {
    if (in_use == nullptr) {
        return make_status(StatusDomain::Transfer, StatusCode::Invalid);
    }
    *in_use = false;
    try {
        for (const char* prefix : {storage::kChunkPrefix, storage::kManifestKey}) {
            std::vector<std::string> keys;
            const Status s = with_retries(retry, nullptr, "list", prefix, [&] { return transport.list(prefix, &keys); });
            if (!is_ok(s)) {
                return s;
            }
            if (!keys.empty()) {
                *in_use = true;
                return ok_status();
            }
        }
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transfer, StatusCode::Unavailable);
    }
}

Status destination_purge(TransportClient& transport, const RetryPolicy& retry, u64* removed) noexcept {
    if (removed != nullptr) {
        *removed = 0;
    }
    try {
        std::vector<std::string> keys;
        Status s = with_retries(retry, nullptr, "list", "", [&] { return transport.list("", &keys); });
        if (!is_ok(s)) {
            return s;
        }
        for (const std::string& key : keys) {
            s = with_retries(retry, nullptr, "remove", key, [&] { return transport.remove(key); });
            if (!is_ok(s) && s.code != StatusCode::NotFound) {
                log_status(LogLevel::Error, key.c_str(), s);
                return s;
            }
            if (removed != nullptr) {
                ++*removed;
            }
        }
        log_emit(LogLevel::Info, "purged %zu objects", keys.size());
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Transfer, StatusCode::Unavailable);
    }
}

} // namespace chunkpipe::transfer
