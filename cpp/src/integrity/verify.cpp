#include "chunkpipe/integrity/verify.hpp"

#include <future>
#include <memory>
#include <new>
#include <system_error>

#include "chunkpipe/core/log.hpp"
#include "chunkpipe/integrity/repair.hpp"
#include "chunkpipe/storage/temp_area.hpp"

namespace chunkpipe::integrity {

using namespace chunkpipe::core;

Status VerifyEngine::verify(const IntegrityManifest& manifest, VerifyReport* report) noexcept {
    if (report == nullptr) {
        return make_status(StatusDomain::Integrity, StatusCode::Invalid);
    }
    *report = VerifyReport{};
    if (!manifest.finalized()) {
        return make_status(StatusDomain::Manifest, StatusCode::IncompleteManifest);
    }

    try {
        const std::vector<ChunkRecord> records = manifest.records();
        std::vector<std::future<TransferResult>> checks;
        checks.reserve(records.size());

        Status s = ok_status();
        for (const ChunkRecord& rec : records) {
            transfer::SlotLease lease;
            s = slots_.acquire(&lease);
            if (!is_ok(s)) {
                break;
            }
            checks.push_back(scheduler_.submit_check(rec, std::move(lease)));
        }

        for (auto& f : checks) {
            const TransferResult r = f.get();
            if (r.status.code == StatusCode::Cancelled) {
                s = r.status;
                continue;
            }
            ++report->checked;
            if (r.repaired) {
                report->repaired.push_back(r.index);
                continue;
            }
            switch (r.status.code) {
            case StatusCode::Ok:
                break;
            case StatusCode::ChecksumMismatch:
                report->mismatched.push_back(r.index);
                log_emit(LogLevel::Error, "chunk %llu: checksum mismatch", static_cast<unsigned long long>(r.index));
                break;
            case StatusCode::NotFound:
                report->missing.push_back(r.index);
                log_emit(LogLevel::Error, "chunk %llu: missing", static_cast<unsigned long long>(r.index));
                break;
            case StatusCode::Unrepairable:
                report->unrepairable.push_back(r.index);
                break;
            default:
                report->failed.push_back(r.index);
                log_status(LogLevel::Error, "verify", r.status);
                break;
            }
        }
        if (!is_ok(s)) {
            return s;
        }

        report->ok = report->mismatched.empty() && report->missing.empty() && report->unrepairable.empty() &&
                     report->failed.empty();
        log_emit(report->ok ? LogLevel::Info : LogLevel::Error,
            "verify: %llu chunks checked, %zu mismatched, %zu missing, %zu repaired, %zu unrepairable",
            static_cast<unsigned long long>(report->checked), report->mismatched.size(), report->missing.size(),
            report->repaired.size(), report->unrepairable.size());
        return ok_status();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Integrity, StatusCode::Unavailable);
    }
}

Status verify_report_status(const VerifyReport& report) noexcept {
    if (report.ok) {
        return ok_status();
    }
    if (!report.failed.empty()) {
        return make_status(StatusDomain::Transport, StatusCode::Transport, static_cast<u32>(report.failed.front()));
    }
    if (!report.unrepairable.empty()) {
        return make_status(StatusDomain::Integrity, StatusCode::Unrepairable,
            static_cast<u32>(report.unrepairable.front()));
    }
    if (!report.mismatched.empty()) {
        return make_status(StatusDomain::Integrity, StatusCode::ChecksumMismatch,
            static_cast<u32>(report.mismatched.front()));
    }
    if (!report.missing.empty()) {
        return make_status(StatusDomain::Integrity, StatusCode::NotFound, static_cast<u32>(report.missing.front()));
    }
    return make_status(StatusDomain::Integrity, StatusCode::Unknown);
}

Status verify_destination(const PipeConfig& cfg,
    transfer::TransportClient& transport,
    RedundancyEngine* redundancy,
    VerifyReport* report) noexcept {
    if (cfg.no_check) {
        return make_status(StatusDomain::Core, StatusCode::Incompatible);
    }
    storage::TempArea temp;
    Status s = temp.open(cfg.temp_dir, cfg.temp_check_free_space);
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "temp area", s);
        return s;
    }

    const transfer::RetryPolicy retry = transfer::retry_policy_from(cfg);
    IntegrityManifest manifest;
    s = manifest_load(transport, temp, retry, &manifest);
    if (!is_ok(s)) {
        log_status(LogLevel::Error, "load manifest", s);
        return s;
    }

    try {
        transfer::SlotPool slots(config_slot_capacity(cfg));
        std::unique_ptr<RepairEngine> repair;
        if (cfg.repair && redundancy != nullptr) {
            repair = std::make_unique<RepairEngine>(transport, *redundancy, manifest, temp, retry);
        }
        transfer::TransferScheduler scheduler(transport, slots, manifest, temp, transfer::scheduler_options_from(cfg),
            redundancy, repair.get());
        VerifyEngine engine(scheduler, slots);
        return engine.verify(manifest, report);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Integrity, StatusCode::Unavailable);
    } catch (const std::system_error&) {
        return make_status(StatusDomain::Transfer, StatusCode::Unavailable);
    }
}

} // namespace chunkpipe::integrity
