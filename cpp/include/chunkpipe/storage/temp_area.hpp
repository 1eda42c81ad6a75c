#pragma once

#include <string>

#include "chunkpipe/core/errors.hpp"
#include "chunkpipe/core/types.hpp"

namespace chunkpipe::storage {

    using u32 = chunkpipe::core::u32;
    using u64 = chunkpipe::core::u64;

    // Private scratch directory for one pipeline run: <base>/chunkpipe-<pid>-<seq>.
    // Owned by the run and removed (with any files left in it) on close().
    class TempArea {
    public:
        TempArea() noexcept = default;
        ~TempArea() noexcept;

        TempArea(const TempArea&) = delete;
        TempArea& operator=(const TempArea&) = delete;

        [[nodiscard]] chunkpipe::core::Status open(const std::string& base_dir, bool check_free_space) noexcept;
        void close() noexcept;

        [[nodiscard]] bool is_open() const noexcept { return !dir_.empty(); }
        [[nodiscard]] const std::string& dir() const noexcept { return dir_; }

        [[nodiscard]] std::string path_for(const std::string& name) const;

        // TempSpace when the filesystem reports less than `bytes` available.
        [[nodiscard]] chunkpipe::core::Status ensure_free(u64 bytes) const noexcept;

        // Number of regular files currently in the area.
        [[nodiscard]] u32 file_count() const noexcept;

    private:
        std::string dir_;
        bool check_free_space_{true};
    };

} // namespace chunkpipe::storage
