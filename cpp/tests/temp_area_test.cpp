#include <string>

#include <sys/stat.h>

#include <gtest/gtest.h>

#include "chunkpipe/storage/file_io.hpp"
#include "chunkpipe/storage/temp_area.hpp"
#include "test_support.hpp"

using namespace chunkpipe::core;

TEST(TempArea, CreatesPrivateSubdirectoryAndRemovesItOnClose) {
    chunkpipe::test::ScratchDir base;
    std::string dir;
    {
        chunkpipe::storage::TempArea area;
        ASSERT_TRUE(is_ok(area.open(base.path(), false)));
        ASSERT_TRUE(area.is_open());
        dir = area.dir();
        EXPECT_EQ(dir.rfind(base.path() + "/chunkpipe-", 0), 0u);

        struct stat st{};
        ASSERT_EQ(::stat(dir.c_str(), &st), 0);
        EXPECT_EQ(st.st_mode & 0777, 0700u);

        const auto data = chunkpipe::test::pattern_bytes(100);
        ASSERT_TRUE(is_ok(chunkpipe::storage::write_file(area.path_for("rp-aaaaaa").c_str(), {data.data(), 100}, false)));
        ASSERT_TRUE(is_ok(chunkpipe::storage::write_file(area.path_for("rp-aaaaaa.b3").c_str(), {data.data(), 10}, false)));
        EXPECT_EQ(area.file_count(), 2u);
    }
    EXPECT_FALSE(chunkpipe::storage::file_exists(dir.c_str()));
}

TEST(TempArea, TwoRunsGetDistinctDirectories) {
    chunkpipe::test::ScratchDir base;
    chunkpipe::storage::TempArea a;
    chunkpipe::storage::TempArea b;
    ASSERT_TRUE(is_ok(a.open(base.path(), false)));
    ASSERT_TRUE(is_ok(b.open(base.path(), false)));
    EXPECT_NE(a.dir(), b.dir());
}

TEST(TempArea, OpenFailsForMissingBase) {
    chunkpipe::storage::TempArea area;
    const Status s = area.open("/tmp/chunkpipe_missing_base_dir/x", false);
    EXPECT_FALSE(is_ok(s));
    EXPECT_FALSE(area.is_open());
}

TEST(TempArea, FreeSpaceProbeReportsTempSpace) {
    chunkpipe::test::ScratchDir base;
    chunkpipe::storage::TempArea area;
    ASSERT_TRUE(is_ok(area.open(base.path(), true)));
    EXPECT_TRUE(is_ok(area.ensure_free(1)));
    EXPECT_EQ(area.ensure_free(~0ull).code, StatusCode::TempSpace);
}

TEST(TempArea, DisabledProbeAlwaysPasses) {
    chunkpipe::test::ScratchDir base;
    chunkpipe::storage::TempArea area;
    ASSERT_TRUE(is_ok(area.open(base.path(), false)));
    EXPECT_TRUE(is_ok(area.ensure_free(~0ull)));
}
