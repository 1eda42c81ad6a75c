#include <string>
#include <vector>

#include <sys/stat.h>

#include <gtest/gtest.h>

#include "chunkpipe/backend/rclone_transport.hpp"
#include "test_support.hpp"

using namespace chunkpipe::core;
using chunkpipe::backend::RcloneTransport;

TEST(RcloneExitStatus, MapsExitCodes) {
    EXPECT_TRUE(is_ok(chunkpipe::backend::rclone_exit_status(0)));
    EXPECT_EQ(chunkpipe::backend::rclone_exit_status(3).code, StatusCode::NotFound);
    EXPECT_EQ(chunkpipe::backend::rclone_exit_status(4).code, StatusCode::NotFound);
    EXPECT_EQ(chunkpipe::backend::rclone_exit_status(2).code, StatusCode::TransportTransient);
    EXPECT_EQ(chunkpipe::backend::rclone_exit_status(5).code, StatusCode::TransportTransient);
    EXPECT_EQ(chunkpipe::backend::rclone_exit_status(127).code, StatusCode::Unavailable);

    const Status fatal = chunkpipe::backend::rclone_exit_status(7);
    EXPECT_EQ(fatal.code, StatusCode::Transport);
    EXPECT_EQ(fatal.domain, StatusDomain::Transport);
    EXPECT_EQ(fatal.aux, 7u);
}

TEST(RcloneTransport, RemotePathJoinsKey) {
    EXPECT_EQ(RcloneTransport("remote:").remote_path("rp-aaaaaa"), "remote:rp-aaaaaa");
    EXPECT_EQ(RcloneTransport("remote:bucket/dir/").remote_path("rp-aaaaaa"), "remote:bucket/dir/rp-aaaaaa");
}

TEST(RcloneTransport, MissingBinaryIsUnavailable) {
    RcloneTransport t("remote:", "/nonexistent/chunkpipe-rclone");
    std::vector<std::string> keys;
    EXPECT_EQ(t.list("", &keys).code, StatusCode::Unavailable);
}

// Drives the transport against a stand-in script that maps rclone verbs onto a directory.
class FakeRcloneTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote_ = scratch_.sub("remote");
        local_ = scratch_.sub("local");
        binary_ = scratch_.path() + "/fake-rclone";
        const std::string script =
            "#!/bin/sh\n"
            "cmd=$1; shift; shift\n"
            "case \"$cmd\" in\n"
            "  copyto) [ -e \"$1\" ] || exit 3; cp \"$1\" \"$2\" || exit 1 ;;\n"
            "  lsf) shift; [ -d \"$1\" ] || exit 3; ls -1 \"$1\" ;;\n"
            "  deletefile) [ -e \"$1\" ] || exit 4; rm -f \"$1\" ;;\n"
            "  *) exit 1 ;;\n"
            "esac\n";
        const std::vector<u8> body(script.begin(), script.end());
        ASSERT_TRUE(is_ok(chunkpipe::storage::write_file(binary_.c_str(), {body.data(), static_cast<u32>(body.size())}, false)));
        ASSERT_EQ(::chmod(binary_.c_str(), 0755), 0);
    }

    chunkpipe::test::ScratchDir scratch_;
    std::string remote_;
    std::string local_;
    std::string binary_;
};

TEST_F(FakeRcloneTest, UploadListDownloadRemove) {
    RcloneTransport t(remote_, binary_);
    const auto data = chunkpipe::test::pattern_bytes(300);
    const std::string src = local_ + "/src";
    ASSERT_TRUE(is_ok(chunkpipe::storage::write_file(src.c_str(), {data.data(), 300}, false)));

    ASSERT_TRUE(is_ok(t.upload(src, "rp-aaaaab")));
    ASSERT_TRUE(is_ok(t.upload(src, "rp-aaaaaa")));
    ASSERT_TRUE(is_ok(t.upload(src, "rpipe.manifest")));

    std::vector<std::string> keys;
    ASSERT_TRUE(is_ok(t.list("rp-", &keys)));
    EXPECT_EQ(keys, (std::vector<std::string>{"rp-aaaaaa", "rp-aaaaab"}));

    const std::string back = local_ + "/back";
    ASSERT_TRUE(is_ok(t.download("rp-aaaaab", back)));
    EXPECT_EQ(chunkpipe::test::slurp(back), data);

    ASSERT_TRUE(is_ok(t.remove("rp-aaaaab")));
    EXPECT_EQ(t.remove("rp-aaaaab").code, StatusCode::NotFound);
    EXPECT_EQ(t.download("rp-aaaaab", back).code, StatusCode::NotFound);

    Hash256 h{};
    bool present = true;
    ASSERT_TRUE(is_ok(t.head_checksum("rp-aaaaaa", &h, &present)));
    EXPECT_FALSE(present);
}

TEST_F(FakeRcloneTest, MissingRemoteListsEmpty) {
    RcloneTransport t(remote_ + "/not-there", binary_);
    std::vector<std::string> keys{"stale"};
    ASSERT_TRUE(is_ok(t.list("", &keys)));
    EXPECT_TRUE(keys.empty());
}
