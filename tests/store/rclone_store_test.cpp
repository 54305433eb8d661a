#include "rpipe/store/rclone_store.hpp"

#include "../support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using rpipe::ErrorKind;
using rpipe::Ok;
using rpipe::Result;
using rpipe::store::RcloneStore;
using rpipe::testing::TempDir;
using rpipe::testing::read_file;
using rpipe::testing::write_file;

namespace {

// Stand-in for the rclone binary: logs its arguments and answers a few
// subcommands with canned output
fs::path write_fake_rclone(const fs::path& dir) {
    const auto script = dir / "fake-rclone";
    const auto log = dir / "calls.log";
    write_file(script,
        "#!/bin/sh\n"
        "echo \"$@\" >> '" + log.string() + "'\n"
        "case \"$1\" in\n"
        "  mkdir) exit 0 ;;\n"
        "  copyto) exit 0 ;;\n"
        "  cat) printf 'chunk-bytes' ;;\n"
        "  lsf) printf 'rp-aaaaaa\\nrp-aaaaab\\n' ;;\n"
        "  md5sum) printf '900150983cd24fb0d6963f7d28e17f72  rp-aaaaaa\\n\\nd41d8cd98f00b204e9800998ecf8427e  rp-aaaaab\\n' ;;\n"
        "  *) exit 4 ;;\n"
        "esac\n");
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
    return script;
}

} // namespace

TEST(RcloneStoreTest, JoinsRemotePaths) {
    EXPECT_EQ(RcloneStore("remote:").remote_path("rp-aaaaaa"), "remote:rp-aaaaaa");
    EXPECT_EQ(RcloneStore("remote:bucket/").remote_path("rp-aaaaaa"), "remote:bucket/rp-aaaaaa");
    EXPECT_EQ(RcloneStore("remote:bucket").remote_path("rpipe.md5"), "remote:bucket/rpipe.md5");
}

TEST(RcloneStoreTest, ParsesChecksumListing) {
    auto inventory = rpipe::store::parse_checksum_listing(
        "900150983cd24fb0d6963f7d28e17f72  rp-aaaaaa\n"
        "\n"
        "lonely\n"
        "d41d8cd98f00b204e9800998ecf8427e  rp-aaaaab\n");
    ASSERT_EQ(inventory.size(), 2u);
    EXPECT_EQ(inventory.at("rp-aaaaaa"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(inventory.at("rp-aaaaab"), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(RcloneStoreTest, DrivesRcloneSubcommands) {
    TempDir dir;
    const auto binary = write_fake_rclone(dir.path());
    RcloneStore store("remote:bucket", binary.string(), 7);

    ASSERT_TRUE(store.make_container().is_ok());

    write_file(dir.path() / "rp-aaaaaa", "x");
    ASSERT_TRUE(store.put(dir.path() / "rp-aaaaaa", "rp-aaaaaa").is_ok());

    std::string fetched;
    auto got = store.get("rp-aaaaaa", [&](const char* data, std::size_t size) -> Result<void> {
        fetched.append(data, size);
        return Ok();
    }, 4);
    ASSERT_TRUE(got.is_ok());
    EXPECT_EQ(fetched, "chunk-bytes");

    auto names = store.list("rp-*");
    ASSERT_TRUE(names.is_ok());
    EXPECT_EQ(names.value(), (std::vector<std::string>{"rp-aaaaaa", "rp-aaaaab"}));

    auto sums = store.remote_checksums("rp-*");
    ASSERT_TRUE(sums.is_ok());
    EXPECT_EQ(sums.value().size(), 2u);

    const auto calls = read_file(dir.path() / "calls.log");
    EXPECT_NE(calls.find("mkdir --retries=7 remote:bucket"), std::string::npos);
    EXPECT_NE(calls.find("copyto --retries=7 " + (dir.path() / "rp-aaaaaa").string() +
                         " remote:bucket/rp-aaaaaa"), std::string::npos);
    EXPECT_NE(calls.find("cat --retries=7 remote:bucket/rp-aaaaaa"), std::string::npos);
    EXPECT_NE(calls.find("md5sum --retries=7 --include=rp-* remote:bucket"), std::string::npos);
}

TEST(RcloneStoreTest, NonZeroExitIsFatalTransmission) {
    RcloneStore store("remote:bucket", "/bin/false");
    TempDir dir;
    write_file(dir.path() / "rp-aaaaaa", "x");

    auto put = store.put(dir.path() / "rp-aaaaaa", "rp-aaaaaa");
    ASSERT_TRUE(put.is_error());
    EXPECT_EQ(put.error().kind, ErrorKind::FatalTransmission);
    EXPECT_EQ(put.error().chunk, "rp-aaaaaa");

    auto sums = store.remote_checksums("rp-*");
    ASSERT_TRUE(sums.is_error());
    EXPECT_EQ(sums.error().kind, ErrorKind::FatalTransmission);
}
