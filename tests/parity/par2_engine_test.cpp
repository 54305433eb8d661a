#include "rpipe/parity/par2_engine.hpp"

#include "../support/test_helpers.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using rpipe::ErrorKind;
using rpipe::parity::Par2Engine;
using rpipe::testing::TempDir;
using rpipe::testing::read_file;
using rpipe::testing::write_file;

namespace {

// Mimics par2cmdline's output layout: an index file named by -a plus one
// recovery volume next to it
fs::path write_fake_par2(const fs::path& dir) {
    const auto script = dir / "fake-par2";
    write_file(script,
        "#!/bin/sh\n"
        "cmd=\"$1\"; shift\n"
        "if [ \"$cmd\" = create ]; then\n"
        "  while [ $# -gt 0 ]; do\n"
        "    case \"$1\" in -a) shift; base=\"$1\" ;; esac\n"
        "    shift\n"
        "  done\n"
        "  stem=\"${base%.par2}\"\n"
        "  printf 'INDEX' > \"$base\"\n"
        "  printf 'VOL0' > \"$stem.vol0+1.par2\"\n"
        "  exit 0\n"
        "fi\n"
        "exit 0\n");
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);
    return script;
}

} // namespace

TEST(Par2EngineTest, CreateConcatenatesPiecesIntoOneArtifact) {
    TempDir tools;
    TempDir scratch;
    const auto chunk = scratch.path() / "rp-aaaaaa";
    write_file(chunk, "chunk-bytes");

    Par2Engine engine(write_fake_par2(tools.path()).string(), 10);
    auto parity = engine.create_parity(chunk);
    ASSERT_TRUE(parity.is_ok()) << parity.error().to_string();

    EXPECT_EQ(parity.value().string(), (scratch.path() / "rp-aaaaaa.par2").string());
    EXPECT_EQ(read_file(parity.value()), "INDEXVOL0");
    EXPECT_FALSE(fs::exists(scratch.path() / "rp-aaaaaa.ec.par2"));
    EXPECT_FALSE(fs::exists(scratch.path() / "rp-aaaaaa.ec.vol0+1.par2"));
}

TEST(Par2EngineTest, FailedCreateLeavesNoArtifact) {
    TempDir scratch;
    const auto chunk = scratch.path() / "rp-aaaaaa";
    write_file(chunk, "chunk-bytes");

    Par2Engine engine("/bin/false");
    auto parity = engine.create_parity(chunk);
    ASSERT_TRUE(parity.is_error());
    EXPECT_EQ(parity.error().kind, ErrorKind::Io);
    EXPECT_FALSE(fs::exists(scratch.path() / "rp-aaaaaa.par2"));
}

TEST(Par2EngineTest, RepairMapsExitStatus) {
    TempDir tools;
    TempDir scratch;
    write_file(scratch.path() / "rp-aaaaaa", "x");
    write_file(scratch.path() / "rp-aaaaaa.par2", "p");

    Par2Engine working(write_fake_par2(tools.path()).string());
    EXPECT_TRUE(working.repair(scratch.path() / "rp-aaaaaa.par2", scratch.path() / "rp-aaaaaa").is_ok());

    Par2Engine broken("/bin/false");
    auto res = broken.repair(scratch.path() / "rp-aaaaaa.par2", scratch.path() / "rp-aaaaaa");
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::RepairFailed);
    EXPECT_EQ(res.error().chunk, "rp-aaaaaa");
}
