#include "codec/FfmpegConverter.hpp"
#include "error/Error.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace aax;
using namespace aax::codec;
using namespace aax::test;

namespace {

// Stands in for ffmpeg: touches <input>.started, then behaves by input name.
//   *slow*      sleeps until killed
//   *stubborn*  ignores SIGTERM and exits after two seconds
//   otherwise   writes the output (last argument)
constexpr const char* CODEC_SCRIPT = R"(#!/bin/sh
in=""; out=""
while [ $# -gt 0 ]; do
  case "$1" in -i) in="$2"; shift;; esac
  out="$1"; shift
done
: > "$in.started"
case "$in" in
  *stubborn*) trap '' TERM; sleep 2; exit 0;;
  *slow*) exec sleep 30;;
esac
echo converted > "$out"
)";

}

class FfmpegConverterTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::unique_ptr<FfmpegConverter> converter;
    EncryptionMaterial material = EncryptionMaterial::parse(FakeCatalog::KEY, FakeCatalog::IV);

    void SetUp() override {
        const auto script = tmp.path() / "fake-ffmpeg";
        {
            std::ofstream out(script);
            out << CODEC_SCRIPT;
        }
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

        config::CodecConfig cfg;
        cfg.ffmpeg_path = script.string();
        converter = std::make_unique<FfmpegConverter>(cfg);
    }

    fs::path input(const std::string& name) const {
        const auto p = tmp.path() / (name + ".aax");
        makeFile(p, 16);
        return p;
    }

    std::future<fs::path> convertAsync(const fs::path& in) {
        return std::async(std::launch::async, [this, in] {
            return converter->convert(material, in, tmp.path() / "out" / (in.stem().string() + ".m4a"));
        });
    }

    static bool waitForStart(const fs::path& in) {
        const auto marker = fs::path(in.string() + ".started");
        const auto deadline = std::chrono::steady_clock::now() + 10s;
        while (!fs::exists(marker)) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }
};

TEST_F(FfmpegConverterTest, WritesOutputAtomically) {
    const auto out = converter->convert(material, input("B00A"), tmp.path() / "out" / "B00A.m4a");

    EXPECT_EQ(out, tmp.path() / "out" / "B00A.m4a");
    EXPECT_TRUE(fs::exists(out));
    EXPECT_FALSE(fs::exists(tmp.path() / "out" / "B00A.partial.m4a"));
}

TEST_F(FfmpegConverterTest, MissingInputFails) {
    EXPECT_THROW(converter->convert(material, tmp.path() / "nope.aax", tmp.path() / "out" / "nope.m4a"),
                 error::Error);
}

TEST_F(FfmpegConverterTest, CancelTerminatesRunningConversion) {
    const auto in = input("B00slow");
    auto pending = convertAsync(in);
    ASSERT_TRUE(waitForStart(in));

    converter->cancel();

    ASSERT_EQ(pending.wait_for(10s), std::future_status::ready);
    EXPECT_THROW(pending.get(), error::Error);
    EXPECT_FALSE(fs::exists(tmp.path() / "out" / "B00slow.m4a"));
}

TEST_F(FfmpegConverterTest, CancelledRunFinishingLateDoesNotDetachNextConversion) {
    // First run ignores the cancel and lingers while the next one starts
    const auto first = input("B00stubborn");
    auto lingering = convertAsync(first);
    ASSERT_TRUE(waitForStart(first));
    converter->cancel();

    const auto second = input("B00slow");
    auto running = convertAsync(second);
    ASSERT_TRUE(waitForStart(second));

    ASSERT_EQ(lingering.wait_for(10s), std::future_status::ready);
    EXPECT_THROW(lingering.get(), error::Error);

    // The second run must still be reachable after the first one unwound
    EXPECT_EQ(running.wait_for(200ms), std::future_status::timeout);
    converter->cancel();
    ASSERT_EQ(running.wait_for(10s), std::future_status::ready);
    EXPECT_THROW(running.get(), error::Error);
}

TEST_F(FfmpegConverterTest, StaleCancelDoesNotAffectLaterConversion) {
    converter->cancel();
    EXPECT_NO_THROW(converter->convert(material, input("B00B"), tmp.path() / "out" / "B00B.m4a"));
}
