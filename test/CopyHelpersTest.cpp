#include "gtest/gtest.h"
#include "TestFiles.hpp"
#include "../src/commands/helpers/CopyHelpers.hpp"
#include "../src/commands/helpers/ProgressBar.hpp"
#include "../src/commands/CommandHandler.hpp"
#include "../src/utils/CryptoUtils.hpp"
#include <sstream>
#include <stdexcept>

TEST(CopyHelpersTest, ParseSizeSuffixes)
{
    EXPECT_EQ(CopyHelpers::parse_size("4096"), 4096);
    EXPECT_EQ(CopyHelpers::parse_size("4k"), 4096);
    EXPECT_EQ(CopyHelpers::parse_size("64M"), 64LL * 1024 * 1024);
    EXPECT_EQ(CopyHelpers::parse_size("1.5G"), 3LL * 512 * 1024 * 1024);

    EXPECT_THROW(CopyHelpers::parse_size(""), std::invalid_argument);
    EXPECT_THROW(CopyHelpers::parse_size("0"), std::invalid_argument);
    EXPECT_THROW(CopyHelpers::parse_size("-5M"), std::invalid_argument);
    EXPECT_THROW(CopyHelpers::parse_size("12X"), std::invalid_argument);
    EXPECT_THROW(CopyHelpers::parse_size("12MB"), std::invalid_argument);
    EXPECT_THROW(CopyHelpers::parse_size("abc"), std::invalid_argument);
}

TEST(CopyHelpersTest, ParsePositiveInt)
{
    EXPECT_EQ(CopyHelpers::parse_positive_int("8", "-j"), 8);
    EXPECT_THROW(CopyHelpers::parse_positive_int("0", "-j"), std::invalid_argument);
    EXPECT_THROW(CopyHelpers::parse_positive_int("3x", "-j"), std::invalid_argument);
    EXPECT_THROW(CopyHelpers::parse_positive_int("", "-j"), std::invalid_argument);
}

TEST(CopyHelpersTest, DirectoryDestinationGetsSourceName)
{
    TempDir tmp;
    EXPECT_EQ(CopyHelpers::resolve_destination("/data/big.iso", tmp.root()), tmp.path("big.iso"));
    EXPECT_EQ(CopyHelpers::resolve_destination("/data/big.iso", tmp.path("copy.iso")), tmp.path("copy.iso"));
}

TEST(CopyHelpersTest, SummaryListsFailedSlices)
{
    SliceRange ok_range(0, 0, 50);
    SliceRange bad_range(1, 50, 100);
    CopyRunResult result = CopyRunResult::assemble(100, {
        SliceResult::failure(bad_range, 10, ErrorKind::ShortRead, 0, "source ended early"),
        SliceResult::success(ok_range),
    });

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.slices[0].index, 0);
    EXPECT_EQ(result.total_bytes_copied, 60);

    std::ostringstream out;
    CopyHelpers::print_run_summary(result, out);
    EXPECT_NE(out.str().find("slice 1: ShortRead at offset 60"), std::string::npos);
    EXPECT_NE(out.str().find("FAILED"), std::string::npos);
}

TEST(CopyHelpersTest, WritesJsonReport)
{
    TempDir tmp;
    CopyRunResult result = CopyRunResult::assemble(10, {SliceResult::success(SliceRange(0, 0, 10))});
    CopyHelpers::write_report(tmp.path("report.json"), result);

    std::vector<uint8_t> bytes = read_file(tmp.path("report.json"));
    json report = json::parse(std::string(bytes.begin(), bytes.end()));
    EXPECT_EQ(report["outcome"], "success");
    EXPECT_EQ(report["total_bytes_copied"], 10);

    EXPECT_THROW(CopyHelpers::write_report(tmp.path("missing/report.json"), result), std::runtime_error);
}

TEST(CopyHelpersTest, VerifyComparesDigests)
{
    TempDir tmp;
    write_file(tmp.path("a"), pattern_bytes(5000));
    write_file(tmp.path("b"), pattern_bytes(5000));
    write_file(tmp.path("c"), pattern_bytes(5000, 99));

    EXPECT_TRUE(CopyHelpers::verify_copy(tmp.path("a"), tmp.path("b")));
    EXPECT_FALSE(CopyHelpers::verify_copy(tmp.path("a"), tmp.path("c")));
}

TEST(CryptoUtilsTest, KnownDigests)
{
    TempDir tmp;
    write_file(tmp.path("empty"), {});
    EXPECT_EQ(CryptoUtils::sha1_file_hex(tmp.path("empty")), "da39a3ee5e6b4b0d3255bfef95601890afd80709");

    write_file(tmp.path("abc"), {'a', 'b', 'c'});
    EXPECT_EQ(CryptoUtils::sha1_file_hex(tmp.path("abc")), "a9993e364706816aba3e25717850c26c9cd0d89d");

    EXPECT_THROW(CryptoUtils::sha1_file_hex(tmp.path("nope")), std::runtime_error);
}

TEST(ProgressBarTest, RendersCounterPercentageAndBar)
{
    ProgressBar bar(200);
    std::string line = bar.render(50, 0.0);
    EXPECT_NE(line.find("50/200"), std::string::npos);
    EXPECT_NE(line.find("25%"), std::string::npos);
    EXPECT_NE(line.find("[==========>"), std::string::npos);
    EXPECT_EQ(line.find("ETA"), std::string::npos);

    std::string timed = bar.render(100, 10.0);
    EXPECT_NE(timed.find("ETA 0:10"), std::string::npos);
}

TEST(ProgressBarTest, FinishWritesNewline)
{
    std::ostringstream out;
    ProgressBar bar(10, out);
    bar.update(5);
    bar.finish(10);
    bar.update(3);
    EXPECT_EQ(out.str().back(), '\n');
    EXPECT_NE(out.str().find("10/10"), std::string::npos);
    EXPECT_EQ(out.str().find("3/10"), std::string::npos);
}

TEST(ProgressBarTest, FormatsBytes)
{
    EXPECT_EQ(ProgressBar::format_bytes(512), "512 B");
    EXPECT_EQ(ProgressBar::format_bytes(1536), "1.5 KiB");
    EXPECT_EQ(ProgressBar::format_bytes(3.0 * 1024 * 1024), "3.0 MiB");
}

TEST(CommandHandlerTest, CopyCommandEndToEnd)
{
    TempDir tmp;
    write_file(tmp.path("src.bin"), pattern_bytes(123457));

    int rc = CommandHandler::execute("copy", {"-p", "6", "-j", "3", "-c", "4K", "--no-progress", "--verify",
                                              "--report", tmp.path("report.json"), tmp.path("src.bin"),
                                              tmp.root() + "/out.bin"});
    EXPECT_EQ(rc, 0);
    EXPECT_EQ(read_file(tmp.path("out.bin")), read_file(tmp.path("src.bin")));

    std::vector<uint8_t> bytes = read_file(tmp.path("report.json"));
    json report = json::parse(std::string(bytes.begin(), bytes.end()));
    EXPECT_EQ(report["slices"].size(), 6u);
}

TEST(CommandHandlerTest, UsageErrorsReturnOne)
{
    EXPECT_EQ(CommandHandler::execute("bogus", {}), 1);
    EXPECT_EQ(CommandHandler::execute("copy", {"only-one-arg"}), 1);
    EXPECT_EQ(CommandHandler::execute("copy", {"-j", "0", "a", "b"}), 1);
    EXPECT_EQ(CommandHandler::execute("copy", {"--frobnicate", "a", "b"}), 1);
    EXPECT_EQ(CommandHandler::execute("digest", {}), 1);
    EXPECT_EQ(CommandHandler::execute("plan", {}), 1);
}

TEST(CommandHandlerTest, MissingSourceFails)
{
    TempDir tmp;
    EXPECT_EQ(CommandHandler::execute("copy", {"--no-progress", tmp.path("missing"), tmp.path("out")}), 1);
    EXPECT_EQ(CommandHandler::execute("plan", {tmp.path("missing")}), 1);
}

TEST(CommandHandlerTest, CopyIntoOwnDirectoryKeepsSource)
{
    TempDir tmp;
    std::vector<uint8_t> data = pattern_bytes(1000);
    write_file(tmp.path("f"), data);

    EXPECT_EQ(CommandHandler::execute("copy", {"--no-progress", tmp.path("f"), tmp.root()}), 1);
    EXPECT_EQ(read_file(tmp.path("f")), data);
}

TEST(CommandHandlerTest, PlanAndDigestSucceed)
{
    TempDir tmp;
    write_file(tmp.path("f"), pattern_bytes(1000));
    EXPECT_EQ(CommandHandler::execute("plan", {"-p", "3", tmp.path("f")}), 0);
    EXPECT_EQ(CommandHandler::execute("plan", {"-s", "256", tmp.path("f")}), 0);
    EXPECT_EQ(CommandHandler::execute("digest", {tmp.path("f")}), 0);
}
