#include <gtest/gtest.h>

#include "CaptureError.hpp"
#include "CommandLine.hpp"

#include <vector>

using namespace Capture;

namespace {

bool parse(std::vector<const char*> args, CommandLine& cmd) {
    args.insert(args.begin(), "wlsnap");
    return parse_arguments(static_cast<int>(args.size()), args.data(), cmd);
}

ErrorKind regionErrorKind(const CommandLine& cmd) {
    try {
        resolve_region(cmd);
    } catch (const CaptureError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "resolve_region did not throw";
    return ErrorKind::Protocol;
}

} // namespace

TEST(CommandLineTest, NoSelectionCapturesEverything) {
    CommandLine cmd;
    ASSERT_TRUE(parse({}, cmd));
    EXPECT_EQ(resolve_region(cmd), Rect::unbounded());
}

TEST(CommandLineTest, SlurpGeometryBecomesTheRegion) {
    CommandLine cmd;
    ASSERT_TRUE(parse({"-s", "10,20 300x200"}, cmd));
    EXPECT_EQ(resolve_region(cmd), (Rect{10, 20, 300, 200}));
}

TEST(CommandLineTest, EmptySlurpGeometryIsFatal) {
    CommandLine cmd;
    ASSERT_TRUE(parse({"-s", ""}, cmd));
    ASSERT_TRUE(cmd.region.has_value());
    EXPECT_EQ(regionErrorKind(cmd), ErrorKind::FatalGeometry);
}

TEST(CommandLineTest, MalformedSlurpGeometryIsFatal) {
    CommandLine cmd;
    ASSERT_TRUE(parse({"--slurp", "ten,20 300x200"}, cmd));
    EXPECT_EQ(regionErrorKind(cmd), ErrorKind::FatalGeometry);
}

TEST(CommandLineTest, EmptyWindowTitleIsFatal) {
    CommandLine cmd;
    ASSERT_TRUE(parse({"-w", ""}, cmd));
    EXPECT_EQ(regionErrorKind(cmd), ErrorKind::FatalGeometry);
}

TEST(CommandLineTest, SlurpAndWindowCannotBeCombined) {
    CommandLine cmd;
    EXPECT_FALSE(parse({"-s", "", "-w", "x"}, cmd));
}

TEST(CommandLineTest, ParsesCaptureOptions) {
    CommandLine cmd;
    ASSERT_TRUE(parse({"-o", "DP-1", "-c", "--max-rounds", "5", "-e", "JPG", "--stdout"}, cmd));
    ASSERT_TRUE(cmd.capture.outputName.has_value());
    EXPECT_EQ(*cmd.capture.outputName, "DP-1");
    EXPECT_TRUE(cmd.capture.withCursor);
    EXPECT_EQ(cmd.capture.maxRounds, 5);
    EXPECT_EQ(cmd.encoding, IMGBuffer::EncodingFormat::Jpg);
    EXPECT_TRUE(cmd.toStdout);
}

TEST(CommandLineTest, RejectsBadUsage) {
    CommandLine a, b, c;
    EXPECT_FALSE(parse({"--max-rounds", "-1"}, a));
    EXPECT_FALSE(parse({"-e", "gif"}, b));
    EXPECT_FALSE(parse({"-s"}, c));
}

TEST(CommandLineTest, HelpStopsParsing) {
    CommandLine cmd;
    ASSERT_TRUE(parse({"-h", "--bogus"}, cmd));
    EXPECT_TRUE(cmd.help);
}
