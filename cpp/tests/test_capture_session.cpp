#include <gtest/gtest.h>

#include "CaptureError.hpp"
#include "CaptureSession.hpp"
#include "FakeProtocolClient.hpp"

#include <algorithm>
#include <array>

using namespace Capture;
using Capture::Testing::FakeOutput;
using Capture::Testing::FakeProtocolClient;

namespace {

FakeOutput makeOutput(const std::string& name, Rect logical, std::array<uint8_t, 4> raw) {
    FakeOutput output;
    output.name = name;
    output.logical = logical;
    output.raw = raw;
    return output;
}

// XRGB8888 stores B, G, R, X in memory.
constexpr std::array<uint8_t, 4> kBlueish{0xc0, 0x20, 0x10, 0x00};  // R=0x10 G=0x20 B=0xc0
constexpr std::array<uint8_t, 4> kReddish{0x05, 0x06, 0xd0, 0x00};  // R=0xd0 G=0x06 B=0x05

void expectPixel(const IMGBuffer::Buffer& image, std::size_t x, std::size_t y,
                 uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    const uint8_t* p = image.pixel(x, y);
    EXPECT_EQ(p[0], r) << "at " << x << "," << y;
    EXPECT_EQ(p[1], g) << "at " << x << "," << y;
    EXPECT_EQ(p[2], b) << "at " << x << "," << y;
    EXPECT_EQ(p[3], a) << "at " << x << "," << y;
}

ErrorKind captureErrorKind(CaptureSession& session, const CaptureOptions& options) {
    try {
        session.capture(options);
    } catch (const CaptureError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "capture did not throw";
    return ErrorKind::Protocol;
}

ErrorKind connectErrorKind(CaptureSession& session) {
    try {
        session.connect();
    } catch (const CaptureError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "connect did not throw";
    return ErrorKind::Protocol;
}

class CaptureSessionTest : public ::testing::Test {
protected:
    void useDualHead() {
        client.outputs.push_back(makeOutput("DP-1", Rect{0, 0, 1920, 1080}, kBlueish));
        client.outputs.push_back(makeOutput("HDMI-A-1", Rect{1920, 0, 1280, 1024}, kReddish));
    }

    FakeProtocolClient client;
};

} // namespace

TEST_F(CaptureSessionTest, ConnectDescribesEveryOutput) {
    useDualHead();
    CaptureSession session(client);
    session.connect();

    auto outputs = session.listOutputs();
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[0].name, "DP-1");
    EXPECT_EQ(outputs[0].logical, (Rect{0, 0, 1920, 1080}));
    EXPECT_TRUE(outputs[0].described);
    EXPECT_EQ(outputs[1].name, "HDMI-A-1");
    EXPECT_EQ(outputs[1].logical, (Rect{1920, 0, 1280, 1024}));
    EXPECT_TRUE(client.requestedRegions.empty());
}

TEST_F(CaptureSessionTest, CapturesSingleOutputInFull) {
    client.outputs.push_back(makeOutput("eDP-1", Rect{0, 0, 1920, 1080}, kBlueish));

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(CaptureOptions{});

    ASSERT_EQ(image.width(), 1920u);
    ASSERT_EQ(image.height(), 1080u);
    expectPixel(image, 0, 0, 0x10, 0x20, 0xc0, 0xff);
    expectPixel(image, 1919, 1079, 0x10, 0x20, 0xc0, 0xff);

    ASSERT_EQ(client.requestedRegions.size(), 1u);
    EXPECT_EQ(client.requestedRegions[0], (Rect{0, 0, 1920, 1080}));
    EXPECT_FALSE(client.cursorFlags[0]);
}

TEST_F(CaptureSessionTest, CompositesTwoOutputsAndLeavesGapTransparent) {
    useDualHead();

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(CaptureOptions{});

    ASSERT_EQ(image.width(), 3200u);
    ASSERT_EQ(image.height(), 1080u);
    expectPixel(image, 10, 10, 0x10, 0x20, 0xc0, 0xff);
    expectPixel(image, 1919, 1079, 0x10, 0x20, 0xc0, 0xff);
    expectPixel(image, 1920, 0, 0xd0, 0x06, 0x05, 0xff);
    expectPixel(image, 3199, 1023, 0xd0, 0x06, 0x05, 0xff);
    // Below the shorter output nothing was drawn.
    expectPixel(image, 1920, 1024, 0, 0, 0, 0);
    expectPixel(image, 3199, 1079, 0, 0, 0, 0);
}

TEST_F(CaptureSessionTest, RegionIsRequestedInOutputLocalCoordinates) {
    useDualHead();

    CaptureOptions options;
    options.region = Rect{1800, 100, 200, 50};

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(options);

    ASSERT_EQ(client.requestedRegions.size(), 2u);
    EXPECT_EQ(client.requestedRegions[0], (Rect{1800, 100, 120, 50}));
    EXPECT_EQ(client.requestedRegions[1], (Rect{0, 100, 80, 50}));

    ASSERT_EQ(image.width(), 200u);
    ASSERT_EQ(image.height(), 50u);
    expectPixel(image, 119, 0, 0x10, 0x20, 0xc0, 0xff);
    expectPixel(image, 120, 0, 0xd0, 0x06, 0x05, 0xff);
}

TEST_F(CaptureSessionTest, RegionInsideOneOutputSkipsTheOther) {
    useDualHead();

    CaptureOptions options;
    options.region = Rect{100, 100, 200, 200};

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(options);

    ASSERT_EQ(client.requestedOutputs.size(), 1u);
    EXPECT_EQ(client.requestedOutputs[0], "DP-1");
    EXPECT_EQ(client.requestedRegions[0], (Rect{100, 100, 200, 200}));
    EXPECT_EQ(image.width(), 200u);
    EXPECT_EQ(image.height(), 200u);
}

TEST_F(CaptureSessionTest, RegionOutsideEveryOutputRequestsNothing) {
    useDualHead();

    CaptureOptions options;
    options.region = Rect{5000, 5000, 10, 10};

    CaptureSession session(client);
    session.connect();
    EXPECT_EQ(captureErrorKind(session, options), ErrorKind::FatalGeometry);
    EXPECT_TRUE(client.requestedRegions.empty());
}

TEST_F(CaptureSessionTest, EmptyRegionIsRejected) {
    useDualHead();

    CaptureOptions options;
    options.region = Rect{0, 0, 0, 10};

    CaptureSession session(client);
    session.connect();
    EXPECT_EQ(captureErrorKind(session, options), ErrorKind::FatalGeometry);
    EXPECT_TRUE(client.requestedRegions.empty());
}

TEST_F(CaptureSessionTest, OutputNameSelectsOneOutput) {
    useDualHead();

    CaptureOptions options;
    options.outputName = "HDMI-A-1";
    options.withCursor = true;

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(options);

    ASSERT_EQ(client.requestedOutputs.size(), 1u);
    EXPECT_EQ(client.requestedOutputs[0], "HDMI-A-1");
    EXPECT_TRUE(client.cursorFlags[0]);
    EXPECT_EQ(image.width(), 1280u);
    EXPECT_EQ(image.height(), 1024u);
    expectPixel(image, 0, 0, 0xd0, 0x06, 0x05, 0xff);
}

TEST_F(CaptureSessionTest, UnknownOutputNameRequestsNothing) {
    useDualHead();

    CaptureOptions options;
    options.outputName = "VGA-1";

    CaptureSession session(client);
    session.connect();
    EXPECT_EQ(captureErrorKind(session, options), ErrorKind::FatalGeometry);
    EXPECT_TRUE(client.requestedRegions.empty());
}

TEST_F(CaptureSessionTest, MissingScreencopyIsFatal) {
    useDualHead();
    client.hasScreencopy = false;

    CaptureSession session(client);
    EXPECT_EQ(connectErrorKind(session), ErrorKind::FatalCapability);
}

TEST_F(CaptureSessionTest, MissingShmIsFatal) {
    useDualHead();
    client.hasShm = false;

    CaptureSession session(client);
    EXPECT_EQ(connectErrorKind(session), ErrorKind::FatalCapability);
}

TEST_F(CaptureSessionTest, MissingXdgOutputManagerLeavesNothingUsable) {
    useDualHead();
    client.hasXdgOutputManager = false;

    CaptureSession session(client);
    EXPECT_EQ(connectErrorKind(session), ErrorKind::FatalGeometry);
}

TEST_F(CaptureSessionTest, IncompleteOutputsAreDropped) {
    useDualHead();
    client.outputs[1].sendGeometry = false;
    client.outputs.push_back(makeOutput("DP-2", Rect{0, 1080, 800, 600}, kBlueish));
    client.outputs[2].sendName = false;

    CaptureSession session(client);
    session.connect();

    auto outputs = session.listOutputs();
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].name, "DP-1");
}

TEST_F(CaptureSessionTest, FailedFrameAbortsTheCapture) {
    useDualHead();
    client.outputs[1].failCopy = true;

    CaptureSession session(client);
    session.connect();
    EXPECT_EQ(captureErrorKind(session, CaptureOptions{}), ErrorKind::PerOutputFailure);
}

TEST_F(CaptureSessionTest, UnsupportedFormatIsReported) {
    useDualHead();
    client.outputs[1].format = 0x30335258; // 'XR30', 10 bit

    CaptureSession session(client);
    session.connect();
    EXPECT_EQ(captureErrorKind(session, CaptureOptions{}), ErrorKind::UnsupportedFormat);
}

TEST_F(CaptureSessionTest, FramesAreDestroyedBeforeTheirBuffersOnAbort) {
    useDualHead();
    client.outputs[1].format = 0x30335258;

    {
        CaptureSession session(client);
        session.connect();
        EXPECT_THROW(session.capture(CaptureOptions{}), CaptureError);
    }

    auto firstFrame = std::find_if(client.destroyed.begin(), client.destroyed.end(),
                                   [&](ObjectId id) { return client.isFrame(id); });
    auto firstBuffer = std::find_if(client.destroyed.begin(), client.destroyed.end(),
                                    [&](ObjectId id) { return client.isBuffer(id); });
    ASSERT_NE(firstFrame, client.destroyed.end());
    ASSERT_NE(firstBuffer, client.destroyed.end());
    EXPECT_LT(firstFrame - client.destroyed.begin(), firstBuffer - client.destroyed.begin());
}

TEST_F(CaptureSessionTest, BoundedRoundsGiveUpOnSilentCompositor) {
    useDualHead();
    client.outputs[0].answerCopy = false;

    CaptureOptions options;
    options.maxRounds = 3;

    CaptureSession session(client);
    session.connect();
    const int roundtripsBefore = client.roundtrips;
    EXPECT_EQ(captureErrorKind(session, options), ErrorKind::Protocol);

    // Blocking dispatches could wait forever; every bounded round is a sync.
    EXPECT_EQ(client.dispatches, 0);
    // format rounds + copy rounds + the cancel roundtrip
    EXPECT_LE(client.roundtrips - roundtripsBefore, 3 + 3 + 1);
}

TEST_F(CaptureSessionTest, BoundedRoundsStillCollectAnsweredFrames) {
    useDualHead();
    CaptureOptions options;
    options.maxRounds = 2;

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(options);

    EXPECT_EQ(image.width(), 3200u);
    EXPECT_EQ(client.dispatches, 0);
}

namespace {

// Plugs in another monitor as soon as the first copy is issued.
class HotplugClient : public FakeProtocolClient {
public:
    void copyFrame(ObjectId frame, ObjectId buffer) override {
        FakeProtocolClient::copyFrame(frame, buffer);
        if (!plugged) {
            plugged = true;
            FakeOutput late;
            late.name = "DP-3";
            late.logical = Rect{3200, 0, 800, 600};
            announceOutput(late);
        }
    }

    bool plugged = false;
};

} // namespace

TEST(CaptureSessionHotplugTest, OutputAnnouncedDuringCaptureIsIgnored) {
    HotplugClient client;
    client.outputs.push_back(makeOutput("DP-1", Rect{0, 0, 1920, 1080}, kBlueish));
    client.outputs.push_back(makeOutput("HDMI-A-1", Rect{1920, 0, 1280, 1024}, kReddish));

    {
        CaptureSession session(client);
        session.connect();
        IMGBuffer::Buffer image = session.capture(CaptureOptions{});

        EXPECT_TRUE(client.plugged);
        EXPECT_EQ(image.width(), 3200u);
        EXPECT_EQ(image.height(), 1080u);
        EXPECT_EQ(session.registry().size(), 2u);
        EXPECT_EQ(client.requestedOutputs.size(), 2u);
    }
    EXPECT_EQ(client.liveObjects(), 0u);
}

TEST_F(CaptureSessionTest, YInvertedFramesAreFlipped) {
    FakeOutput output = makeOutput("DP-1", Rect{0, 0, 4, 2}, kBlueish);
    output.yInvert = true;
    output.pattern = [](uint32_t, uint32_t y) {
        return y == 0 ? kBlueish : kReddish;
    };
    client.outputs.push_back(output);

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(CaptureOptions{});

    ASSERT_EQ(image.height(), 2u);
    expectPixel(image, 0, 0, 0xd0, 0x06, 0x05, 0xff);
    expectPixel(image, 3, 1, 0x10, 0x20, 0xc0, 0xff);
}

TEST_F(CaptureSessionTest, HiDpiFramesAreScaledToLogicalSize) {
    FakeOutput output = makeOutput("eDP-1", Rect{0, 0, 100, 50}, kBlueish);
    output.bufferScale = 2;
    client.outputs.push_back(output);

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(CaptureOptions{});

    ASSERT_EQ(image.width(), 100u);
    ASSERT_EQ(image.height(), 50u);
    expectPixel(image, 50, 25, 0x10, 0x20, 0xc0, 0xff);
}

TEST_F(CaptureSessionTest, AlphaFormatsKeepTheirAlpha) {
    FakeOutput output = makeOutput("DP-1", Rect{0, 0, 8, 8}, {0x01, 0x02, 0x03, 0x80});
    output.format = static_cast<uint32_t>(IMGBuffer::PixelFormat::ABGR8888);
    client.outputs.push_back(output);

    CaptureSession session(client);
    session.connect();
    IMGBuffer::Buffer image = session.capture(CaptureOptions{});

    expectPixel(image, 7, 7, 0x01, 0x02, 0x03, 0x80);
}

TEST_F(CaptureSessionTest, SessionCapturesOnlyOnce) {
    useDualHead();

    CaptureSession session(client);
    session.connect();
    session.capture(CaptureOptions{});
    EXPECT_THROW(session.capture(CaptureOptions{}), std::logic_error);
}

TEST_F(CaptureSessionTest, CaptureBeforeConnectIsAnError) {
    useDualHead();

    CaptureSession session(client);
    EXPECT_THROW(session.capture(CaptureOptions{}), std::logic_error);
}

TEST_F(CaptureSessionTest, EveryProtocolObjectIsReleased) {
    useDualHead();

    {
        CaptureSession session(client);
        session.connect();
        session.capture(CaptureOptions{});
    }
    EXPECT_EQ(client.liveObjects(), 0u);
}

TEST_F(CaptureSessionTest, ReleasesObjectsAfterFailure) {
    useDualHead();
    client.outputs[0].failCopy = true;

    {
        CaptureSession session(client);
        session.connect();
        EXPECT_THROW(session.capture(CaptureOptions{}), CaptureError);
    }
    EXPECT_EQ(client.liveObjects(), 0u);
}

TEST_F(CaptureSessionTest, OutputsReachTerminalStage) {
    useDualHead();

    CaptureSession session(client);
    session.connect();
    session.capture(CaptureOptions{});

    // Compositing releases each output but keeps its recorded outcome.
    for (const auto& output : session.registry().outputs()) {
        EXPECT_EQ(output.stage, CaptureStage::Terminal);
        ASSERT_TRUE(output.outcome.has_value());
        EXPECT_EQ(*output.outcome, FrameState::Finished);
        EXPECT_FALSE(output.memory.mapped());
    }
}
