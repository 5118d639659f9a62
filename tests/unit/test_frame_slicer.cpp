#include <gtest/gtest.h>
#include "audio_types.hpp"
#include "core/audio/frame_slicer.hpp"

#include <numeric>

using namespace vani;
using namespace vani::core::audio;

TEST(FrameSlicerTest, DefaultFrameIs120MsAt24kHz) {
    EXPECT_EQ(audio_constants::FRAME_SIZE_BYTES, 5760u);
}

TEST(FrameSlicerTest, FinalPartialFrameIsZeroPadded) {
    std::vector<uint8_t> pcm(2 * 5760 + 100, 0xAB);
    auto frames = sliceFrames(pcm, 5760);

    ASSERT_EQ(frames.size(), 3u);
    for (const auto& frame : frames) {
        EXPECT_EQ(frame.size(), 5760u);
    }
    EXPECT_EQ(frames[2][99], 0xAB);
    EXPECT_EQ(frames[2][100], 0x00);
    EXPECT_EQ(frames[2].back(), 0x00);
}

TEST(FrameSlicerTest, EmptyInputYieldsNoFrames) {
    EXPECT_TRUE(sliceFrames({}, 5760).empty());
    std::vector<uint8_t> pcm(10, 1);
    EXPECT_TRUE(sliceFrames(pcm, 0).empty());
}

TEST(FrameSlicerTest, StreamingFramerKeepsRemainderAcrossChunks) {
    StreamingFramer framer(5760);
    std::vector<uint8_t> chunk(3000);
    std::iota(chunk.begin(), chunk.end(), 0);

    EXPECT_TRUE(framer.append(chunk).empty());
    EXPECT_EQ(framer.pendingBytes(), 3000u);

    auto frames = framer.append(chunk);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(framer.pendingBytes(), 240u);
    // Second chunk continues where the first ended
    EXPECT_EQ(frames[0][3000], chunk[0]);
    EXPECT_EQ(frames[0][2999], chunk[2999]);

    auto tail = framer.flush();
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0].size(), 5760u);
    EXPECT_EQ(tail[0][239], chunk[2999]);
    EXPECT_EQ(tail[0][240], 0);
    EXPECT_EQ(framer.pendingBytes(), 0u);
    EXPECT_TRUE(framer.flush().empty());
}

TEST(FrameSlicerTest, ResetDiscardsPendingAudio) {
    StreamingFramer framer(100);
    framer.append(std::vector<uint8_t>(150, 7));
    EXPECT_EQ(framer.pendingBytes(), 50u);
    framer.reset();
    EXPECT_EQ(framer.pendingBytes(), 0u);
    EXPECT_TRUE(framer.flush().empty());
}
