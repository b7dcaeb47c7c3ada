// Repository: VidCat-media
// Component: HoverScrubActor Contract Tests
// Purpose: Off-thread preview decoding for hover scrubbing.
//
// Required outcomes:
//   1. The caller thread never decodes; requests and polls never block on it.
//   2. Duplicate requests are dropped; queued requests are superseded
//      (latest wins).
//   3. One decoder per video: reused for the same video, replaced (old one
//      closed) for another, closed on ReleaseDecoder() and destruction.
//   4. A frame decoded for a video the caller moved away from is never
//      delivered; ClearPending() discards in-flight and queued work.
//   5. Open failures deliver nothing and leave the actor idle.
//   6. A seek that misses its target still delivers a frame, flagged
//      approximate.
//
// Copyright (c) 2025 VidCat contributors

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>

#include "vidcat/decode/DecoderConfig.hpp"
#include "vidcat/scrub/HoverScrubActor.hpp"

#include "../../fixtures/FakeFrameDecoder.h"
#include "../../fixtures/SyntheticClip.h"

namespace vidcat::scrub::testing {
namespace {

using vidcat::tests::fixtures::EnsureSyntheticClip;
using vidcat::tests::fixtures::FakeClip;
using vidcat::tests::fixtures::FakeDecoderProbe;
using vidcat::tests::fixtures::FakePixelValue;
using vidcat::tests::fixtures::MakeFakeFactory;
using vidcat::tests::fixtures::SyntheticClipParams;
using vidcat::tests::fixtures::WaitFor;

constexpr auto kFrameTimeout = std::chrono::milliseconds(2000);

// Polls like a render loop until a frame arrives or the timeout expires.
std::optional<HoverFrame> PollUntilFrame(HoverScrubActor& actor,
                                         std::chrono::milliseconds timeout) {
  std::optional<HoverFrame> frame;
  WaitFor([&] {
    frame = actor.PollFrame();
    return frame.has_value();
  }, timeout);
  return frame;
}

class HoverScrubActorContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    probe_ = std::make_shared<FakeDecoderProbe>();
    // 640x480 source -> 320x240 preview, distinct from the 320x180 default.
    clip_.source_width = 640;
    clip_.source_height = 480;
    actor_ = std::make_unique<HoverScrubActor>(HoverScrubConfig(),
                                               MakeFakeFactory(clip_, probe_));
  }

  void TearDown() override { actor_.reset(); }

  std::shared_ptr<FakeDecoderProbe> probe_;
  FakeClip clip_;
  std::unique_ptr<HoverScrubActor> actor_;
};

// =============================================================================
// Delivery
// =============================================================================

TEST_F(HoverScrubActorContractTest, RequestThenPoll_DeliversFrameForRequestedVideo) {
  EXPECT_EQ(actor_->GetPreviewSize(), (decode::OutputSize{320, 180}));

  actor_->RequestFrame("a.mp4", 0.5);
  auto frame = PollUntilFrame(*actor_, kFrameTimeout);
  ASSERT_TRUE(frame.has_value());

  EXPECT_EQ(frame->video_path, "a.mp4");
  EXPECT_DOUBLE_EQ(frame->position, 0.5);
  EXPECT_EQ(frame->frame.width, 320);
  EXPECT_EQ(frame->frame.height, 240);
  ASSERT_TRUE(frame->frame.IsWellFormed());
  EXPECT_EQ(frame->frame.rgba[0], FakePixelValue("a.mp4", 150));

  EXPECT_EQ(actor_->GetPreviewSize(), (decode::OutputSize{320, 240}));
  EXPECT_EQ(actor_->GetState(), HoverScrubActor::State::kDecoderOpen);
  EXPECT_EQ(actor_->OpenVideoPath(), "a.mp4");

  // The slot is consumed by the poll.
  EXPECT_FALSE(actor_->PollFrame().has_value());
}

TEST_F(HoverScrubActorContractTest, Decode_NeverRunsOnCallerThread) {
  const std::thread::id caller = std::this_thread::get_id();
  actor_->RequestFrame("a.mp4", 0.2);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());
  actor_->RequestFrame("b.mp4", 0.8);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());

  EXPECT_FALSE(probe_->AnyDecodeOnThread(caller));
}

TEST_F(HoverScrubActorContractTest, RequestFrame_DoesNotBlockOnSlowDecode) {
  probe_->decode_delay_ms.store(300);
  actor_->RequestFrame("a.mp4", 0.1);
  ASSERT_TRUE(WaitFor([&] { return probe_->decodes.load() >= 1; }, kFrameTimeout));

  const auto start = std::chrono::steady_clock::now();
  actor_->RequestFrame("a.mp4", 0.6);
  EXPECT_FALSE(actor_->PollFrame().has_value());
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::milliseconds(100));
}

TEST_F(HoverScrubActorContractTest, RequestFrame_PositionIsClamped) {
  actor_->RequestFrame("a.mp4", -0.5);
  auto first = PollUntilFrame(*actor_, kFrameTimeout);
  ASSERT_TRUE(first.has_value());
  EXPECT_DOUBLE_EQ(first->position, 0.0);
  EXPECT_EQ(first->frame.rgba[0], FakePixelValue("a.mp4", 0));

  actor_->RequestFrame("a.mp4", 1.7);
  auto last = PollUntilFrame(*actor_, kFrameTimeout);
  ASSERT_TRUE(last.has_value());
  EXPECT_DOUBLE_EQ(last->position, 1.0);
  EXPECT_EQ(last->frame.rgba[0], FakePixelValue("a.mp4", 299));
}

// =============================================================================
// Deduplication and coalescing
// =============================================================================

TEST_F(HoverScrubActorContractTest, DuplicateRequest_IsDropped) {
  actor_->RequestFrame("a.mp4", 0.5);
  actor_->RequestFrame("a.mp4", 0.5);
  // Same 1% grid cell.
  actor_->RequestFrame("a.mp4", 0.501);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());

  const HoverScrubActor::Stats stats = actor_->GetStats();
  EXPECT_EQ(stats.requests_sent, 1u);
  EXPECT_EQ(stats.requests_deduplicated, 2u);
  EXPECT_EQ(probe_->seeks.load(), 1);

  // Nothing new to decode for an unchanged hover.
  actor_->RequestFrame("a.mp4", 0.5);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(actor_->PollFrame().has_value());
  EXPECT_EQ(probe_->seeks.load(), 1);
}

TEST_F(HoverScrubActorContractTest, FastScrub_LatestRequestWins) {
  probe_->decode_delay_ms.store(50);
  actor_->RequestFrame("a.mp4", 0.0);
  ASSERT_TRUE(WaitFor([&] { return probe_->decodes.load() >= 1; }, kFrameTimeout));

  // Nine requests while the worker is busy: only the last is decoded.
  for (int i = 1; i <= 9; i++) {
    actor_->RequestFrame("a.mp4", i / 10.0);
  }

  std::optional<HoverFrame> latest;
  ASSERT_TRUE(WaitFor([&] {
    auto frame = actor_->PollFrame();
    if (frame && frame->position > 0.85) latest = std::move(frame);
    return latest.has_value();
  }, kFrameTimeout));
  EXPECT_EQ(latest->frame.rgba[0], FakePixelValue("a.mp4", 270));

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_EQ(probe_->decodes.load(), 2);
  EXPECT_EQ(actor_->GetStats().requests_superseded, 8u);
}

// =============================================================================
// Decoder lifecycle
// =============================================================================

TEST_F(HoverScrubActorContractTest, SameVideo_ReusesOpenDecoder) {
  for (double position : {0.1, 0.2, 0.3}) {
    actor_->RequestFrame("a.mp4", position);
    ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value()) << position;
  }
  EXPECT_EQ(probe_->opens.load(), 1);
  EXPECT_EQ(probe_->live_decoders.load(), 1);
  EXPECT_EQ(actor_->GetStats().decoder_opens, 1u);
}

TEST_F(HoverScrubActorContractTest, OtherVideo_ReplacesDecoder) {
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());
  actor_->RequestFrame("b.mp4", 0.5);
  auto frame = PollUntilFrame(*actor_, kFrameTimeout);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->video_path, "b.mp4");

  EXPECT_EQ(probe_->opens.load(), 2);
  EXPECT_EQ(probe_->live_decoders.load(), 1);
  EXPECT_EQ(probe_->destroyed.load(), 1);
  EXPECT_EQ(actor_->OpenVideoPath(), "b.mp4");
}

TEST_F(HoverScrubActorContractTest, ReleaseDecoder_ClosesOnWorkerThread) {
  const std::thread::id caller = std::this_thread::get_id();
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());
  EXPECT_EQ(actor_->GetState(), HoverScrubActor::State::kDecoderOpen);

  actor_->ReleaseDecoder();
  ASSERT_TRUE(WaitFor([&] {
    return actor_->GetState() == HoverScrubActor::State::kIdle;
  }, kFrameTimeout));
  EXPECT_EQ(probe_->live_decoders.load(), 0);
  EXPECT_TRUE(actor_->OpenVideoPath().empty());
  EXPECT_FALSE(probe_->AnyDestroyOnThread(caller));

  // The next request reopens.
  actor_->RequestFrame("a.mp4", 0.7);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());
  EXPECT_EQ(probe_->opens.load(), 2);
}

TEST_F(HoverScrubActorContractTest, OpenFailure_DeliversNothingAndStaysIdle) {
  probe_->FailOpen("broken.mp4");
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());

  actor_->RequestFrame("broken.mp4", 0.5);
  ASSERT_TRUE(WaitFor([&] { return actor_->GetStats().open_failures == 1u; }, kFrameTimeout));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_FALSE(actor_->PollFrame().has_value());
  EXPECT_EQ(actor_->GetState(), HoverScrubActor::State::kIdle);
  // The previous video's decoder was closed before the failed open.
  EXPECT_EQ(probe_->live_decoders.load(), 0);

  actor_->RequestFrame("b.mp4", 0.5);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());
  EXPECT_EQ(actor_->GetState(), HoverScrubActor::State::kDecoderOpen);
}

TEST_F(HoverScrubActorContractTest, FailedSeek_StillDeliversApproximateFrame) {
  actor_.reset();
  clip_.fail_seeks = true;
  actor_ = std::make_unique<HoverScrubActor>(HoverScrubConfig(),
                                             MakeFakeFactory(clip_, probe_));

  actor_->RequestFrame("a.mp4", 0.5);
  auto frame = PollUntilFrame(*actor_, kFrameTimeout);
  ASSERT_TRUE(frame.has_value());

  // The seek fell back to the stream start; the frame comes from there.
  EXPECT_TRUE(frame->frame.approximate);
  EXPECT_DOUBLE_EQ(frame->frame.timestamp_s, 0.0);
  ASSERT_TRUE(frame->frame.IsWellFormed());
  EXPECT_EQ(frame->frame.rgba[0], FakePixelValue("a.mp4", 0));
  EXPECT_DOUBLE_EQ(frame->position, 0.5);
  EXPECT_EQ(actor_->GetStats().frames_published, 1u);
}

TEST_F(HoverScrubActorContractTest, Destruction_JoinsWorkerAndClosesDecoder) {
  const std::thread::id caller = std::this_thread::get_id();
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());

  actor_.reset();
  EXPECT_EQ(probe_->live_decoders.load(), 0);
  EXPECT_EQ(probe_->destroyed.load(), 1);
  EXPECT_FALSE(probe_->AnyDestroyOnThread(caller));
}

TEST_F(HoverScrubActorContractTest, Destruction_WaitsForInFlightDecode) {
  probe_->decode_delay_ms.store(150);
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(WaitFor([&] { return probe_->decodes.load() >= 1; }, kFrameTimeout));
  // Queued work behind the in-flight decode is abandoned.
  actor_->RequestFrame("b.mp4", 0.5);

  actor_.reset();
  EXPECT_EQ(probe_->live_decoders.load(), 0);
  EXPECT_EQ(probe_->opens.load(), 1);
}

// =============================================================================
// Stale results
// =============================================================================

TEST_F(HoverScrubActorContractTest, SwitchVideoMidDecode_OldFrameNeverDelivered) {
  probe_->decode_delay_ms.store(100);
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(WaitFor([&] { return probe_->decodes.load() >= 1; }, kFrameTimeout));

  actor_->RequestFrame("b.mp4", 0.5);

  bool saw_a = false;
  std::optional<HoverFrame> b_frame;
  ASSERT_TRUE(WaitFor([&] {
    auto frame = actor_->PollFrame();
    if (frame && frame->video_path == "a.mp4") saw_a = true;
    if (frame && frame->video_path == "b.mp4") b_frame = std::move(frame);
    return b_frame.has_value();
  }, kFrameTimeout));

  EXPECT_FALSE(saw_a);
  EXPECT_EQ(b_frame->frame.rgba[0], FakePixelValue("b.mp4", 150));
}

TEST_F(HoverScrubActorContractTest, ClearPending_DiscardsInFlightResult) {
  probe_->decode_delay_ms.store(100);
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(WaitFor([&] { return probe_->decodes.load() >= 1; }, kFrameTimeout));

  actor_->ClearPending();
  ASSERT_TRUE(WaitFor([&] { return actor_->GetStats().stale_frames_dropped == 1u; },
                      kFrameTimeout));
  EXPECT_FALSE(actor_->PollFrame().has_value());
  EXPECT_EQ(actor_->GetStats().frames_published, 0u);
}

TEST_F(HoverScrubActorContractTest, ClearPending_DropsQueuedRequest) {
  probe_->decode_delay_ms.store(100);
  actor_->RequestFrame("a.mp4", 0.1);
  ASSERT_TRUE(WaitFor([&] { return probe_->decodes.load() >= 1; }, kFrameTimeout));
  actor_->RequestFrame("a.mp4", 0.9);

  actor_->ClearPending();
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  EXPECT_EQ(probe_->decodes.load(), 1);
  EXPECT_FALSE(actor_->PollFrame().has_value());
}

TEST_F(HoverScrubActorContractTest, ClearPending_ResetsDeduplication) {
  actor_->RequestFrame("a.mp4", 0.5);
  ASSERT_TRUE(PollUntilFrame(*actor_, kFrameTimeout).has_value());

  actor_->ClearPending();
  // Hovering the same spot again is a fresh request.
  actor_->RequestFrame("a.mp4", 0.5);
  auto frame = PollUntilFrame(*actor_, kFrameTimeout);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(actor_->GetStats().requests_sent, 2u);
  // Decoder stays open across ClearPending.
  EXPECT_EQ(probe_->opens.load(), 1);
}

// =============================================================================
// Real decoder
// =============================================================================

TEST(HoverScrubActorMediaTest, RealClips_PreviewSizesFollowEachVideo) {
  std::string error;
  SyntheticClipParams wide;
  wide.width = 640;
  wide.height = 360;
  wide.frame_count = 90;
  const std::string clip_a = EnsureSyntheticClip("vidcat_hover_a.mp4", SyntheticClipParams(), &error);
  ASSERT_FALSE(clip_a.empty()) << error;
  const std::string clip_b = EnsureSyntheticClip("vidcat_hover_b.mp4", wide, &error);
  ASSERT_FALSE(clip_b.empty()) << error;

  HoverScrubActor actor;
  actor.RequestFrame(clip_a, 0.5);
  auto a = PollUntilFrame(actor, std::chrono::milliseconds(5000));
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->frame.width, 320);
  EXPECT_EQ(a->frame.height, 240);
  EXPECT_TRUE(a->frame.IsWellFormed());
  EXPECT_EQ(actor.GetPreviewSize(), (decode::OutputSize{320, 240}));

  actor.RequestFrame(clip_b, 0.5);
  auto b = PollUntilFrame(actor, std::chrono::milliseconds(5000));
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(b->video_path, clip_b);
  EXPECT_EQ(b->frame.width, 320);
  EXPECT_EQ(b->frame.height, 180);
  EXPECT_EQ(actor.GetPreviewSize(), (decode::OutputSize{320, 180}));

  actor.RequestFrame("/nonexistent/vidcat/missing.mp4", 0.5);
  ASSERT_TRUE(WaitFor([&] { return actor.GetStats().open_failures == 1u; },
                      std::chrono::milliseconds(5000)));
  EXPECT_FALSE(actor.PollFrame().has_value());
  EXPECT_EQ(actor.GetState(), HoverScrubActor::State::kIdle);
}

}  // namespace
}  // namespace vidcat::scrub::testing
