#include <gtest/gtest.h>

#include "silenceDetector.hpp"

TEST(SilenceDetectorTest, ThresholdIsDurationOverBufferLength)
{
  EXPECT_EQ(SilenceDetector(2000, 100).buffersForSilenceThreshold(), 20);
  EXPECT_EQ(SilenceDetector(50, 100).buffersForSilenceThreshold(), 1);
}

TEST(SilenceDetectorTest, FewerThanThresholdSilentBuffersNeverEnterSilence)
{
  SilenceDetector detector(2000, 100);
  const int n = detector.buffersForSilenceThreshold();

  for (int i = 0; i < n - 1; ++i)
  {
    EXPECT_EQ(detector.processSample(true), SilenceState::NotSilent);
  }
  EXPECT_FALSE(detector.isSilent());
  EXPECT_EQ(detector.currentSilenceDuration(), 0);

  EXPECT_EQ(detector.processSample(true), SilenceState::EnteredSilence);
  EXPECT_TRUE(detector.isSilent());
}

TEST(SilenceDetectorTest, EnteredSilenceIsReportedOnce)
{
  SilenceDetector detector(300, 100);

  int entered = 0;
  for (int i = 0; i < 10; ++i)
  {
    if (detector.processSample(true) == SilenceState::EnteredSilence)
      ++entered;
  }
  EXPECT_EQ(entered, 1);
  EXPECT_EQ(detector.processSample(true), SilenceState::InSilence);
}

TEST(SilenceDetectorTest, SingleLoudBufferDoesNotExitSilence)
{
  SilenceDetector detector(300, 100);
  for (int i = 0; i < 3; ++i)
    detector.processSample(true);
  ASSERT_TRUE(detector.isSilent());

  EXPECT_EQ(detector.processSample(false), SilenceState::InSilence);
  EXPECT_EQ(detector.processSample(false), SilenceState::ExitedSilence);
  EXPECT_FALSE(detector.isSilent());
  EXPECT_EQ(detector.processSample(false), SilenceState::NotSilent);
}

TEST(SilenceDetectorTest, InterruptedSilenceRestartsCount)
{
  SilenceDetector detector(300, 100);

  detector.processSample(true);
  detector.processSample(true);
  detector.processSample(false);
  EXPECT_EQ(detector.processSample(true), SilenceState::NotSilent);
  EXPECT_EQ(detector.processSample(true), SilenceState::NotSilent);
  EXPECT_EQ(detector.processSample(true), SilenceState::EnteredSilence);
}

TEST(SilenceDetectorTest, DurationAndTrimDecision)
{
  SilenceDetector detector(300, 100);

  for (int i = 0; i < 3; ++i)
    detector.processSample(true);
  EXPECT_EQ(detector.currentSilenceDuration(), 300);
  EXPECT_FALSE(detector.shouldTrimSilence());

  for (int i = 0; i < 3; ++i)
    detector.processSample(true);
  EXPECT_EQ(detector.currentSilenceDuration(), 600);
  EXPECT_FALSE(detector.shouldTrimSilence());

  detector.processSample(true);
  EXPECT_EQ(detector.currentSilenceDuration(), 700);
  EXPECT_TRUE(detector.shouldTrimSilence());
}

TEST(SilenceDetectorTest, ResetClearsState)
{
  SilenceDetector detector(200, 100);
  detector.processSample(true);
  detector.processSample(true);
  ASSERT_TRUE(detector.isSilent());

  detector.reset();
  EXPECT_FALSE(detector.isSilent());
  EXPECT_EQ(detector.currentSilenceDuration(), 0);
  EXPECT_EQ(detector.processSample(true), SilenceState::NotSilent);
}
