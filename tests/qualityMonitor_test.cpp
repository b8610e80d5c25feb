#include <gtest/gtest.h>

#include <vector>

#include "qualityMonitor.hpp"

namespace
{

std::vector<int16_t> buffer(size_t n, int16_t amplitude)
{
  std::vector<int16_t> samples(n);
  for (size_t i = 0; i < n; ++i)
    samples[i] = (i % 2 == 0) ? amplitude : static_cast<int16_t>(-amplitude);
  return samples;
}

} // namespace

TEST(QualityMonitorTest, FreshMonitorReportsNeutralStatistics)
{
  RecordingConstraints constraints;
  QualityMonitor monitor(constraints, QualityPreset::medium());
  monitor.startMonitoring();

  const RecordingStatistics stats = monitor.statistics();
  EXPECT_EQ(stats.durationMs, 0);
  EXPECT_EQ(stats.fileSize, 0);
  EXPECT_EQ(stats.remainingTimeMs, constraints.maxRecordingDurationMs());
  EXPECT_EQ(monitor.remainingRecordingTimeMs(), constraints.maxRecordingDurationMs());
  EXPECT_FALSE(monitor.shouldStopRecording());
  EXPECT_EQ(monitor.silenceState(), SilenceState::NotSilent);
}

TEST(QualityMonitorTest, StatisticsFollowTheSampleClock)
{
  RecordingConstraints constraints;
  QualityMonitor monitor(constraints, QualityPreset::medium());
  monitor.startMonitoring();

  const std::vector<int16_t> loud = buffer(1600, 8000);
  for (int i = 0; i < 25; ++i)
    monitor.processBuffer(loud.data(), loud.size());

  const RecordingStatistics stats = monitor.statistics();
  EXPECT_EQ(stats.durationMs, 2500);
  EXPECT_EQ(stats.fileSize, 25 * 3200);
  EXPECT_EQ(stats.estimatedFinalSize, 44 + 26 * 3200);
  EXPECT_EQ(stats.remainingTimeMs, (constraints.sizeLimitBytes() - 25 * 3200) * 1000 / 32000);
  EXPECT_EQ(monitor.remainingRecordingTimeMs(), stats.remainingTimeMs);
  EXPECT_FLOAT_EQ(stats.silencePercentage, 0.0f);
  EXPECT_NEAR(stats.peakLevel, 8000.0f / 32768.0f, 1e-5);
  EXPECT_GT(stats.overallQuality, 50);
}

TEST(QualityMonitorTest, SilenceTransitionsAndPercentage)
{
  RecordingConstraints constraints;
  constraints.silenceDurationMs = 300;
  QualityMonitor monitor(constraints, QualityPreset::medium());
  monitor.startMonitoring();

  const std::vector<int16_t> loud = buffer(1600, 8000);
  const std::vector<int16_t> quiet(1600, 0);

  monitor.processBuffer(loud.data(), loud.size());
  monitor.processBuffer(quiet.data(), quiet.size());
  monitor.processBuffer(quiet.data(), quiet.size());
  EXPECT_EQ(monitor.silenceState(), SilenceState::NotSilent);
  monitor.processBuffer(quiet.data(), quiet.size());
  EXPECT_EQ(monitor.silenceState(), SilenceState::EnteredSilence);

  EXPECT_FLOAT_EQ(monitor.statistics().silencePercentage, 75.0f);
}

TEST(QualityMonitorTest, StopsWhenEstimateReachesSizeLimit)
{
  RecordingConstraints constraints;
  constraints.maxFileSizeBytes = 32000; // one second
  QualityMonitor monitor(constraints, QualityPreset::medium());
  monitor.startMonitoring();

  const std::vector<int16_t> loud = buffer(1600, 8000);
  for (int i = 0; i < 7; ++i)
    monitor.processBuffer(loud.data(), loud.size());
  EXPECT_FALSE(monitor.shouldStopRecording());

  // limit is 30400 bytes; the estimate includes header and the next buffer
  monitor.processBuffer(loud.data(), loud.size());
  EXPECT_FALSE(monitor.shouldStopRecording());
  monitor.processBuffer(loud.data(), loud.size());
  EXPECT_TRUE(monitor.shouldStopRecording());
  EXPECT_FALSE(monitor.canContinueRecording(200));
  EXPECT_EQ(monitor.remainingRecordingTimeMs(), 50); // 30400 - 9 * 3200 bytes left
}

TEST(QualityMonitorTest, ReportFlagsClippingAndQuietness)
{
  RecordingConstraints constraints;
  QualityMonitor monitor(constraints, QualityPreset::medium());
  monitor.startMonitoring();

  const std::vector<int16_t> hot = buffer(1600, 32767);
  monitor.processBuffer(hot.data(), hot.size());
  QualityReport report = monitor.qualityReport();
  EXPECT_TRUE(report.hasIssue(QualityIssue::Clipping));
  EXPECT_FALSE(report.recommendations.empty());

  monitor.startMonitoring();
  const std::vector<int16_t> faint = buffer(1600, 200);
  for (int i = 0; i < 5; ++i)
    monitor.processBuffer(faint.data(), faint.size());
  report = monitor.qualityReport();
  EXPECT_FALSE(report.hasIssue(QualityIssue::Clipping));
  EXPECT_TRUE(report.hasIssue(QualityIssue::TooQuiet));
  EXPECT_TRUE(report.hasIssue(QualityIssue::TooMuchSilence));
}

TEST(QualityMonitorTest, StartMonitoringResetsSession)
{
  RecordingConstraints constraints;
  QualityMonitor monitor(constraints, QualityPreset::medium());
  monitor.startMonitoring();

  const std::vector<int16_t> loud = buffer(1600, 8000);
  monitor.processBuffer(loud.data(), loud.size());
  ASSERT_GT(monitor.statistics().durationMs, 0);

  monitor.startMonitoring();
  EXPECT_EQ(monitor.statistics().durationMs, 0);
  EXPECT_EQ(monitor.statistics().clippingOccurrences, 0);
  EXPECT_EQ(monitor.currentMetrics().qualityScore, 0);
}
