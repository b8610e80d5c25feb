#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "audioMetrics.hpp"
#include "recordingConstraints.hpp"
#include "silenceDetector.hpp"

enum class QualityIssue
{
  Clipping,
  TooQuiet,
  TooMuchSilence,
  HighNoise,
  PoorQuality
};

const char *qualityIssueName(QualityIssue issue);

struct QualityReport
{
  int overallQuality = 0;
  AudioMetrics averageMetrics;
  RecordingStatistics statistics;
  std::vector<QualityIssue> issues;
  std::vector<std::string> recommendations;

  bool hasIssue(QualityIssue issue) const;
};

// Per-session quality accumulator. processBuffer() is called from the capture
// thread; the snapshot getters may be called from any thread.
class QualityMonitor
{
public:
  static constexpr size_t HISTORY_SIZE = 100;

  QualityMonitor(const RecordingConstraints &constraints, const QualityPreset &preset);

  void startMonitoring();

  AudioMetrics processBuffer(const int16_t *samples, size_t numSamples);

  AudioMetrics currentMetrics() const;
  RecordingStatistics statistics() const;
  SilenceState silenceState() const;
  bool shouldTrimSilence() const;

  bool shouldStopRecording() const;
  bool canContinueRecording(int64_t additionalDurationMs) const;
  int64_t remainingRecordingTimeMs() const;

  QualityReport qualityReport() const;

private:
  void updateStatistics();
  std::vector<QualityIssue> detectIssues() const;

  const RecordingConstraints &constraints_;
  QualityPreset preset_;
  QualityAnalyzer analyzer_;

  mutable std::mutex mutex_;
  SilenceDetector silenceDetector_;
  SilenceState silenceState_ = SilenceState::NotSilent;
  AudioMetrics currentMetrics_;
  RecordingStatistics statistics_;
  std::deque<AudioMetrics> history_;
  int64_t totalSamples_ = 0;
  int64_t silentSamples_ = 0;
  int clippingEvents_ = 0;
  float peakLevelSoFar_ = 0.0f;
};
