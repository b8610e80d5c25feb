#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "recordingConstraints.hpp"

// Quality snapshot of a single capture buffer. Levels are normalized to [0, 1].
struct AudioMetrics
{
  float rmsLevel = 0.0f;
  float peakLevel = 0.0f;
  float dbLevel = -100.0f;
  bool isClipping = false;
  bool isSilent = true;
  float noiseFloor = -50.0f; // dB
  float signalToNoise = 0.0f; // dB
  int qualityScore = 0;       // 0-100

  static AudioMetrics empty(float noiseFloorDb = -50.0f);
};

struct RecordingStatistics
{
  int64_t durationMs = 0;
  int64_t fileSize = 0;
  int64_t estimatedFinalSize = 0;
  int64_t remainingTimeMs = 0;
  float averageLevel = 0.0f;
  float peakLevel = 0.0f;
  float silencePercentage = 0.0f;
  int clippingOccurrences = 0;
  int overallQuality = 0;
};

// Stateless per-buffer analyzer.
class QualityAnalyzer
{
public:
  static constexpr float MIN_DB = -100.0f;
  static constexpr float CLIPPING_SHARE = 0.01f;
  static constexpr size_t MIN_SAMPLES_FOR_NOISE_FLOOR = 100;

  explicit QualityAnalyzer(const RecordingConstraints &constraints);

  AudioMetrics analyze(const int16_t *samples, size_t numSamples) const;
  AudioMetrics analyze(const std::vector<int16_t> &samples) const;

  float estimateNoiseFloor(const int16_t *samples, size_t numSamples) const;

  static int calculateQualityScore(float rms, float peak, float snr, bool isClipping, bool isSilent);

private:
  float silenceThresholdDb_;
  float clippingThreshold_;
  float noiseFloorDb_;
};
