#pragma once

#include <cstdint>
#include <vector>

#include "recordingConstraints.hpp"

// Post-capture signal conditioning over the whole session.
// Every stage is total and keeps the sample count, except trimSilence().
class AudioProcessor
{
public:
  static constexpr float TRIM_THRESHOLD = 0.01f;   // of full scale
  static constexpr int TRIM_GUARD_SAMPLES = 100;
  static constexpr float GATE_THRESHOLD = 0.005f;  // of full scale
  static constexpr int GATE_HALF_WINDOW = 50;
  static constexpr float GATE_ATTENUATION = 0.1f;
  static constexpr float NORMALIZE_TARGET = 0.9f;
  static constexpr int LOUD_PEAK = 16384;

  AudioProcessor(const QualityPreset &preset, int sampleRate);

  std::vector<int16_t> process(const std::vector<int16_t> &samples) const;

  std::vector<int16_t> trimSilence(const std::vector<int16_t> &samples) const;
  std::vector<int16_t> applyNoiseGate(const std::vector<int16_t> &samples) const;
  std::vector<int16_t> normalize(const std::vector<int16_t> &samples) const;
  std::vector<int16_t> applyHighPassFilter(const std::vector<int16_t> &samples, float cutoffHz) const;

  float detectNoiseLevel(const std::vector<int16_t> &samples, float noiseFloorDb) const;
  float calculateDynamicRange(const std::vector<int16_t> &samples) const;

  const QualityPreset &preset() const { return preset_; }

private:
  QualityPreset preset_;
  int sampleRate_;
};
