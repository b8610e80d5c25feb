#include "audioMetrics.hpp"

#include <algorithm>
#include <cmath>

namespace
{

constexpr float FULL_SCALE = 32768.0f;

float toDb(float amplitude)
{
  return 20.0f * std::log10(amplitude);
}

} // namespace

AudioMetrics AudioMetrics::empty(float noiseFloorDb)
{
  AudioMetrics m;
  m.rmsLevel = 0.0f;
  m.peakLevel = 0.0f;
  m.dbLevel = QualityAnalyzer::MIN_DB;
  m.isClipping = false;
  m.isSilent = true;
  m.noiseFloor = noiseFloorDb;
  m.signalToNoise = 0.0f;
  m.qualityScore = 0;
  return m;
}

QualityAnalyzer::QualityAnalyzer(const RecordingConstraints &constraints)
    : silenceThresholdDb_(constraints.silenceThresholdDb),
      clippingThreshold_(constraints.clippingThreshold),
      noiseFloorDb_(constraints.noiseFloorDb)
{
}

AudioMetrics QualityAnalyzer::analyze(const std::vector<int16_t> &samples) const
{
  return analyze(samples.data(), samples.size());
}

AudioMetrics QualityAnalyzer::analyze(const int16_t *samples, size_t numSamples) const
{
  if (samples == nullptr || numSamples == 0)
  {
    return AudioMetrics::empty(noiseFloorDb_);
  }

  double sumSquares = 0.0;
  float peak = 0.0f;
  size_t clippingCount = 0;

  for (size_t i = 0; i < numSamples; ++i)
  {
    const float normalized = samples[i] / FULL_SCALE;
    const float magnitude = std::fabs(normalized);

    sumSquares += static_cast<double>(normalized) * normalized;
    if (magnitude > peak)
      peak = magnitude;
    if (magnitude >= clippingThreshold_)
      ++clippingCount;
  }

  AudioMetrics m;
  m.rmsLevel = static_cast<float>(std::sqrt(sumSquares / numSamples));
  m.peakLevel = peak;
  m.dbLevel = m.rmsLevel > 0.0f ? toDb(m.rmsLevel) : MIN_DB;
  m.isSilent = m.dbLevel < silenceThresholdDb_;
  m.isClipping = clippingCount > numSamples * CLIPPING_SHARE;
  m.noiseFloor = estimateNoiseFloor(samples, numSamples);
  m.signalToNoise = m.noiseFloor < m.dbLevel ? m.dbLevel - m.noiseFloor : 0.0f;
  m.qualityScore = calculateQualityScore(m.rmsLevel, m.peakLevel, m.signalToNoise, m.isClipping, m.isSilent);
  return m;
}

float QualityAnalyzer::estimateNoiseFloor(const int16_t *samples, size_t numSamples) const
{
  if (numSamples < MIN_SAMPLES_FOR_NOISE_FLOOR)
  {
    return noiseFloorDb_;
  }

  std::vector<int32_t> magnitudes(numSamples);
  for (size_t i = 0; i < numSamples; ++i)
  {
    magnitudes[i] = std::abs(static_cast<int32_t>(samples[i]));
  }

  // 10th percentile of the absolute amplitudes
  auto nth = magnitudes.begin() + numSamples / 10;
  std::nth_element(magnitudes.begin(), nth, magnitudes.end());

  const float percentile10 = *nth / FULL_SCALE;
  return percentile10 > 0.0f ? toDb(percentile10) : noiseFloorDb_;
}

int QualityAnalyzer::calculateQualityScore(float rms, float peak, float snr, bool isClipping, bool isSilent)
{
  int score = 50;

  if (isClipping)
    score -= 30;

  if (isSilent)
    score -= 20;

  // > 20 dB SNR is good
  score += static_cast<int>(std::clamp(snr, 0.0f, 40.0f) * 0.75f);

  if (rms >= 0.1f && rms <= 0.5f)
    score += 20;
  else if (rms < 0.05f)
    score -= 10;

  // headroom
  if (peak < 0.9f)
    score += 10;

  return std::clamp(score, 0, 100);
}
