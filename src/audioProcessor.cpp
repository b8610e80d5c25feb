#include "audioProcessor.hpp"
#include "AppLogger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace
{

constexpr float FULL_SCALE = 32768.0f;
constexpr float PI = 3.14159265358979323846f;

int16_t clampSample(long value)
{
  return static_cast<int16_t>(std::clamp<long>(value, -32768, 32767));
}

std::vector<float> sortedMagnitudes(const std::vector<int16_t> &samples, bool skipZero)
{
  std::vector<float> magnitudes;
  magnitudes.reserve(samples.size());
  for (int16_t s : samples)
  {
    const float m = std::abs(static_cast<int>(s)) / FULL_SCALE;
    if (skipZero && m <= 0.0f)
      continue;
    magnitudes.push_back(m);
  }
  std::sort(magnitudes.begin(), magnitudes.end());
  return magnitudes;
}

} // namespace

AudioProcessor::AudioProcessor(const QualityPreset &preset, int sampleRate)
    : preset_(preset), sampleRate_(sampleRate > 0 ? sampleRate : 16000)
{
}

std::vector<int16_t> AudioProcessor::process(const std::vector<int16_t> &samples) const
{
  std::vector<int16_t> processed = samples;

  if (preset_.trimSilence)
  {
    processed = trimSilence(processed);
  }

  // DC and rumble go before gating so the gate sees the real signal energy
  if (preset_.highPassFilter)
  {
    processed = applyHighPassFilter(processed, preset_.highPassCutoffHz);
  }

  if (preset_.noiseGate)
  {
    processed = applyNoiseGate(processed);
  }

  if (preset_.normalize)
  {
    processed = normalize(processed);
  }

  AppLogger::getInstance().debug("[AudioProcessor] " + std::string(qualityName(preset_.quality)) + " preset: " +
                                 std::to_string(samples.size()) + " -> " + std::to_string(processed.size()) + " samples");
  return processed;
}

std::vector<int16_t> AudioProcessor::trimSilence(const std::vector<int16_t> &samples) const
{
  if (samples.empty())
    return samples;

  const int threshold = static_cast<int>(FULL_SCALE * TRIM_THRESHOLD);
  const long last = static_cast<long>(samples.size()) - 1;

  long firstLoud = -1;
  for (long i = 0; i <= last; ++i)
  {
    if (std::abs(static_cast<int>(samples[i])) > threshold)
    {
      firstLoud = i;
      break;
    }
  }

  // nothing above threshold: leave the signal alone
  if (firstLoud < 0)
    return samples;

  long lastLoud = firstLoud;
  for (long i = last; i >= firstLoud; --i)
  {
    if (std::abs(static_cast<int>(samples[i])) > threshold)
    {
      lastLoud = i;
      break;
    }
  }

  const long start = std::max(0L, firstLoud - TRIM_GUARD_SAMPLES);
  const long end = std::min(last, lastLoud + TRIM_GUARD_SAMPLES);
  return std::vector<int16_t>(samples.begin() + start, samples.begin() + end + 1);
}

std::vector<int16_t> AudioProcessor::applyNoiseGate(const std::vector<int16_t> &samples) const
{
  if (samples.empty())
    return samples;

  const double gateThreshold = FULL_SCALE * GATE_THRESHOLD;
  const long n = static_cast<long>(samples.size());

  // prefix sums of squared samples give each window's energy in O(1)
  std::vector<int64_t> prefix(samples.size() + 1, 0);
  for (long i = 0; i < n; ++i)
  {
    const int64_t s = samples[i];
    prefix[i + 1] = prefix[i] + s * s;
  }

  std::vector<int16_t> result(samples.size());
  for (long i = 0; i < n; ++i)
  {
    const long windowStart = std::max(0L, i - GATE_HALF_WINDOW);
    const long windowEnd = std::min(n - 1, i + GATE_HALF_WINDOW);
    const double energy = static_cast<double>(prefix[windowEnd + 1] - prefix[windowStart]);
    const double windowRms = std::sqrt(energy / (windowEnd - windowStart + 1));

    if (windowRms > gateThreshold)
    {
      result[i] = samples[i];
    }
    else
    {
      // attenuate rather than mute to avoid audible gating
      result[i] = static_cast<int16_t>(samples[i] * GATE_ATTENUATION);
    }
  }
  return result;
}

std::vector<int16_t> AudioProcessor::normalize(const std::vector<int16_t> &samples) const
{
  if (samples.empty())
    return samples;

  int maxAmplitude = 0;
  for (int16_t s : samples)
  {
    maxAmplitude = std::max(maxAmplitude, std::abs(static_cast<int>(s)));
  }

  if (maxAmplitude == 0)
    return samples;

  const int targetAmplitude = static_cast<int>(32767 * NORMALIZE_TARGET);
  const float factor = static_cast<float>(targetAmplitude) / maxAmplitude;

  // already loud enough, amplifying would only raise the noise
  if (factor > 1.0f && maxAmplitude > LOUD_PEAK)
    return samples;

  std::vector<int16_t> result(samples.size());
  for (size_t i = 0; i < samples.size(); ++i)
  {
    result[i] = clampSample(std::lround(samples[i] * factor));
  }
  return result;
}

std::vector<int16_t> AudioProcessor::applyHighPassFilter(const std::vector<int16_t> &samples, float cutoffHz) const
{
  if (samples.empty() || cutoffHz <= 0.0f)
    return samples;

  const float rc = 1.0f / (2.0f * PI * cutoffHz);
  const float dt = 1.0f / static_cast<float>(sampleRate_);
  const float alpha = rc / (rc + dt);

  std::vector<int16_t> result(samples.size());
  float previousInput = 0.0f;
  float previousOutput = 0.0f;

  for (size_t i = 0; i < samples.size(); ++i)
  {
    const float input = samples[i] / FULL_SCALE;
    const float output = alpha * (previousOutput + input - previousInput);

    result[i] = clampSample(std::lround(output * FULL_SCALE));

    previousInput = input;
    previousOutput = output;
  }
  return result;
}

float AudioProcessor::detectNoiseLevel(const std::vector<int16_t> &samples, float noiseFloorDb) const
{
  if (samples.empty())
    return noiseFloorDb;

  const std::vector<float> magnitudes = sortedMagnitudes(samples, false);
  const float percentile10 = magnitudes[static_cast<size_t>(magnitudes.size() * 0.1f)];
  return percentile10 > 0.0f ? 20.0f * std::log10(percentile10) : noiseFloorDb;
}

float AudioProcessor::calculateDynamicRange(const std::vector<int16_t> &samples) const
{
  const std::vector<float> magnitudes = sortedMagnitudes(samples, true);
  if (magnitudes.empty())
    return 0.0f;

  const float percentile10 = magnitudes[static_cast<size_t>(magnitudes.size() * 0.1f)];
  const float percentile90 = magnitudes[std::min(magnitudes.size() - 1, static_cast<size_t>(magnitudes.size() * 0.9f))];
  return 20.0f * std::log10(percentile90 / percentile10);
}
