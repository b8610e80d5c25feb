#include "recordingConstraints.hpp"
#include "configLoader.hpp"
#include "AppLogger.hpp"

RecordingConstraints RecordingConstraints::fromConfig(const ConfigLoader &config)
{
  RecordingConstraints c;
  c.maxFileSizeBytes = config.getLong("recording.maxFileSizeBytes", c.maxFileSizeBytes);
  c.sampleRate = config.getInt("recording.sampleRate", c.sampleRate);
  c.silenceThresholdDb = config.getFloat("recording.silenceThresholdDb", c.silenceThresholdDb);
  c.silenceDurationMs = config.getLong("recording.silenceDurationMs", c.silenceDurationMs);
  c.noiseFloorDb = config.getFloat("recording.noiseFloorDb", c.noiseFloorDb);
  c.clippingThreshold = config.getFloat("recording.clippingThreshold", c.clippingThreshold);
  c.minRecordingDurationMs = config.getLong("recording.minDurationMs", c.minRecordingDurationMs);
  c.audioBufferDurationMs = config.getLong("recording.bufferDurationMs", c.audioBufferDurationMs);

  // Only mono 16-bit PCM is produced.
  c.bitsPerSample = 16;
  c.channels = 1;

  const RecordingConstraints defaults;
  if (c.sampleRate <= 0)
  {
    AppLogger::getInstance().warn("[Config] recording.sampleRate must be positive, using " + std::to_string(defaults.sampleRate));
    c.sampleRate = defaults.sampleRate;
  }
  if (c.audioBufferDurationMs <= 0 || c.framesPerBuffer() <= 0)
  {
    AppLogger::getInstance().warn("[Config] recording.bufferDurationMs must be positive, using " + std::to_string(defaults.audioBufferDurationMs));
    c.audioBufferDurationMs = defaults.audioBufferDurationMs;
  }
  if (c.maxFileSizeBytes <= 0)
  {
    AppLogger::getInstance().warn("[Config] recording.maxFileSizeBytes must be positive, using default");
    c.maxFileSizeBytes = defaults.maxFileSizeBytes;
  }

  AppLogger::getInstance().info("[Config] Recording policy: " + std::to_string(c.sampleRate) + " Hz mono, max " +
                                std::to_string(c.maxFileSizeBytes) + " bytes (" +
                                std::to_string(c.maxRecordingDurationMs() / 1000) + " s)");
  return c;
}

QualityPreset QualityPreset::low()
{
  QualityPreset p;
  p.quality = AudioQuality::Low;
  p.trimSilence = true;
  p.noiseGate = false;
  p.normalize = false;
  p.highPassFilter = false;
  return p;
}

QualityPreset QualityPreset::medium()
{
  QualityPreset p;
  p.quality = AudioQuality::Medium;
  p.trimSilence = true;
  p.noiseGate = false;
  p.normalize = true;
  p.highPassFilter = false;
  return p;
}

QualityPreset QualityPreset::high()
{
  QualityPreset p;
  p.quality = AudioQuality::High;
  p.trimSilence = true;
  p.noiseGate = true;
  p.normalize = true;
  p.highPassFilter = true;
  return p;
}

QualityPreset QualityPreset::forQuality(AudioQuality quality)
{
  switch (quality)
  {
  case AudioQuality::Low:
    return low();
  case AudioQuality::High:
    return high();
  case AudioQuality::Medium:
    break;
  }
  return medium();
}

QualityPreset QualityPreset::fromName(const std::string &name)
{
  if (name == "low")
    return low();
  if (name == "high")
    return high();
  if (name != "medium")
  {
    AppLogger::getInstance().warn("[Config] Unknown quality preset '" + name + "', using medium");
  }
  return medium();
}

const char *qualityName(AudioQuality quality)
{
  switch (quality)
  {
  case AudioQuality::Low:
    return "low";
  case AudioQuality::Medium:
    return "medium";
  case AudioQuality::High:
    return "high";
  }
  return "medium";
}
