#pragma once

#include <cstdint>
#include <string>

class ConfigLoader;

// Process-wide recording policy. Built once at startup, then passed around by
// const reference.
struct RecordingConstraints
{
  int64_t maxFileSizeBytes = 25LL * 1024 * 1024; // transcription API upload limit
  int sampleRate = 16000;
  int bitsPerSample = 16;
  int channels = 1;

  float silenceThresholdDb = -40.0f;
  int64_t silenceDurationMs = 2000;
  float noiseFloorDb = -50.0f;
  float clippingThreshold = 0.99f;

  int64_t minRecordingDurationMs = 100;
  int64_t audioBufferDurationMs = 100;

  // Capture is force-stopped once accumulated sample bytes reach this share of
  // maxFileSizeBytes, leaving room for the container header.
  double sizeLimitRatio = 0.95;

  int64_t bytesPerSecond() const
  {
    return static_cast<int64_t>(sampleRate) * channels * bitsPerSample / 8;
  }

  int64_t maxRecordingDurationMs() const
  {
    return (maxFileSizeBytes * 1000) / bytesPerSecond();
  }

  int framesPerBuffer() const
  {
    return static_cast<int>(sampleRate * audioBufferDurationMs / 1000);
  }

  int64_t sizeLimitBytes() const
  {
    return static_cast<int64_t>(maxFileSizeBytes * sizeLimitRatio);
  }

  static RecordingConstraints fromConfig(const ConfigLoader &config);
};

enum class AudioQuality
{
  Low,
  Medium,
  High
};

// Named bundle of DSP stage toggles applied once capture ends.
struct QualityPreset
{
  AudioQuality quality = AudioQuality::Medium;
  bool trimSilence = true;
  bool noiseGate = false;
  bool normalize = true;
  bool highPassFilter = false;
  float highPassCutoffHz = 80.0f;

  static QualityPreset low();
  static QualityPreset medium();
  static QualityPreset high();

  static QualityPreset forQuality(AudioQuality quality);

  // "low", "medium" or "high"; anything else yields medium.
  static QualityPreset fromName(const std::string &name);
};

const char *qualityName(AudioQuality quality);
