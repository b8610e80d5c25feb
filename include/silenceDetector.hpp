#pragma once

#include <cstdint>

enum class SilenceState
{
  NotSilent,
  EnteredSilence,
  InSilence,
  ExitedSilence
};

const char *silenceStateName(SilenceState state);

// Hysteresis over per-buffer silence flags. Silence is entered only after
// silenceDurationMs worth of consecutive silent buffers and left after
// EXIT_BUFFERS consecutive non-silent ones.
class SilenceDetector
{
public:
  static constexpr int EXIT_BUFFERS = 2;

  SilenceDetector(int64_t silenceDurationMs, int64_t bufferDurationMs);

  SilenceState processSample(bool isSilent);

  int64_t currentSilenceDuration() const;
  bool shouldTrimSilence() const;
  bool isSilent() const { return inSilence_; }
  int buffersForSilenceThreshold() const { return buffersForSilenceThreshold_; }

  void reset();

private:
  int64_t silenceDurationMs_;
  int64_t bufferDurationMs_;
  int buffersForSilenceThreshold_;

  int consecutiveSilentBuffers_ = 0;
  int consecutiveNonSilentBuffers_ = 0;
  bool inSilence_ = false;
};
