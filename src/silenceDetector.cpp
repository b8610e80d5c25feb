#include "silenceDetector.hpp"

#include <algorithm>

const char *silenceStateName(SilenceState state)
{
  switch (state)
  {
  case SilenceState::NotSilent:
    return "NotSilent";
  case SilenceState::EnteredSilence:
    return "EnteredSilence";
  case SilenceState::InSilence:
    return "InSilence";
  case SilenceState::ExitedSilence:
    return "ExitedSilence";
  }
  return "NotSilent";
}

SilenceDetector::SilenceDetector(int64_t silenceDurationMs, int64_t bufferDurationMs)
    : silenceDurationMs_(silenceDurationMs),
      bufferDurationMs_(std::max<int64_t>(1, bufferDurationMs)),
      buffersForSilenceThreshold_(static_cast<int>(std::max<int64_t>(1, silenceDurationMs / std::max<int64_t>(1, bufferDurationMs))))
{
}

SilenceState SilenceDetector::processSample(bool isSilent)
{
  if (isSilent)
  {
    ++consecutiveSilentBuffers_;
    consecutiveNonSilentBuffers_ = 0;

    if (!inSilence_ && consecutiveSilentBuffers_ >= buffersForSilenceThreshold_)
    {
      inSilence_ = true;
      return SilenceState::EnteredSilence;
    }
  }
  else
  {
    ++consecutiveNonSilentBuffers_;

    if (inSilence_ && consecutiveNonSilentBuffers_ >= EXIT_BUFFERS)
    {
      inSilence_ = false;
      consecutiveSilentBuffers_ = 0;
      return SilenceState::ExitedSilence;
    }
    if (!inSilence_)
    {
      consecutiveSilentBuffers_ = 0;
    }
  }

  return inSilence_ ? SilenceState::InSilence : SilenceState::NotSilent;
}

int64_t SilenceDetector::currentSilenceDuration() const
{
  if (!inSilence_)
  {
    return 0;
  }
  return static_cast<int64_t>(consecutiveSilentBuffers_) * bufferDurationMs_;
}

bool SilenceDetector::shouldTrimSilence() const
{
  return inSilence_ && currentSilenceDuration() > silenceDurationMs_ * 2;
}

void SilenceDetector::reset()
{
  consecutiveSilentBuffers_ = 0;
  consecutiveNonSilentBuffers_ = 0;
  inSilence_ = false;
}
