#pragma once

#include <cstdint>
#include <string>
#include <variant>

enum class ErrorKind
{
  PermissionDenied,
  DeviceUnavailable,
  ConfigurationError,
  IOError,
  Timeout,
  TranscriptionFailed,
  Unknown
};

const char *errorKindName(ErrorKind kind);

struct RecordingError
{
  ErrorKind kind = ErrorKind::Unknown;
  std::string cause;
  bool retryable = true;

  std::string describe() const;
};

// Errors raised by the capture side use the same shape.
using CaptureError = RecordingError;

// The sole persisted output of a capture session.
struct AudioFile
{
  std::string path;
  int64_t durationMs = 0;
  int64_t sizeBytes = 0;
  std::string sessionId;
};

namespace recording_state
{

struct Idle
{
};

struct Recording
{
  int64_t startTimeMs = 0; // epoch milliseconds
};

struct Processing
{
  float progress = 0.0f;
};

struct Success
{
  AudioFile audioFile;
  std::string transcription;
};

struct Error
{
  RecordingError error;
};

} // namespace recording_state

using RecordingState = std::variant<recording_state::Idle,
                                    recording_state::Recording,
                                    recording_state::Processing,
                                    recording_state::Success,
                                    recording_state::Error>;

const char *stateName(const RecordingState &state);

template <typename T>
bool isState(const RecordingState &state)
{
  return std::holds_alternative<T>(state);
}
