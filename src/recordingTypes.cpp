#include "recordingTypes.hpp"

namespace
{

struct StateNameVisitor
{
  const char *operator()(const recording_state::Idle &) const { return "Idle"; }
  const char *operator()(const recording_state::Recording &) const { return "Recording"; }
  const char *operator()(const recording_state::Processing &) const { return "Processing"; }
  const char *operator()(const recording_state::Success &) const { return "Success"; }
  const char *operator()(const recording_state::Error &) const { return "Error"; }
};

} // namespace

const char *errorKindName(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::PermissionDenied:
    return "PermissionDenied";
  case ErrorKind::DeviceUnavailable:
    return "DeviceUnavailable";
  case ErrorKind::ConfigurationError:
    return "ConfigurationError";
  case ErrorKind::IOError:
    return "IOError";
  case ErrorKind::Timeout:
    return "Timeout";
  case ErrorKind::TranscriptionFailed:
    return "TranscriptionFailed";
  case ErrorKind::Unknown:
    break;
  }
  return "Unknown";
}

std::string RecordingError::describe() const
{
  std::string text = std::string(errorKindName(kind)) + ": " + cause;
  if (!retryable)
  {
    text += " (not retryable)";
  }
  return text;
}

const char *stateName(const RecordingState &state)
{
  return std::visit(StateNameVisitor{}, state);
}
