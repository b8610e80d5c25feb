#pragma once

#include <optional>
#include <string>

#include "recordingTypes.hpp"

class ConfigLoader;

// Per-session transcription parameters, captured once when processing starts.
struct TranscriptionSettings
{
  std::string language; // empty lets the service detect it
  std::string model = "whisper-1";
  std::string customPrompt;
  float temperature = 0.0f;
};

struct TranscriptionResult
{
  std::string text;
  std::optional<std::string> language;
  std::optional<double> durationSec;
};

struct TranscriptionOutcome
{
  std::optional<TranscriptionResult> result;
  std::string error;

  bool ok() const { return result.has_value(); }

  static TranscriptionOutcome success(TranscriptionResult result);
  static TranscriptionOutcome failure(std::string error);
};

// Turns a finished recording into text. Called on the IO scheduler; may block.
class TranscriptionClient
{
public:
  virtual ~TranscriptionClient() = default;

  virtual TranscriptionOutcome transcribe(const AudioFile &audioFile, const TranscriptionSettings &settings) = 0;
};

class SettingsProvider
{
public:
  virtual ~SettingsProvider() = default;

  virtual TranscriptionSettings snapshot() = 0;
};

// Reads transcription.language, transcription.model, transcription.prompt and
// transcription.temperature.
class ConfigSettingsProvider : public SettingsProvider
{
public:
  explicit ConfigSettingsProvider(const ConfigLoader &config);

  TranscriptionSettings snapshot() override;

private:
  const ConfigLoader &config_;
};
