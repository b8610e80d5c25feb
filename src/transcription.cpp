#include "transcription.hpp"
#include "configLoader.hpp"

TranscriptionOutcome TranscriptionOutcome::success(TranscriptionResult result)
{
  TranscriptionOutcome outcome;
  outcome.result = std::move(result);
  return outcome;
}

TranscriptionOutcome TranscriptionOutcome::failure(std::string error)
{
  TranscriptionOutcome outcome;
  outcome.error = std::move(error);
  return outcome;
}

ConfigSettingsProvider::ConfigSettingsProvider(const ConfigLoader &config)
    : config_(config)
{
}

TranscriptionSettings ConfigSettingsProvider::snapshot()
{
  TranscriptionSettings settings;
  settings.language = config_.getString("transcription.language", "");
  settings.model = config_.getString("transcription.model", settings.model);
  settings.customPrompt = config_.getString("transcription.prompt", "");
  settings.temperature = config_.getFloat("transcription.temperature", settings.temperature);
  return settings;
}
