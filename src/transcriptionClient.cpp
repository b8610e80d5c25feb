#include "transcriptionClient.hpp"
#include "AppLogger.hpp"
#include "configLoader.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

using json = nlohmann::json;

HttpTranscriptionConfig HttpTranscriptionConfig::fromConfig(const ConfigLoader &config)
{
  HttpTranscriptionConfig c;
  c.host = config.getString("transcription.host", c.host);
  c.port = config.getInt("transcription.port", c.port);
  c.path = config.getString("transcription.path", c.path);
  c.apiKey = config.getString("transcription.apiKey", "");
  c.maxAttempts = config.getInt("transcription.maxAttempts", c.maxAttempts);
  c.initialBackoffMs = config.getLong("transcription.initialBackoffMs", c.initialBackoffMs);
  c.connectTimeoutSeconds = config.getInt("transcription.connectTimeoutSeconds", c.connectTimeoutSeconds);
  c.readTimeoutSeconds = config.getInt("transcription.readTimeoutSeconds", c.readTimeoutSeconds);
  c.maxFileSizeBytes = config.getLong("recording.maxFileSizeBytes", c.maxFileSizeBytes);
  return c;
}

HttpTranscriptionClient::HttpTranscriptionClient(HttpTranscriptionConfig config)
    : config_(std::move(config)), cli_(config_.host, config_.port)
{
  if (!config_.apiKey.empty())
  {
    cli_.set_bearer_token_auth(config_.apiKey);
  }
  cli_.set_connection_timeout(std::chrono::seconds(config_.connectTimeoutSeconds));
  cli_.set_read_timeout(std::chrono::seconds(config_.readTimeoutSeconds));
  cli_.set_write_timeout(std::chrono::seconds(config_.readTimeoutSeconds));
}

bool HttpTranscriptionClient::isReachable()
{
  auto res = cli_.Get("/");
  if (res)
  {
    AppLogger::getInstance().info("[TranscriptionClient] Service reachable, status " + std::to_string(res->status));
    return true;
  }
  AppLogger::getInstance().error("[TranscriptionClient] Service not reachable: " + httplib::to_string(res.error()));
  return false;
}

TranscriptionOutcome HttpTranscriptionClient::transcribe(const AudioFile &audioFile, const TranscriptionSettings &settings)
{
  if (config_.apiKey.empty())
  {
    return TranscriptionOutcome::failure("API key not configured");
  }

  if (settings.temperature < 0.0f || settings.temperature > 1.0f)
  {
    return TranscriptionOutcome::failure("Temperature must be between 0.0 and 1.0");
  }

  std::error_code ec;
  const auto fileSize = std::filesystem::file_size(audioFile.path, ec);
  if (ec)
  {
    return TranscriptionOutcome::failure("Cannot read recording " + audioFile.path + ": " + ec.message());
  }
  if (static_cast<int64_t>(fileSize) > config_.maxFileSizeBytes)
  {
    return TranscriptionOutcome::failure("Recording exceeds the " + std::to_string(config_.maxFileSizeBytes) + " byte upload limit");
  }

  std::ifstream file(audioFile.path, std::ios::binary);
  if (!file.is_open())
  {
    return TranscriptionOutcome::failure("Cannot open recording " + audioFile.path);
  }
  std::string wav_content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  const std::string filename = std::filesystem::path(audioFile.path).filename().string();
  httplib::MultipartFormDataItems items = {
      {"file", wav_content, filename, "audio/wav"},
      {"model", settings.model, "", ""},
      {"response_format", "json", "", ""}};
  if (!settings.language.empty())
  {
    items.push_back({"language", settings.language, "", ""});
  }
  if (!settings.customPrompt.empty())
  {
    items.push_back({"prompt", settings.customPrompt, "", ""});
  }
  std::ostringstream temperature;
  temperature << settings.temperature;
  items.push_back({"temperature", temperature.str(), "", ""});

  AppLogger::getInstance().info("[TranscriptionClient] Uploading " + filename + " (" + std::to_string(wav_content.size()) +
                                " bytes, model " + settings.model + ")");

  TranscriptionOutcome outcome = TranscriptionOutcome::failure("no attempt made");
  int64_t backoffMs = config_.initialBackoffMs;
  for (int attempt = 1; attempt <= config_.maxAttempts; ++attempt)
  {
    const AttemptStatus status = postOnce(items, outcome);
    if (status != AttemptStatus::Retry)
    {
      return outcome;
    }

    if (attempt < config_.maxAttempts)
    {
      AppLogger::getInstance().warn("[TranscriptionClient] Attempt " + std::to_string(attempt) + " failed (" + outcome.error +
                                    "). Retrying in " + std::to_string(backoffMs) + " ms...");
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
      backoffMs *= 2;
    }
  }

  AppLogger::getInstance().error("[TranscriptionClient] Giving up after " + std::to_string(config_.maxAttempts) + " attempts");
  return outcome;
}

HttpTranscriptionClient::AttemptStatus HttpTranscriptionClient::postOnce(const httplib::MultipartFormDataItems &items,
                                                                         TranscriptionOutcome &outcome)
{
  auto res = cli_.Post(config_.path.c_str(), items);

  if (!res)
  {
    outcome = TranscriptionOutcome::failure("Request failed: " + httplib::to_string(res.error()));
    return AttemptStatus::Retry;
  }

  if (res->status == 200)
  {
    outcome = parseResponse(res->body);
    return AttemptStatus::Ok;
  }

  const std::string detail = errorMessageFrom(res->body);
  if (res->status == 401)
  {
    outcome = TranscriptionOutcome::failure("Authentication failed: " + detail);
    return AttemptStatus::Fatal;
  }
  if (res->status == 429)
  {
    outcome = TranscriptionOutcome::failure("Rate limit exceeded: " + detail);
    return AttemptStatus::Retry;
  }
  if (res->status >= 500)
  {
    outcome = TranscriptionOutcome::failure("Server error " + std::to_string(res->status) + ": " + detail);
    return AttemptStatus::Retry;
  }

  outcome = TranscriptionOutcome::failure("Request rejected with status " + std::to_string(res->status) + ": " + detail);
  return AttemptStatus::Fatal;
}

std::string HttpTranscriptionClient::errorMessageFrom(const std::string &body)
{
  const json parsed = json::parse(body, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error"))
  {
    const json &error = parsed["error"];
    if (error.is_object() && error.contains("message") && error["message"].is_string())
    {
      return error["message"].get<std::string>();
    }
    if (error.is_string())
    {
      return error.get<std::string>();
    }
  }
  return body;
}

TranscriptionOutcome HttpTranscriptionClient::parseResponse(const std::string &body)
{
  const json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object())
  {
    return TranscriptionOutcome::failure("Malformed transcription response");
  }
  if (!parsed.contains("text") || !parsed["text"].is_string())
  {
    return TranscriptionOutcome::failure("Transcription response has no text");
  }

  TranscriptionResult result;
  result.text = parsed["text"].get<std::string>();
  if (parsed.contains("language") && parsed["language"].is_string())
  {
    result.language = parsed["language"].get<std::string>();
  }
  if (parsed.contains("duration") && parsed["duration"].is_number())
  {
    result.durationSec = parsed["duration"].get<double>();
  }
  return TranscriptionOutcome::success(std::move(result));
}
