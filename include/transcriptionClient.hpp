#pragma once

#include "httplib.h"
#include <cstdint>
#include <string>

#include "transcription.hpp"

class ConfigLoader;

struct HttpTranscriptionConfig
{
  std::string host = "127.0.0.1";
  int port = 8000;
  std::string path = "/v1/audio/transcriptions";
  std::string apiKey;
  int maxAttempts = 3;
  int64_t initialBackoffMs = 1000; // doubled after each failed attempt
  int connectTimeoutSeconds = 5;
  int readTimeoutSeconds = 60;
  int64_t maxFileSizeBytes = 25LL * 1024 * 1024;

  // Reads the transcription.* keys.
  static HttpTranscriptionConfig fromConfig(const ConfigLoader &config);
};

// Uploads recordings to an OpenAI-compatible /audio/transcriptions endpoint.
class HttpTranscriptionClient : public TranscriptionClient
{
public:
  explicit HttpTranscriptionClient(HttpTranscriptionConfig config);

  TranscriptionOutcome transcribe(const AudioFile &audioFile, const TranscriptionSettings &settings) override;

  // Health probe used at startup; any HTTP answer counts as reachable.
  bool isReachable();

private:
  enum class AttemptStatus
  {
    Ok,
    Retry,
    Fatal
  };

  AttemptStatus postOnce(const httplib::MultipartFormDataItems &items, TranscriptionOutcome &outcome);

  static std::string errorMessageFrom(const std::string &body);
  static TranscriptionOutcome parseResponse(const std::string &body);

  HttpTranscriptionConfig config_;
  httplib::Client cli_;
};
