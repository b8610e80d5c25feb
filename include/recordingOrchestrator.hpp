#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "audioMetrics.hpp"
#include "captureEngine.hpp"
#include "qualityMonitor.hpp"
#include "recordingConstraints.hpp"
#include "recordingTypes.hpp"
#include "taskScheduler.hpp"
#include "transcription.hpp"

class PermissionGate
{
public:
  virtual ~PermissionGate() = default;

  virtual bool isRecordingPermitted() = 0;
};

// Callbacks run on the orchestration thread. Exceptions are logged and dropped.
class RecordingStateListener
{
public:
  virtual ~RecordingStateListener() = default;

  virtual void onStateChanged(const RecordingState &state) = 0;
  virtual void onRecordingComplete(const std::optional<AudioFile> &) {}
  virtual void onRecordingError(const std::string &) {}
  // Periodic while recording, every OrchestratorConfig::progressIntervalMs.
  virtual void onRecordingProgress(const RecordingStatistics &) {}
};

struct OrchestratorConfig
{
  std::string outputDirectory = "recordings";
  int64_t successDisplayMs = 1500;
  int64_t progressIntervalMs = 100; // 0 disables progress updates

  // Maps a session id to the WAV path. Defaults to
  // <outputDirectory>/recording_<sessionId>.wav when empty.
  std::function<std::string(const std::string &sessionId)> outputPathProvider;
};

// Drives Idle -> Recording -> Processing -> Success/Error for one foreground
// session at a time. Public operations enqueue onto the orchestration
// scheduler and return immediately; every state change happens there.
class RecordingOrchestrator
{
public:
  RecordingOrchestrator(const RecordingConstraints &constraints,
                        CaptureEngine &engine,
                        TranscriptionClient &transcriptionClient,
                        SettingsProvider &settingsProvider,
                        PermissionGate &permissionGate,
                        OrchestratorConfig config = OrchestratorConfig());

  ~RecordingOrchestrator();

  RecordingOrchestrator(const RecordingOrchestrator &) = delete;
  RecordingOrchestrator &operator=(const RecordingOrchestrator &) = delete;

  // Listeners are not owned and must outlive their registration.
  void addListener(RecordingStateListener *listener);
  void removeListener(RecordingStateListener *listener);

  void startRecording();
  void stopRecording();
  void cancelRecording();
  void retryFromError();

  RecordingState currentState() const;
  std::string currentSessionId() const;
  AudioMetrics currentMetrics() const;
  RecordingStatistics statistics() const;
  int64_t remainingRecordingTimeMs() const;
  QualityReport qualityReport() const;

private:
  void doStart();
  void doStop();
  void doCancel();
  void doRetry();

  void handleTimeout(const std::string &sessionId);
  void handleSizeLimit(const std::string &sessionId);
  void handleCaptureError(const std::string &sessionId, const CaptureError &error);
  void handleCaptureFinished(const std::string &sessionId);
  void handleTranscription(const std::string &sessionId, const AudioFile &audioFile, const TranscriptionOutcome &outcome);
  void handleSuccessTimeout(const std::string &sessionId);
  void handleProgressTick(const std::string &sessionId);
  void scheduleProgressTick(const std::string &sessionId);

  void fail(const RecordingError &error);
  void transitionTo(const RecordingState &next);
  void cancelTimers();
  bool isCurrentSession(const std::string &sessionId) const;

  std::string outputPathFor(const std::string &sessionId) const;
  static std::string generateSessionId();
  static void discardFile(const std::string &path);

  void notifyStateChanged(const RecordingState &state);
  void notifyComplete(const std::optional<AudioFile> &audioFile);
  void notifyError(const std::string &message);
  void notifyProgress(const RecordingStatistics &statistics);
  void forEachListener(const std::function<void(RecordingStateListener &)> &fn);

  const RecordingConstraints &constraints_;
  CaptureEngine &engine_;
  TranscriptionClient &transcriptionClient_;
  SettingsProvider &settingsProvider_;
  PermissionGate &permissionGate_;
  OrchestratorConfig config_;

  mutable std::mutex mutex_;
  RecordingState state_;
  std::string sessionId_;
  TaskId timeoutTask_ = 0;
  TaskId successTask_ = 0;
  TaskId progressTask_ = 0;

  std::mutex listenersMutex_;
  std::vector<RecordingStateListener *> listeners_;

  // declared last so both workers are joined before anything above goes away
  TaskScheduler ioScheduler_;
  TaskScheduler scheduler_;
};
