#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "audioInput.hpp"
#include "audioProcessor.hpp"
#include "deviceArbitrator.hpp"
#include "qualityMonitor.hpp"
#include "recordingConstraints.hpp"
#include "recordingTypes.hpp"

enum class CaptureState
{
  Idle,
  Active,
  Paused,
  Stopping
};

const char *captureStateName(CaptureState state);

// Owns the audio input and the capture thread for one session at a time.
//
// Samples are buffered in memory for the whole session and written out as a
// WAV file once capture ends, after the AudioProcessor pass. The buffer never
// grows past RecordingConstraints::sizeLimitBytes().
class CaptureEngine : private DeviceListener
{
public:
  // Invoked on the capture thread. Implementations must only enqueue work.
  struct Callbacks
  {
    std::function<void(const std::string &sessionId, const CaptureError &error)> onError;
    std::function<void(const std::string &sessionId)> onSizeLimitReached;
    std::function<void(const std::string &sessionId)> onFinished;
  };

  CaptureEngine(const RecordingConstraints &constraints,
                const QualityPreset &preset,
                AudioInput &input,
                DeviceArbitrator &arbitrator);

  ~CaptureEngine() override;

  CaptureEngine(const CaptureEngine &) = delete;
  CaptureEngine &operator=(const CaptureEngine &) = delete;

  // Must not be called while a capture thread is running.
  void setCallbacks(Callbacks callbacks);

  std::optional<CaptureError> start(const std::string &outputPath, const std::string &sessionId);

  // Asks the capture thread to finish, waits for it and hands over the file.
  // Returns nullopt when the session failed or produced no output.
  std::optional<AudioFile> stop();

  // Non-blocking; onFinished() fires once the file is written.
  void requestStop();

  // Stops without output and removes any partially written file.
  void cancel();

  bool isCapturing() const;
  CaptureState state() const;
  int64_t capturedSamples() const;

  const QualityMonitor &monitor() const { return monitor_; }

private:
  void onDeviceLost() override;
  void onDeviceSuspended() override;
  void onDeviceRestored() override;

  void captureLoop();
  void finishCapture(bool sizeLimitReached);
  void reportError(const CaptureError &error);
  void joinCaptureThread();

  const RecordingConstraints &constraints_;
  AudioProcessor processor_;
  AudioInput &input_;
  DeviceArbitrator &arbitrator_;
  QualityMonitor monitor_;
  Callbacks callbacks_;

  std::thread captureThread_;
  std::atomic<CaptureState> state_{CaptureState::Idle};
  std::atomic<bool> stopRequested_{false};
  std::atomic<bool> cancelRequested_{false};
  std::atomic<bool> paused_{false};
  std::atomic<bool> deviceLost_{false};
  std::atomic<int64_t> capturedSamples_{0};

  // capture thread only while running
  std::vector<int16_t> samples_;

  mutable std::mutex mutex_;
  std::string outputPath_;
  std::string sessionId_;
  std::optional<AudioFile> result_;
};
