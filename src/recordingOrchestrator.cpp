#include "recordingOrchestrator.hpp"
#include "AppLogger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace
{

constexpr float PROGRESS_TRANSCRIBING = 0.5f;

int64_t nowEpochMs()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

RecordingOrchestrator::RecordingOrchestrator(const RecordingConstraints &constraints,
                                             CaptureEngine &engine,
                                             TranscriptionClient &transcriptionClient,
                                             SettingsProvider &settingsProvider,
                                             PermissionGate &permissionGate,
                                             OrchestratorConfig config)
    : constraints_(constraints),
      engine_(engine),
      transcriptionClient_(transcriptionClient),
      settingsProvider_(settingsProvider),
      permissionGate_(permissionGate),
      config_(std::move(config)),
      state_(recording_state::Idle{}),
      ioScheduler_("TranscriptionIO"),
      scheduler_("RecordingOrchestrator")
{
  CaptureEngine::Callbacks callbacks;
  callbacks.onError = [this](const std::string &sessionId, const CaptureError &error)
  {
    scheduler_.post([this, sessionId, error]()
                    { handleCaptureError(sessionId, error); });
  };
  callbacks.onSizeLimitReached = [this](const std::string &sessionId)
  {
    scheduler_.post([this, sessionId]()
                    { handleSizeLimit(sessionId); });
  };
  callbacks.onFinished = [this](const std::string &sessionId)
  {
    scheduler_.post([this, sessionId]()
                    { handleCaptureFinished(sessionId); });
  };
  engine_.setCallbacks(std::move(callbacks));
}

RecordingOrchestrator::~RecordingOrchestrator()
{
  scheduler_.stop();
  ioScheduler_.stop();

  if (engine_.isCapturing())
  {
    AppLogger::getInstance().warn("[RecordingOrchestrator] Shutting down with an active capture, cancelling it");
  }
  engine_.cancel();
  engine_.setCallbacks(CaptureEngine::Callbacks());
}

void RecordingOrchestrator::addListener(RecordingStateListener *listener)
{
  if (listener == nullptr)
    return;
  std::lock_guard<std::mutex> lock(listenersMutex_);
  if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
  {
    listeners_.push_back(listener);
  }
}

void RecordingOrchestrator::removeListener(RecordingStateListener *listener)
{
  std::lock_guard<std::mutex> lock(listenersMutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void RecordingOrchestrator::startRecording()
{
  scheduler_.post([this]()
                  { doStart(); });
}

void RecordingOrchestrator::stopRecording()
{
  scheduler_.post([this]()
                  { doStop(); });
}

void RecordingOrchestrator::cancelRecording()
{
  scheduler_.post([this]()
                  { doCancel(); });
}

void RecordingOrchestrator::retryFromError()
{
  scheduler_.post([this]()
                  { doRetry(); });
}

RecordingState RecordingOrchestrator::currentState() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string RecordingOrchestrator::currentSessionId() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return sessionId_;
}

AudioMetrics RecordingOrchestrator::currentMetrics() const
{
  return engine_.monitor().currentMetrics();
}

RecordingStatistics RecordingOrchestrator::statistics() const
{
  return engine_.monitor().statistics();
}

int64_t RecordingOrchestrator::remainingRecordingTimeMs() const
{
  return engine_.monitor().remainingRecordingTimeMs();
}

QualityReport RecordingOrchestrator::qualityReport() const
{
  return engine_.monitor().qualityReport();
}

void RecordingOrchestrator::doStart()
{
  const RecordingState state = currentState();
  if (!isState<recording_state::Idle>(state))
  {
    AppLogger::getInstance().warn("[RecordingOrchestrator] Start ignored in state " + std::string(stateName(state)));
    return;
  }

  // fail fast, before the device is touched
  if (!permissionGate_.isRecordingPermitted())
  {
    fail(RecordingError{ErrorKind::PermissionDenied, "Microphone permission not granted"});
    return;
  }

  const std::string sessionId = generateSessionId();
  const std::string outputPath = outputPathFor(sessionId);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionId_ = sessionId;
  }

  if (std::optional<CaptureError> error = engine_.start(outputPath, sessionId))
  {
    fail(*error);
    return;
  }

  transitionTo(recording_state::Recording{nowEpochMs()});

  const TaskId timeout = scheduler_.postDelayed(constraints_.maxRecordingDurationMs(), [this, sessionId]()
                                                { handleTimeout(sessionId); });
  {
    std::lock_guard<std::mutex> lock(mutex_);
    timeoutTask_ = timeout;
  }
  scheduleProgressTick(sessionId);
}

void RecordingOrchestrator::doStop()
{
  const RecordingState state = currentState();
  if (!isState<recording_state::Recording>(state))
  {
    AppLogger::getInstance().warn("[RecordingOrchestrator] Stop ignored in state " + std::string(stateName(state)));
    return;
  }

  cancelTimers();
  transitionTo(recording_state::Processing{0.0f});
  engine_.requestStop();
}

void RecordingOrchestrator::doCancel()
{
  cancelTimers();
  engine_.cancel();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionId_.clear();
  }

  if (!isState<recording_state::Idle>(currentState()))
  {
    transitionTo(recording_state::Idle{});
  }
}

void RecordingOrchestrator::doRetry()
{
  const RecordingState state = currentState();
  if (const auto *error = std::get_if<recording_state::Error>(&state))
  {
    if (!error->error.retryable)
    {
      AppLogger::getInstance().warn("[RecordingOrchestrator] Error is not retryable: " + error->error.describe());
      return;
    }
    transitionTo(recording_state::Idle{});
    return;
  }

  if (isState<recording_state::Success>(state))
  {
    cancelTimers();
    transitionTo(recording_state::Idle{});
    return;
  }

  AppLogger::getInstance().warn("[RecordingOrchestrator] Retry ignored in state " + std::string(stateName(state)));
}

void RecordingOrchestrator::handleTimeout(const std::string &sessionId)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    timeoutTask_ = 0;
  }
  if (!isCurrentSession(sessionId) || !isState<recording_state::Recording>(currentState()))
  {
    return;
  }

  AppLogger::getInstance().warn("[RecordingOrchestrator] Maximum recording duration of " +
                                std::to_string(constraints_.maxRecordingDurationMs()) + " ms reached");
  fail(RecordingError{ErrorKind::Timeout, "Maximum recording duration reached", false});
}

void RecordingOrchestrator::handleSizeLimit(const std::string &sessionId)
{
  if (!isCurrentSession(sessionId) || !isState<recording_state::Recording>(currentState()))
  {
    return;
  }

  cancelTimers();
  notifyError("Maximum recording size reached");
  transitionTo(recording_state::Processing{0.0f});
}

void RecordingOrchestrator::handleCaptureError(const std::string &sessionId, const CaptureError &error)
{
  if (!isCurrentSession(sessionId))
  {
    AppLogger::getInstance().debug("[RecordingOrchestrator] Ignoring capture error from stale session " + sessionId);
    return;
  }

  const RecordingState state = currentState();
  if (!isState<recording_state::Recording>(state) && !isState<recording_state::Processing>(state))
  {
    return;
  }
  fail(error);
}

void RecordingOrchestrator::handleCaptureFinished(const std::string &sessionId)
{
  // a cancelled or superseded session; its file was already removed
  if (!isCurrentSession(sessionId))
  {
    AppLogger::getInstance().debug("[RecordingOrchestrator] Ignoring capture completion from stale session " + sessionId);
    return;
  }

  const RecordingState state = currentState();
  if (isState<recording_state::Recording>(state))
  {
    cancelTimers();
    transitionTo(recording_state::Processing{0.0f});
  }
  else if (!isState<recording_state::Processing>(state))
  {
    return;
  }

  std::optional<AudioFile> audioFile = engine_.stop();
  if (!audioFile)
  {
    fail(RecordingError{ErrorKind::IOError, "Capture produced no audio file"});
    return;
  }

  if (audioFile->durationMs < constraints_.minRecordingDurationMs)
  {
    discardFile(audioFile->path);
    fail(RecordingError{ErrorKind::IOError, "Recording too short (" + std::to_string(audioFile->durationMs) + " ms)"});
    return;
  }

  notifyComplete(audioFile);

  const TranscriptionSettings settings = settingsProvider_.snapshot();
  transitionTo(recording_state::Processing{PROGRESS_TRANSCRIBING});

  const AudioFile file = *audioFile;
  ioScheduler_.post([this, sessionId, file, settings]()
                    {
    TranscriptionOutcome outcome;
    try
    {
      outcome = transcriptionClient_.transcribe(file, settings);
    }
    catch (const std::exception &e)
    {
      outcome = TranscriptionOutcome::failure(e.what());
    }
    scheduler_.post([this, sessionId, file, outcome]()
                    { handleTranscription(sessionId, file, outcome); }); });
}

void RecordingOrchestrator::handleTranscription(const std::string &sessionId,
                                                const AudioFile &audioFile,
                                                const TranscriptionOutcome &outcome)
{
  if (!isCurrentSession(sessionId) || !isState<recording_state::Processing>(currentState()))
  {
    AppLogger::getInstance().info("[RecordingOrchestrator] Discarding result of stale session " + sessionId);
    discardFile(audioFile.path);
    return;
  }

  if (!outcome.ok())
  {
    fail(RecordingError{ErrorKind::TranscriptionFailed, outcome.error});
    return;
  }

  AppLogger::getInstance().info("[RecordingOrchestrator] Transcription received (" +
                                std::to_string(outcome.result->text.size()) + " chars)");
  transitionTo(recording_state::Success{audioFile, outcome.result->text});

  const TaskId task = scheduler_.postDelayed(config_.successDisplayMs, [this, sessionId]()
                                             { handleSuccessTimeout(sessionId); });
  std::lock_guard<std::mutex> lock(mutex_);
  successTask_ = task;
}

void RecordingOrchestrator::handleSuccessTimeout(const std::string &sessionId)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    successTask_ = 0;
  }
  if (isCurrentSession(sessionId) && isState<recording_state::Success>(currentState()))
  {
    transitionTo(recording_state::Idle{});
  }
}

void RecordingOrchestrator::handleProgressTick(const std::string &sessionId)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    progressTask_ = 0;
  }
  if (!isCurrentSession(sessionId) || !isState<recording_state::Recording>(currentState()))
  {
    return;
  }

  notifyProgress(engine_.monitor().statistics());
  scheduleProgressTick(sessionId);
}

void RecordingOrchestrator::scheduleProgressTick(const std::string &sessionId)
{
  if (config_.progressIntervalMs <= 0)
  {
    return;
  }

  const TaskId task = scheduler_.postDelayed(config_.progressIntervalMs, [this, sessionId]()
                                             { handleProgressTick(sessionId); });
  std::lock_guard<std::mutex> lock(mutex_);
  progressTask_ = task;
}

void RecordingOrchestrator::fail(const RecordingError &error)
{
  cancelTimers();
  engine_.cancel();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionId_.clear();
  }

  AppLogger::getInstance().error("[RecordingOrchestrator] Session failed: " + error.describe());
  transitionTo(recording_state::Error{error});
  notifyError(error.describe());
}

void RecordingOrchestrator::transitionTo(const RecordingState &next)
{
  std::string previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = stateName(state_);
    state_ = next;
  }

  AppLogger::getInstance().info("[RecordingOrchestrator] " + previous + " -> " + stateName(next));
  notifyStateChanged(next);
}

void RecordingOrchestrator::cancelTimers()
{
  TaskId timeout = 0;
  TaskId success = 0;
  TaskId progress = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout = timeoutTask_;
    success = successTask_;
    progress = progressTask_;
    timeoutTask_ = 0;
    successTask_ = 0;
    progressTask_ = 0;
  }
  if (timeout != 0)
    scheduler_.cancel(timeout);
  if (success != 0)
    scheduler_.cancel(success);
  if (progress != 0)
    scheduler_.cancel(progress);
}

bool RecordingOrchestrator::isCurrentSession(const std::string &sessionId) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return !sessionId_.empty() && sessionId_ == sessionId;
}

std::string RecordingOrchestrator::outputPathFor(const std::string &sessionId) const
{
  if (config_.outputPathProvider)
  {
    return config_.outputPathProvider(sessionId);
  }
  return (std::filesystem::path(config_.outputDirectory) / ("recording_" + sessionId + ".wav")).string();
}

std::string RecordingOrchestrator::generateSessionId()
{
  static std::mt19937_64 generator{std::random_device{}()};
  static std::mutex generatorMutex;

  std::lock_guard<std::mutex> lock(generatorMutex);
  std::ostringstream id;
  id << std::hex << std::setw(16) << std::setfill('0') << generator();
  return id.str();
}

void RecordingOrchestrator::discardFile(const std::string &path)
{
  std::error_code ec;
  if (std::filesystem::remove(path, ec))
  {
    AppLogger::getInstance().debug("[RecordingOrchestrator] Deleted " + path);
  }
  else if (ec)
  {
    AppLogger::getInstance().warn("[RecordingOrchestrator] Could not delete " + path + ": " + ec.message());
  }
}

void RecordingOrchestrator::notifyStateChanged(const RecordingState &state)
{
  forEachListener([&state](RecordingStateListener &listener)
                  { listener.onStateChanged(state); });
}

void RecordingOrchestrator::notifyComplete(const std::optional<AudioFile> &audioFile)
{
  forEachListener([&audioFile](RecordingStateListener &listener)
                  { listener.onRecordingComplete(audioFile); });
}

void RecordingOrchestrator::notifyError(const std::string &message)
{
  forEachListener([&message](RecordingStateListener &listener)
                  { listener.onRecordingError(message); });
}

void RecordingOrchestrator::notifyProgress(const RecordingStatistics &statistics)
{
  forEachListener([&statistics](RecordingStateListener &listener)
                  { listener.onRecordingProgress(statistics); });
}

void RecordingOrchestrator::forEachListener(const std::function<void(RecordingStateListener &)> &fn)
{
  std::vector<RecordingStateListener *> snapshot;
  {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    snapshot = listeners_;
  }

  for (RecordingStateListener *listener : snapshot)
  {
    try
    {
      fn(*listener);
    }
    catch (const std::exception &e)
    {
      AppLogger::getInstance().error("[RecordingOrchestrator] Listener threw: " + std::string(e.what()));
    }
  }
}
