#include "captureEngine.hpp"
#include "AppLogger.hpp"
#include "wavWriter.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

namespace
{

constexpr auto PAUSE_POLL_INTERVAL = std::chrono::milliseconds(1);
constexpr int64_t INITIAL_RESERVE_SECONDS = 60;

} // namespace

const char *captureStateName(CaptureState state)
{
  switch (state)
  {
  case CaptureState::Idle:
    return "Idle";
  case CaptureState::Active:
    return "Active";
  case CaptureState::Paused:
    return "Paused";
  case CaptureState::Stopping:
    return "Stopping";
  }
  return "Idle";
}

CaptureEngine::CaptureEngine(const RecordingConstraints &constraints,
                             const QualityPreset &preset,
                             AudioInput &input,
                             DeviceArbitrator &arbitrator)
    : constraints_(constraints),
      processor_(preset, constraints.sampleRate),
      input_(input),
      arbitrator_(arbitrator),
      monitor_(constraints, preset)
{
}

CaptureEngine::~CaptureEngine()
{
  cancelRequested_ = true;
  joinCaptureThread();
  arbitrator_.release();
}

void CaptureEngine::setCallbacks(Callbacks callbacks)
{
  callbacks_ = std::move(callbacks);
}

std::optional<CaptureError> CaptureEngine::start(const std::string &outputPath, const std::string &sessionId)
{
  if (state_ != CaptureState::Idle)
  {
    return CaptureError{ErrorKind::ConfigurationError, "Capture already in progress"};
  }

  // a previous session's thread may have exited on its own
  joinCaptureThread();

  // reset before acquiring; focus callbacks may arrive while the input opens
  stopRequested_ = false;
  cancelRequested_ = false;
  paused_ = false;
  deviceLost_ = false;

  if (!arbitrator_.acquire(this))
  {
    return CaptureError{ErrorKind::DeviceUnavailable, "Audio device is in use by another application"};
  }

  if (!input_.open(constraints_.sampleRate, constraints_.channels, constraints_.framesPerBuffer()))
  {
    arbitrator_.release();
    return CaptureError{ErrorKind::ConfigurationError, "Failed to open audio input: " + input_.lastError()};
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    outputPath_ = outputPath;
    sessionId_ = sessionId;
    result_.reset();
  }

  capturedSamples_ = 0;

  samples_.clear();
  const int64_t reserveSamples = std::min<int64_t>(constraints_.sizeLimitBytes() / 2,
                                                   constraints_.sampleRate * INITIAL_RESERVE_SECONDS);
  samples_.reserve(static_cast<size_t>(std::max<int64_t>(0, reserveSamples)));

  monitor_.startMonitoring();

  state_ = CaptureState::Active;
  captureThread_ = std::thread(&CaptureEngine::captureLoop, this);

  AppLogger::getInstance().info("[CaptureEngine] Capture started for session " + sessionId + " -> " + outputPath);
  return std::nullopt;
}

std::optional<AudioFile> CaptureEngine::stop()
{
  requestStop();
  joinCaptureThread();

  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<AudioFile> file = std::move(result_);
  result_.reset();
  // the file now belongs to the caller; cancel() must not remove it
  outputPath_.clear();
  return file;
}

void CaptureEngine::requestStop()
{
  stopRequested_ = true;
}

void CaptureEngine::cancel()
{
  cancelRequested_ = true;
  joinCaptureThread();
  arbitrator_.release();
  state_ = CaptureState::Idle;

  std::string path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    path = outputPath_;
    outputPath_.clear();
    result_.reset();
  }

  if (!path.empty())
  {
    std::error_code ec;
    if (std::filesystem::remove(path, ec))
    {
      AppLogger::getInstance().info("[CaptureEngine] Removed cancelled recording " + path);
    }
    else if (ec)
    {
      AppLogger::getInstance().warn("[CaptureEngine] Could not remove " + path + ": " + ec.message());
    }
  }
}

bool CaptureEngine::isCapturing() const
{
  return state_ != CaptureState::Idle;
}

CaptureState CaptureEngine::state() const
{
  return state_;
}

int64_t CaptureEngine::capturedSamples() const
{
  return capturedSamples_;
}

void CaptureEngine::onDeviceLost()
{
  deviceLost_ = true;
}

void CaptureEngine::onDeviceSuspended()
{
  paused_ = true;
}

void CaptureEngine::onDeviceRestored()
{
  paused_ = false;
}

void CaptureEngine::joinCaptureThread()
{
  if (captureThread_.joinable())
  {
    captureThread_.join();
  }
}

void CaptureEngine::reportError(const CaptureError &error)
{
  AppLogger::getInstance().error("[CaptureEngine] " + error.describe());
  input_.close();
  arbitrator_.release();
  state_ = CaptureState::Idle;

  std::string sessionId;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionId = sessionId_;
  }
  if (callbacks_.onError)
  {
    callbacks_.onError(sessionId, error);
  }
}

void CaptureEngine::captureLoop()
{
  const int frames = constraints_.framesPerBuffer();
  const size_t bufferSamples = static_cast<size_t>(frames) * constraints_.channels;
  const int64_t sizeLimitBytes = constraints_.sizeLimitBytes();
  std::vector<int16_t> buffer(bufferSamples);
  bool sizeLimitReached = false;

  while (!stopRequested_ && !cancelRequested_)
  {
    if (deviceLost_)
    {
      reportError(CaptureError{ErrorKind::DeviceUnavailable, "Audio device was taken by another application"});
      return;
    }

    if (paused_)
    {
      if (state_ == CaptureState::Active)
      {
        state_ = CaptureState::Paused;
        AppLogger::getInstance().info("[CaptureEngine] Capture paused");
      }
      std::this_thread::sleep_for(PAUSE_POLL_INTERVAL);
      continue;
    }
    if (state_ == CaptureState::Paused)
    {
      state_ = CaptureState::Active;
      AppLogger::getInstance().info("[CaptureEngine] Capture resumed");
    }

    const int framesRead = input_.read(buffer.data(), frames);
    if (framesRead < 0)
    {
      reportError(CaptureError{ErrorKind::IOError, "Audio read failed: " + input_.lastError()});
      return;
    }
    if (framesRead == 0)
    {
      std::this_thread::sleep_for(PAUSE_POLL_INTERVAL);
      continue;
    }

    size_t count = static_cast<size_t>(framesRead) * constraints_.channels;
    const int64_t bytesSoFar = static_cast<int64_t>(samples_.size()) * 2;
    if (bytesSoFar + static_cast<int64_t>(count) * 2 >= sizeLimitBytes)
    {
      count = static_cast<size_t>(std::max<int64_t>(0, (sizeLimitBytes - bytesSoFar) / 2));
      sizeLimitReached = true;
    }

    if (count > 0)
    {
      monitor_.processBuffer(buffer.data(), count);
      samples_.insert(samples_.end(), buffer.begin(), buffer.begin() + count);
      capturedSamples_ = static_cast<int64_t>(samples_.size());
    }

    if (sizeLimitReached)
    {
      AppLogger::getInstance().warn("[CaptureEngine] Size limit reached at " + std::to_string(samples_.size() * 2) + " bytes");
      break;
    }
  }

  input_.close();
  arbitrator_.release();

  if (cancelRequested_)
  {
    AppLogger::getInstance().info("[CaptureEngine] Capture cancelled");
    samples_.clear();
    state_ = CaptureState::Idle;
    return;
  }

  finishCapture(sizeLimitReached);
}

void CaptureEngine::finishCapture(bool sizeLimitReached)
{
  std::string sessionId;
  std::string outputPath;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionId = sessionId_;
    outputPath = outputPath_;
  }

  if (sizeLimitReached && callbacks_.onSizeLimitReached)
  {
    callbacks_.onSizeLimitReached(sessionId);
  }

  state_ = CaptureState::Stopping;

  const std::vector<int16_t> processed = processor_.process(samples_);
  samples_.clear();
  samples_.shrink_to_fit();

  if (!writeWavFile(outputPath, processed, constraints_.sampleRate, constraints_.channels))
  {
    reportError(CaptureError{ErrorKind::IOError, "Failed to encode recording to " + outputPath});
    return;
  }

  AudioFile file;
  file.path = outputPath;
  file.sessionId = sessionId;
  file.durationMs = static_cast<int64_t>(processed.size() / constraints_.channels) * 1000 / constraints_.sampleRate;
  std::error_code ec;
  const auto onDisk = std::filesystem::file_size(outputPath, ec);
  file.sizeBytes = ec ? static_cast<int64_t>(sizeof(WavHeader) + processed.size() * sizeof(int16_t))
                      : static_cast<int64_t>(onDisk);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    result_ = file;
  }
  state_ = CaptureState::Idle;

  AppLogger::getInstance().info("[CaptureEngine] Recording saved: " + outputPath + " (" + std::to_string(file.durationMs) +
                                " ms, " + std::to_string(file.sizeBytes) + " bytes)");

  if (callbacks_.onFinished)
  {
    callbacks_.onFinished(sessionId);
  }
}
