#include "qualityMonitor.hpp"
#include "AppLogger.hpp"

#include <algorithm>
#include <cmath>

namespace
{

constexpr int64_t WAV_HEADER_BYTES = 44;
constexpr int64_t SILENCE_STOP_MIN_DURATION_MS = 10000;
constexpr float SILENCE_STOP_PERCENTAGE = 80.0f;

} // namespace

const char *qualityIssueName(QualityIssue issue)
{
  switch (issue)
  {
  case QualityIssue::Clipping:
    return "Clipping";
  case QualityIssue::TooQuiet:
    return "TooQuiet";
  case QualityIssue::TooMuchSilence:
    return "TooMuchSilence";
  case QualityIssue::HighNoise:
    return "HighNoise";
  case QualityIssue::PoorQuality:
    return "PoorQuality";
  }
  return "Unknown";
}

bool QualityReport::hasIssue(QualityIssue issue) const
{
  return std::find(issues.begin(), issues.end(), issue) != issues.end();
}

QualityMonitor::QualityMonitor(const RecordingConstraints &constraints, const QualityPreset &preset)
    : constraints_(constraints),
      preset_(preset),
      analyzer_(constraints),
      silenceDetector_(constraints.silenceDurationMs, constraints.audioBufferDurationMs),
      currentMetrics_(AudioMetrics::empty(constraints.noiseFloorDb))
{
  statistics_.remainingTimeMs = constraints_.maxRecordingDurationMs();
}

void QualityMonitor::startMonitoring()
{
  std::lock_guard<std::mutex> lock(mutex_);
  history_.clear();
  totalSamples_ = 0;
  silentSamples_ = 0;
  clippingEvents_ = 0;
  peakLevelSoFar_ = 0.0f;
  silenceDetector_.reset();
  silenceState_ = SilenceState::NotSilent;
  currentMetrics_ = AudioMetrics::empty(constraints_.noiseFloorDb);
  statistics_ = RecordingStatistics();
  statistics_.remainingTimeMs = constraints_.maxRecordingDurationMs();
}

AudioMetrics QualityMonitor::processBuffer(const int16_t *samples, size_t numSamples)
{
  const AudioMetrics metrics = analyzer_.analyze(samples, numSamples);

  SilenceState transition;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    currentMetrics_ = metrics;

    history_.push_back(metrics);
    if (history_.size() > HISTORY_SIZE)
    {
      history_.pop_front();
    }

    totalSamples_ += static_cast<int64_t>(numSamples);
    if (metrics.isSilent)
    {
      silentSamples_ += static_cast<int64_t>(numSamples);
    }
    if (metrics.isClipping)
    {
      ++clippingEvents_;
    }
    peakLevelSoFar_ = std::max(peakLevelSoFar_, metrics.peakLevel);

    transition = silenceDetector_.processSample(metrics.isSilent);
    silenceState_ = transition;

    updateStatistics();
  }

  if (transition == SilenceState::EnteredSilence)
  {
    AppLogger::getInstance().debug("[QualityMonitor] Entered silence");
  }
  else if (transition == SilenceState::ExitedSilence)
  {
    AppLogger::getInstance().debug("[QualityMonitor] Exited silence");
  }

  return metrics;
}

// Caller holds mutex_.
void QualityMonitor::updateStatistics()
{
  const int64_t bytesPerSample = constraints_.bitsPerSample / 8;
  const int64_t bytesPerSecond = constraints_.bytesPerSecond();
  const int64_t fileSize = totalSamples_ * bytesPerSample;
  const int64_t bufferBytes = static_cast<int64_t>(constraints_.framesPerBuffer()) * bytesPerSample;

  RecordingStatistics s;
  s.durationMs = totalSamples_ * 1000 / constraints_.sampleRate;
  s.fileSize = fileSize;
  // size of the encoded file if one more buffer arrives
  s.estimatedFinalSize = std::min(constraints_.maxFileSizeBytes, WAV_HEADER_BYTES + fileSize + bufferBytes);
  const int64_t remainingBytes = std::max<int64_t>(0, constraints_.sizeLimitBytes() - fileSize);
  s.remainingTimeMs = remainingBytes * 1000 / bytesPerSecond;
  s.peakLevel = peakLevelSoFar_;
  s.silencePercentage = totalSamples_ > 0 ? (silentSamples_ * 100.0f) / totalSamples_ : 0.0f;
  s.clippingOccurrences = clippingEvents_;

  if (!history_.empty())
  {
    double levelSum = 0.0;
    double qualitySum = 0.0;
    for (const AudioMetrics &m : history_)
    {
      levelSum += m.rmsLevel;
      qualitySum += m.qualityScore;
    }
    s.averageLevel = static_cast<float>(levelSum / history_.size());
    s.overallQuality = static_cast<int>(std::lround(qualitySum / history_.size()));
  }
  else
  {
    s.overallQuality = 50;
  }

  statistics_ = s;
}

AudioMetrics QualityMonitor::currentMetrics() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return currentMetrics_;
}

RecordingStatistics QualityMonitor::statistics() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return statistics_;
}

SilenceState QualityMonitor::silenceState() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return silenceState_;
}

bool QualityMonitor::shouldTrimSilence() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return silenceDetector_.shouldTrimSilence();
}

bool QualityMonitor::shouldStopRecording() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (totalSamples_ == 0)
  {
    return false;
  }

  if (statistics_.estimatedFinalSize >= constraints_.sizeLimitBytes())
  {
    return true;
  }

  return preset_.trimSilence &&
         statistics_.durationMs > SILENCE_STOP_MIN_DURATION_MS &&
         statistics_.silencePercentage > SILENCE_STOP_PERCENTAGE;
}

bool QualityMonitor::canContinueRecording(int64_t additionalDurationMs) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t additionalBytes = additionalDurationMs * constraints_.bytesPerSecond() / 1000;
  return statistics_.fileSize + additionalBytes < constraints_.maxFileSizeBytes;
}

int64_t QualityMonitor::remainingRecordingTimeMs() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return statistics_.remainingTimeMs;
}

// Caller holds mutex_.
std::vector<QualityIssue> QualityMonitor::detectIssues() const
{
  std::vector<QualityIssue> issues;
  if (totalSamples_ > 0)
  {
    if (statistics_.clippingOccurrences > 0)
      issues.push_back(QualityIssue::Clipping);
    if (statistics_.averageLevel < 0.05f)
      issues.push_back(QualityIssue::TooQuiet);
    if (statistics_.silencePercentage > 50.0f)
      issues.push_back(QualityIssue::TooMuchSilence);
    if (statistics_.overallQuality < 30)
      issues.push_back(QualityIssue::PoorQuality);
  }
  if (currentMetrics_.noiseFloor > -30.0f)
  {
    issues.push_back(QualityIssue::HighNoise);
  }
  return issues;
}

QualityReport QualityMonitor::qualityReport() const
{
  std::lock_guard<std::mutex> lock(mutex_);

  QualityReport report;
  if (!history_.empty())
  {
    double rms = 0.0, db = 0.0, noise = 0.0, snr = 0.0, quality = 0.0;
    for (const AudioMetrics &m : history_)
    {
      rms += m.rmsLevel;
      db += m.dbLevel;
      noise += m.noiseFloor;
      snr += m.signalToNoise;
      quality += m.qualityScore;
    }
    const double n = static_cast<double>(history_.size());

    AudioMetrics avg;
    avg.rmsLevel = static_cast<float>(rms / n);
    avg.peakLevel = peakLevelSoFar_;
    avg.dbLevel = static_cast<float>(db / n);
    avg.isClipping = clippingEvents_ > 0;
    avg.isSilent = false;
    avg.noiseFloor = static_cast<float>(noise / n);
    avg.signalToNoise = static_cast<float>(snr / n);
    avg.qualityScore = static_cast<int>(std::lround(quality / n));
    report.averageMetrics = avg;
  }
  else
  {
    report.averageMetrics = AudioMetrics::empty(constraints_.noiseFloorDb);
  }

  report.overallQuality = report.averageMetrics.qualityScore;
  report.statistics = statistics_;
  report.issues = detectIssues();

  if (report.hasIssue(QualityIssue::Clipping))
    report.recommendations.push_back("Reduce microphone gain or move further from the microphone");
  if (report.hasIssue(QualityIssue::TooQuiet))
    report.recommendations.push_back("Increase microphone gain or speak closer to the microphone");
  if (report.hasIssue(QualityIssue::HighNoise))
    report.recommendations.push_back("Record in a quieter environment or use a better microphone");
  if (report.hasIssue(QualityIssue::TooMuchSilence))
    report.recommendations.push_back("Start speaking when ready, silence will be automatically trimmed");

  return report;
}
