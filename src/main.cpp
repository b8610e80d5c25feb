#include "AppLogger.hpp"
#include "captureEngine.hpp"
#include "configLoader.hpp"
#include "deviceArbitrator.hpp"
#include "portAudioInput.hpp"
#include "recordingConstraints.hpp"
#include "recordingOrchestrator.hpp"
#include "transcription.hpp"
#include "transcriptionClient.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{

// Desktop hosts have no runtime permission model; capture is permitted when a
// default input device exists.
class InputDevicePermissionGate : public PermissionGate
{
public:
  explicit InputDevicePermissionGate(const PortAudioInput &input) : input_(input) {}

  bool isRecordingPermitted() override
  {
    return input_.hasInputDevice();
  }

private:
  const PortAudioInput &input_;
};

class ConsoleListener : public RecordingStateListener
{
public:
  void onStateChanged(const RecordingState &state) override
  {
    if (const auto *success = std::get_if<recording_state::Success>(&state))
    {
      std::cout << "\n[Transcription] " << success->transcription << "\n"
                << "(" << success->audioFile.path << ", " << success->audioFile.durationMs << " ms)" << std::endl;
    }
    else if (const auto *error = std::get_if<recording_state::Error>(&state))
    {
      std::cout << "[Error] " << error->error.describe()
                << (error->error.retryable ? " - press 'r' to retry" : " - press 'c' to reset") << std::endl;
    }
    else
    {
      std::cout << "[" << stateName(state) << "]" << std::endl;
    }
  }

  void onRecordingError(const std::string &message) override
  {
    std::cout << "[Warning] " << message << std::endl;
  }

  // one line per recorded second
  void onRecordingProgress(const RecordingStatistics &stats) override
  {
    const int64_t seconds = stats.durationMs / 1000;
    if (seconds > lastSecond_)
    {
      lastSecond_ = seconds;
      std::cout << "  " << seconds << " s, quality " << stats.overallQuality << std::endl;
    }
    else if (seconds < lastSecond_)
    {
      lastSecond_ = seconds;
    }
  }

private:
  int64_t lastSecond_ = 0;
};

void printUsage()
{
  std::cout << "Commands: <Enter> start/stop, 'c' cancel, 'r' retry, 'q' quit" << std::endl;
}

} // namespace

int main(int argc, char **argv)
{
  const std::string configPath = argc > 1 ? argv[1] : "voicecapture.conf";

  ConfigLoader config;
  if (!config.loadFromFile(configPath))
  {
    std::cerr << "Configuration file not found or invalid: " << configPath << std::endl;
    return 1;
  }

  AppLogger::getInstance().setLevel(AppLogger::levelFromString(config.getString("log.level", "info"), AppLogger::Level::Info));
  AppLogger::getInstance().open(config.getString("log.file", "logs/voicecapture.log"));
  AppLogger::getInstance().info("voicecapture starting...");

  try
  {
    const RecordingConstraints constraints = RecordingConstraints::fromConfig(config);
    const QualityPreset preset = QualityPreset::fromName(config.getString("audio.quality", "medium"));

    OrchestratorConfig orchestratorConfig;
    orchestratorConfig.outputDirectory = config.getString("recording.outputDirectory", orchestratorConfig.outputDirectory);
    orchestratorConfig.successDisplayMs = config.getLong("recording.successDisplayMs", orchestratorConfig.successDisplayMs);
    orchestratorConfig.progressIntervalMs = config.getLong("recording.progressIntervalMs", orchestratorConfig.progressIntervalMs);

    std::error_code ec_dir;
    std::filesystem::create_directories(orchestratorConfig.outputDirectory, ec_dir);
    if (ec_dir)
    {
      AppLogger::getInstance().error("Failed to create output directory: " + ec_dir.message());
      return 1;
    }

    PortAudioInput input;
    if (!input.isInitialized())
    {
      AppLogger::getInstance().error("PortAudio global initialization failed. This is critical.");
      return 1;
    }

    FocusBroker focusBroker;
    DeviceArbitrator arbitrator(focusBroker);
    CaptureEngine engine(constraints, preset, input, arbitrator);

    HttpTranscriptionClient transcriptionClient(HttpTranscriptionConfig::fromConfig(config));
    if (!transcriptionClient.isReachable())
    {
      AppLogger::getInstance().warn("Transcription service is not reachable yet, recordings will fail until it is.");
    }

    ConfigSettingsProvider settings(config);
    InputDevicePermissionGate permissionGate(input);

    ConsoleListener listener;
    RecordingOrchestrator orchestrator(constraints, engine, transcriptionClient, settings, permissionGate, orchestratorConfig);
    orchestrator.addListener(&listener);

    printUsage();
    std::string line;
    while (std::getline(std::cin, line))
    {
      if (line == "q")
      {
        break;
      }
      if (line == "c")
      {
        orchestrator.cancelRecording();
      }
      else if (line == "r")
      {
        orchestrator.retryFromError();
      }
      else if (line.empty())
      {
        const RecordingState state = orchestrator.currentState();
        if (isState<recording_state::Recording>(state))
        {
          const RecordingStatistics stats = orchestrator.statistics();
          std::cout << "Captured " << stats.durationMs << " ms, quality " << stats.overallQuality
                    << ", " << orchestrator.remainingRecordingTimeMs() / 1000 << " s left" << std::endl;
          orchestrator.stopRecording();
        }
        else
        {
          orchestrator.startRecording();
        }
      }
      else
      {
        printUsage();
      }
    }

    orchestrator.removeListener(&listener);
  }
  catch (const std::exception &e)
  {
    AppLogger::getInstance().error("Unhandled exception: " + std::string(e.what()));
    return 1;
  }

  AppLogger::getInstance().info("voicecapture exiting.");
  return 0;
}
