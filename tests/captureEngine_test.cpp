#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

#include "captureEngine.hpp"
#include "deviceArbitrator.hpp"
#include "fakes.hpp"
#include "wavWriter.hpp"

namespace
{

// Another application grabs the device while the stream is being opened.
class FocusStealingInput : public FakeAudioInput
{
public:
  explicit FocusStealingInput(FocusBroker &broker) : broker_(broker) {}

  bool open(int sampleRate, int channels, int framesPerBuffer) override
  {
    broker_.requestFocus(nullptr, FocusRequest::Exclusive);
    return FakeAudioInput::open(sampleRate, channels, framesPerBuffer);
  }

private:
  FocusBroker &broker_;
};

class CaptureEngineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    callbacks.onError = [this](const std::string &sessionId, const CaptureError &error)
    {
      std::lock_guard<std::mutex> lock(mutex);
      errorSession = sessionId;
      lastError = error;
      ++errors;
    };
    callbacks.onSizeLimitReached = [this](const std::string &)
    { ++sizeLimits; };
    callbacks.onFinished = [this](const std::string &)
    { ++finished; };
  }

  std::unique_ptr<CaptureEngine> makeEngine()
  {
    auto engine = std::make_unique<CaptureEngine>(constraints, QualityPreset::medium(), input, arbitrator);
    engine->setCallbacks(callbacks);
    return engine;
  }

  std::optional<CaptureError> error() const
  {
    std::lock_guard<std::mutex> lock(mutex);
    return lastError;
  }

  RecordingConstraints constraints;
  FakeAudioInput input;
  FocusBroker broker;
  DeviceArbitrator arbitrator{broker};
  TempDir dir;
  CaptureEngine::Callbacks callbacks;

  mutable std::mutex mutex;
  std::optional<CaptureError> lastError;
  std::string errorSession;
  std::atomic<int> errors{0};
  std::atomic<int> sizeLimits{0};
  std::atomic<int> finished{0};
};

} // namespace

TEST_F(CaptureEngineTest, StopProducesNormalizedWavFile)
{
  input.buffers = 50;
  auto engine = makeEngine();
  const std::string path = dir.file("take.wav");

  ASSERT_FALSE(engine->start(path, "s1").has_value());
  EXPECT_TRUE(engine->isCapturing());
  EXPECT_TRUE(arbitrator.isHeld());
  ASSERT_TRUE(waitUntil([&]()
                        { return engine->capturedSamples() == 50 * 1600; }));

  const std::optional<AudioFile> file = engine->stop();
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->path, path);
  EXPECT_EQ(file->sessionId, "s1");
  EXPECT_EQ(file->durationMs, 5000);
  EXPECT_EQ(file->sizeBytes, 44 + 50 * 3200);
  EXPECT_EQ(finished.load(), 1);
  EXPECT_EQ(errors.load(), 0);
  EXPECT_FALSE(engine->isCapturing());
  EXPECT_FALSE(arbitrator.isHeld());
  EXPECT_EQ(input.closeCount.load(), 1);

  const std::optional<WavData> wav = readWavFile(path);
  ASSERT_TRUE(wav.has_value());
  ASSERT_EQ(wav->samples.size(), 50u * 1600u);
  EXPECT_EQ(wav->samples[0], 29490);
}

TEST_F(CaptureEngineTest, SecondStartIsRejected)
{
  auto engine = makeEngine();
  ASSERT_FALSE(engine->start(dir.file("a.wav"), "s1").has_value());

  const std::optional<CaptureError> second = engine->start(dir.file("b.wav"), "s2");
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->kind, ErrorKind::ConfigurationError);
  EXPECT_EQ(input.openCount.load(), 1);

  engine->cancel();
  EXPECT_FALSE(engine->isCapturing());
}

TEST_F(CaptureEngineTest, OpenFailureReleasesDevice)
{
  input.failOpen = true;
  auto engine = makeEngine();

  const std::optional<CaptureError> result = engine->start(dir.file("a.wav"), "s1");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->kind, ErrorKind::ConfigurationError);
  EXPECT_NE(result->cause.find("device busy"), std::string::npos);
  EXPECT_FALSE(arbitrator.isHeld());
  EXPECT_FALSE(engine->isCapturing());
}

TEST_F(CaptureEngineTest, RefusedFocusMeansDeviceUnavailable)
{
  broker.setAvailable(false);
  auto engine = makeEngine();

  const std::optional<CaptureError> result = engine->start(dir.file("a.wav"), "s1");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->kind, ErrorKind::DeviceUnavailable);
  EXPECT_EQ(input.openCount.load(), 0);
}

TEST_F(CaptureEngineTest, ReadFailureReportsIoErrorWithoutOutput)
{
  input.buffers = 3;
  input.afterwards = FakeAudioInput::Afterwards::Fail;
  auto engine = makeEngine();
  const std::string path = dir.file("a.wav");

  ASSERT_FALSE(engine->start(path, "s1").has_value());
  ASSERT_TRUE(waitUntil([&]()
                        { return errors.load() == 1; }));

  EXPECT_EQ(error()->kind, ErrorKind::IOError);
  EXPECT_EQ(errorSession, "s1");
  EXPECT_TRUE(waitUntil([&]()
                        { return !engine->isCapturing(); }));
  EXPECT_FALSE(engine->stop().has_value());
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_EQ(finished.load(), 0);
  EXPECT_EQ(broker.holderCount(), 0u);
}

TEST_F(CaptureEngineTest, SizeLimitTruncatesAndFinishes)
{
  constraints.maxFileSizeBytes = 64000; // limit at 60800 bytes
  input.buffers = 1000;
  auto engine = makeEngine();
  const std::string path = dir.file("long.wav");

  ASSERT_FALSE(engine->start(path, "s1").has_value());
  ASSERT_TRUE(waitUntil([&]()
                        { return finished.load() == 1; }));
  EXPECT_EQ(sizeLimits.load(), 1);

  const std::optional<AudioFile> file = engine->stop();
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->sizeBytes, 44 + 60800);
  EXPECT_LT(file->sizeBytes, constraints.maxFileSizeBytes);
  EXPECT_EQ(file->durationMs, 1900);
  EXPECT_EQ(input.delivered.load(), 19);
}

TEST_F(CaptureEngineTest, CancelLeavesNoFile)
{
  input.buffers = 5;
  auto engine = makeEngine();
  const std::string path = dir.file("a.wav");

  ASSERT_FALSE(engine->start(path, "s1").has_value());
  ASSERT_TRUE(waitUntil([&]()
                        { return engine->capturedSamples() == 5 * 1600; }));

  engine->cancel();
  EXPECT_FALSE(engine->isCapturing());
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_FALSE(arbitrator.isHeld());
  EXPECT_EQ(finished.load(), 0);
  EXPECT_EQ(errors.load(), 0);
  EXPECT_FALSE(engine->stop().has_value());
}

TEST_F(CaptureEngineTest, TransientFocusLossPausesCapture)
{
  auto engine = makeEngine();
  ASSERT_FALSE(engine->start(dir.file("a.wav"), "s1").has_value());

  const FocusToken call = broker.requestFocus(nullptr, FocusRequest::Transient);
  ASSERT_TRUE(waitUntil([&]()
                        { return engine->state() == CaptureState::Paused; }));

  broker.abandonFocus(call);
  ASSERT_TRUE(waitUntil([&]()
                        { return engine->state() == CaptureState::Active; }));

  engine->cancel();
  EXPECT_EQ(errors.load(), 0);
}

TEST_F(CaptureEngineTest, PermanentFocusLossIsDeviceUnavailable)
{
  auto engine = makeEngine();
  ASSERT_FALSE(engine->start(dir.file("a.wav"), "s1").has_value());

  broker.requestFocus(nullptr, FocusRequest::Exclusive);
  ASSERT_TRUE(waitUntil([&]()
                        { return errors.load() == 1; }));

  EXPECT_EQ(error()->kind, ErrorKind::DeviceUnavailable);
  EXPECT_TRUE(waitUntil([&]()
                        { return !engine->isCapturing(); }));
  EXPECT_FALSE(input.isOpen);
}

TEST_F(CaptureEngineTest, EngineCanBeReusedAfterStop)
{
  input.buffers = 2;
  auto engine = makeEngine();

  ASSERT_FALSE(engine->start(dir.file("one.wav"), "s1").has_value());
  ASSERT_TRUE(waitUntil([&]()
                        { return engine->capturedSamples() == 2 * 1600; }));
  ASSERT_TRUE(engine->stop().has_value());

  ASSERT_FALSE(engine->start(dir.file("two.wav"), "s2").has_value());
  ASSERT_TRUE(waitUntil([&]()
                        { return engine->capturedSamples() == 2 * 1600; }));
  const std::optional<AudioFile> second = engine->stop();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->sessionId, "s2");
  EXPECT_EQ(input.openCount.load(), 2);
  EXPECT_TRUE(std::filesystem::exists(dir.file("one.wav")));
}

TEST_F(CaptureEngineTest, FocusLostWhileOpeningIsReported)
{
  FocusStealingInput stealing(broker);
  CaptureEngine engine(constraints, QualityPreset::medium(), stealing, arbitrator);
  engine.setCallbacks(callbacks);
  const std::string path = dir.file("a.wav");

  ASSERT_FALSE(engine.start(path, "s1").has_value());
  ASSERT_TRUE(waitUntil([&]()
                        { return errors.load() == 1; }));

  EXPECT_EQ(error()->kind, ErrorKind::DeviceUnavailable);
  EXPECT_TRUE(waitUntil([&]()
                        { return !engine.isCapturing(); }));
  EXPECT_FALSE(arbitrator.isHeld());
  EXPECT_FALSE(stealing.isOpen);
  EXPECT_EQ(finished.load(), 0);
  EXPECT_FALSE(std::filesystem::exists(path));
}
