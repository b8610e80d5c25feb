#include "portAudioInput.hpp"
#include "AppLogger.hpp"

PortAudioInput::PortAudioInput()
    : initialized(false)
{
  PaError err = Pa_Initialize();
  if (err == paNoError)
  {
    initialized = true;
    AppLogger::getInstance().info("[PortAudioInput] PortAudio initialized successfully.");
  }
  else
  {
    lastError_ = Pa_GetErrorText(err);
    AppLogger::getInstance().error("[PortAudioInput] PortAudio initialization failed: " + lastError_);
  }
}

PortAudioInput::~PortAudioInput()
{
  close();
  if (initialized)
  {
    PaError err = Pa_Terminate();
    if (err != paNoError)
    {
      AppLogger::getInstance().warn("[PortAudioInput] PortAudio termination failed: " + std::string(Pa_GetErrorText(err)));
    }
  }
}

bool PortAudioInput::isInitialized() const
{
  return initialized;
}

bool PortAudioInput::hasInputDevice() const
{
  return initialized && Pa_GetDefaultInputDevice() != paNoDevice;
}

bool PortAudioInput::open(int sampleRate, int channels, int framesPerBuffer)
{
  if (!initialized)
  {
    lastError_ = "PortAudio not initialized";
    return false;
  }
  if (stream_ != nullptr)
  {
    lastError_ = "stream already open";
    return false;
  }

  PaError err = Pa_OpenDefaultStream(&stream_,
                                     channels,
                                     0,
                                     paInt16,
                                     sampleRate,
                                     framesPerBuffer,
                                     nullptr, nullptr);
  if (err != paNoError)
  {
    lastError_ = Pa_GetErrorText(err);
    AppLogger::getInstance().error("[PortAudioInput] Error opening audio stream: " + lastError_);
    stream_ = nullptr;
    return false;
  }

  err = Pa_StartStream(stream_);
  if (err != paNoError)
  {
    lastError_ = Pa_GetErrorText(err);
    AppLogger::getInstance().error("[PortAudioInput] Error starting audio stream: " + lastError_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    return false;
  }

  AppLogger::getInstance().info("[PortAudioInput] Stream open: " + std::to_string(sampleRate) + " Hz, " +
                                std::to_string(channels) + " ch, " + std::to_string(framesPerBuffer) + " frames/buffer");
  return true;
}

int PortAudioInput::read(int16_t *buffer, int frames)
{
  if (stream_ == nullptr)
  {
    lastError_ = "stream not open";
    return -1;
  }

  PaError err = Pa_ReadStream(stream_, buffer, frames);
  // an overflow only means frames were dropped upstream; the buffer is valid
  if (err == paInputOverflowed)
  {
    AppLogger::getInstance().warn("[PortAudioInput] Input overflowed");
    return frames;
  }
  if (err != paNoError)
  {
    lastError_ = Pa_GetErrorText(err);
    AppLogger::getInstance().error("[PortAudioInput] Error reading from stream: " + lastError_);
    return -1;
  }
  return frames;
}

void PortAudioInput::close()
{
  if (stream_ == nullptr)
  {
    return;
  }

  Pa_StopStream(stream_);
  PaError err = Pa_CloseStream(stream_);
  if (err != paNoError)
  {
    AppLogger::getInstance().warn("[PortAudioInput] Error closing stream: " + std::string(Pa_GetErrorText(err)));
  }
  stream_ = nullptr;
}

std::string PortAudioInput::lastError() const
{
  return lastError_;
}
