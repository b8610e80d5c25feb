#pragma once

#include <string>
#include <portaudio.h>

#include "audioInput.hpp"

// Default microphone through the PortAudio blocking API.
class PortAudioInput : public AudioInput
{
public:
  PortAudioInput();

  ~PortAudioInput() override;

  bool isInitialized() const;

  // True when the host exposes a default capture device.
  bool hasInputDevice() const;

  bool open(int sampleRate, int channels, int framesPerBuffer) override;
  int read(int16_t *buffer, int frames) override;
  void close() override;
  std::string lastError() const override;

private:
  bool initialized;
  PaStream *stream_ = nullptr;
  std::string lastError_;
};
