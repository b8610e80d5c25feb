#pragma once

#include <cstdint>
#include <string>

// Blocking source of interleaved PCM16 frames. One open stream per instance.
class AudioInput
{
public:
  virtual ~AudioInput() = default;

  virtual bool open(int sampleRate, int channels, int framesPerBuffer) = 0;

  // Blocks until up to `frames` frames are available. Returns the number of
  // frames written to `buffer`, 0 when nothing was available yet, or a
  // negative value on a device error (see lastError()).
  virtual int read(int16_t *buffer, int frames) = 0;

  virtual void close() = 0;

  virtual std::string lastError() const = 0;
};
