#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Canonical 44-byte RIFF/WAVE header for PCM data.
struct WavHeader
{
  char riff[4] = {'R', 'I', 'F', 'F'};
  uint32_t fileSize;
  char wave[4] = {'W', 'A', 'V', 'E'};
  char fmt[4] = {'f', 'm', 't', ' '};
  uint32_t fmtSize = 16;
  uint16_t audioFormat = 1;
  uint16_t numChannels;
  uint32_t sampleRate;
  uint32_t byteRate;
  uint16_t blockAlign;
  uint16_t bitsPerSample = 16;
  char data[4] = {'d', 'a', 't', 'a'};
  uint32_t dataSize;
} __attribute__((packed));

static_assert(sizeof(WavHeader) == 44, "WAV header must be 44 bytes");

struct WavData
{
  int sampleRate = 0;
  int channels = 0;
  int bitsPerSample = 0;
  std::vector<int16_t> samples;
};

WavHeader makeWavHeader(size_t numSamples, int sampleRate, int channels);

// Encodes PCM16 samples into an in-memory WAV image.
std::vector<uint8_t> createWavFromPCM(const std::vector<int16_t> &pcmData, int sampleRate, int channels);

// Writes the createWavFromPCM() image to path, replacing any existing file.
// On failure the partial file is removed.
bool writeWavFile(const std::string &path, const std::vector<int16_t> &pcmData, int sampleRate, int channels);

// Reads a PCM16 WAV file written by writeWavFile() or any canonical encoder.
std::optional<WavData> readWavFile(const std::string &path);
