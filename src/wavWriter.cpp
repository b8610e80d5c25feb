#include "wavWriter.hpp"
#include "AppLogger.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

WavHeader makeWavHeader(size_t numSamples, int sampleRate, int channels)
{
  WavHeader header;
  header.numChannels = static_cast<uint16_t>(channels);
  header.sampleRate = static_cast<uint32_t>(sampleRate);
  header.byteRate = static_cast<uint32_t>(sampleRate * channels * 2);
  header.blockAlign = static_cast<uint16_t>(channels * 2);

  const uint32_t dataSize = static_cast<uint32_t>(numSamples * sizeof(int16_t));
  header.dataSize = dataSize;
  header.fileSize = sizeof(WavHeader) - 8 + dataSize;
  return header;
}

std::vector<uint8_t> createWavFromPCM(const std::vector<int16_t> &pcmData, int sampleRate, int channels)
{
  const WavHeader header = makeWavHeader(pcmData.size(), sampleRate, channels);

  std::vector<uint8_t> wavData;
  wavData.reserve(sizeof(WavHeader) + header.dataSize);

  wavData.resize(sizeof(WavHeader));
  std::memcpy(wavData.data(), &header, sizeof(WavHeader));

  const uint8_t *pcmBytes = reinterpret_cast<const uint8_t *>(pcmData.data());
  wavData.insert(wavData.end(), pcmBytes, pcmBytes + header.dataSize);

  return wavData;
}

bool writeWavFile(const std::string &path, const std::vector<int16_t> &pcmData, int sampleRate, int channels)
{
  std::error_code ec;
  const std::filesystem::path target(path);
  if (target.has_parent_path())
  {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec)
    {
      AppLogger::getInstance().error("[WavWriter] Failed to create directory for " + path + ": " + ec.message());
      return false;
    }
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open())
  {
    AppLogger::getInstance().error("[WavWriter] Failed to open " + path + " for writing");
    return false;
  }

  const std::vector<uint8_t> wavData = createWavFromPCM(pcmData, sampleRate, channels);
  file.write(reinterpret_cast<const char *>(wavData.data()), static_cast<std::streamsize>(wavData.size()));
  file.close();

  if (!file)
  {
    AppLogger::getInstance().error("[WavWriter] Write failed for " + path);
    std::filesystem::remove(target, ec);
    return false;
  }

  AppLogger::getInstance().debug("[WavWriter] Wrote " + std::to_string(wavData.size()) + " bytes to " + path);
  return true;
}

std::optional<WavData> readWavFile(const std::string &path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    AppLogger::getInstance().error("[WavWriter] Failed to open " + path);
    return std::nullopt;
  }

  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (bytes.size() < sizeof(WavHeader))
  {
    AppLogger::getInstance().error("[WavWriter] " + path + " is too small to contain a WAV header");
    return std::nullopt;
  }

  const uint8_t *header = bytes.data();
  if (std::memcmp(header, "RIFF", 4) != 0 || std::memcmp(header + 8, "WAVE", 4) != 0)
  {
    AppLogger::getInstance().error("[WavWriter] Invalid WAV signature in " + path);
    return std::nullopt;
  }

  WavData wav;
  uint16_t channels = 0;
  uint32_t sampleRate = 0;
  uint16_t bitsPerSample = 0;
  std::memcpy(&channels, header + 22, sizeof(channels));
  std::memcpy(&sampleRate, header + 24, sizeof(sampleRate));
  std::memcpy(&bitsPerSample, header + 34, sizeof(bitsPerSample));
  wav.channels = channels;
  wav.sampleRate = static_cast<int>(sampleRate);
  wav.bitsPerSample = bitsPerSample;

  if (bitsPerSample != 16)
  {
    AppLogger::getInstance().error("[WavWriter] Unsupported sample width " + std::to_string(bitsPerSample) + " in " + path);
    return std::nullopt;
  }

  // walk the chunk list for "data"; fmt chunks may be followed by others
  size_t offset = 12;
  while (offset + 8 <= bytes.size())
  {
    uint32_t chunkSize = 0;
    std::memcpy(&chunkSize, header + offset + 4, sizeof(chunkSize));
    if (std::memcmp(header + offset, "data", 4) == 0)
    {
      const size_t available = bytes.size() - offset - 8;
      const size_t dataSize = std::min<size_t>(chunkSize, available);
      wav.samples.resize(dataSize / sizeof(int16_t));
      std::memcpy(wav.samples.data(), header + offset + 8, wav.samples.size() * sizeof(int16_t));
      return wav;
    }
    offset += 8 + chunkSize + (chunkSize & 1);
  }

  AppLogger::getInstance().error("[WavWriter] Could not find data chunk in " + path);
  return std::nullopt;
}
