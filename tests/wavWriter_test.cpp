#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "fakes.hpp"
#include "wavWriter.hpp"

TEST(WavWriterTest, HeaderDescribesMono16BitPcm)
{
  const WavHeader header = makeWavHeader(16000, 16000, 1);

  EXPECT_EQ(std::memcmp(header.riff, "RIFF", 4), 0);
  EXPECT_EQ(std::memcmp(header.wave, "WAVE", 4), 0);
  EXPECT_EQ(std::memcmp(header.fmt, "fmt ", 4), 0);
  EXPECT_EQ(std::memcmp(header.data, "data", 4), 0);
  EXPECT_EQ(header.fmtSize, 16u);
  EXPECT_EQ(header.audioFormat, 1);
  EXPECT_EQ(header.numChannels, 1);
  EXPECT_EQ(header.sampleRate, 16000u);
  EXPECT_EQ(header.byteRate, 32000u);
  EXPECT_EQ(header.blockAlign, 2);
  EXPECT_EQ(header.bitsPerSample, 16);
  EXPECT_EQ(header.dataSize, 32000u);
  EXPECT_EQ(header.fileSize, 36u + 32000u);
}

TEST(WavWriterTest, InMemoryImageIsHeaderPlusSamples)
{
  const std::vector<int16_t> pcm = {1, -1, 1000, -32768, 32767};
  const std::vector<uint8_t> wav = createWavFromPCM(pcm, 16000, 1);

  ASSERT_EQ(wav.size(), 44u + pcm.size() * 2);
  int16_t last = 0;
  std::memcpy(&last, wav.data() + 44 + 8, sizeof(last));
  EXPECT_EQ(last, 32767);
}

TEST(WavWriterTest, FileOnDiskMatchesSamples)
{
  TempDir dir;
  const std::string path = dir.file("nested/out.wav");

  std::vector<int16_t> pcm(1600);
  for (size_t i = 0; i < pcm.size(); ++i)
    pcm[i] = static_cast<int16_t>(i * 20 - 16000);

  ASSERT_TRUE(writeWavFile(path, pcm, 16000, 1));
  EXPECT_EQ(std::filesystem::file_size(path), 44u + pcm.size() * 2);

  const std::optional<WavData> wav = readWavFile(path);
  ASSERT_TRUE(wav.has_value());
  EXPECT_EQ(wav->sampleRate, 16000);
  EXPECT_EQ(wav->channels, 1);
  EXPECT_EQ(wav->bitsPerSample, 16);
  EXPECT_EQ(wav->samples, pcm);
}

TEST(WavWriterTest, FileBytesAreTheInMemoryImage)
{
  TempDir dir;
  const std::string path = dir.file("image.wav");
  const std::vector<int16_t> pcm = {0, 12, -12, 4096, -4096, 32767, -32768};

  ASSERT_TRUE(writeWavFile(path, pcm, 16000, 1));

  std::ifstream in(path, std::ios::binary);
  const std::vector<uint8_t> onDisk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(onDisk, createWavFromPCM(pcm, 16000, 1));
}

TEST(WavWriterTest, EmptyRecordingStillProducesValidHeader)
{
  TempDir dir;
  const std::string path = dir.file("empty.wav");

  ASSERT_TRUE(writeWavFile(path, {}, 16000, 1));
  EXPECT_EQ(std::filesystem::file_size(path), 44u);

  const std::optional<WavData> wav = readWavFile(path);
  ASSERT_TRUE(wav.has_value());
  EXPECT_TRUE(wav->samples.empty());
}

TEST(WavWriterTest, WriteFailsForUnwritablePath)
{
  TempDir dir;
  // a regular file where a directory is expected
  const std::string blocker = dir.file("blocker");
  std::ofstream(blocker) << "x";

  EXPECT_FALSE(writeWavFile(blocker + "/out.wav", {1, 2, 3}, 16000, 1));
}

TEST(WavWriterTest, ReadRejectsNonWavContent)
{
  TempDir dir;
  const std::string path = dir.file("text.wav");
  std::ofstream(path) << std::string(100, 'x');

  EXPECT_FALSE(readWavFile(path).has_value());
  EXPECT_FALSE(readWavFile(dir.file("missing.wav")).has_value());
}
