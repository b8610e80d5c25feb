#pragma once

#include <string>
#include <map>
#include <istream>

// Key=value configuration loader used for the recording policy, the
// transcription endpoint and logging setup.
class ConfigLoader
{
public:
  // Reads the file and loads key-value pairs.
  bool loadFromFile(const std::string &filename);

  // Same format, from an in-memory string.
  void loadFromString(const std::string &content);

  bool has(const std::string &key) const;

  // Overrides or adds a single value.
  void set(const std::string &key, const std::string &value);

  // Get a value as a string.
  std::string getString(const std::string &key, const std::string &defaultValue) const;

  // Getters for other types (int, long, float, bool).
  int getInt(const std::string &key, int defaultValue) const;
  long long getLong(const std::string &key, long long defaultValue) const;
  float getFloat(const std::string &key, float defaultValue) const;
  bool getBool(const std::string &key, bool defaultValue) const;

private:
  void parse(std::istream &input);

  std::map<std::string, std::string> data;
};
