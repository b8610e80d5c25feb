#include "configLoader.hpp"
#include "AppLogger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{

// Helper function to trim whitespace from both ends of a string
std::string trim(const std::string &s)
{
  const std::string WHITESPACE = " \t\n\r\f\v";
  size_t first = s.find_first_not_of(WHITESPACE);
  if (std::string::npos == first)
  {
    return std::string();
  }
  size_t last = s.find_last_not_of(WHITESPACE);
  return s.substr(first, (last - first + 1));
}

void warnBadValue(const std::string &key, const std::string &value)
{
  AppLogger::getInstance().warn("[Config] Ignoring malformed value for '" + key + "': \"" + value + "\"");
}

} // namespace

bool ConfigLoader::loadFromFile(const std::string &filename)
{
  data.clear();
  std::ifstream file(filename);
  if (!file.is_open())
  {
    AppLogger::getInstance().error("Could not open configuration file: " + filename);
    return false;
  }

  parse(file);
  AppLogger::getInstance().info("[Config] Loaded " + std::to_string(data.size()) + " entries from " + filename);
  return true;
}

void ConfigLoader::loadFromString(const std::string &content)
{
  data.clear();
  std::istringstream input(content);
  parse(input);
}

void ConfigLoader::parse(std::istream &input)
{
  std::string line;
  while (std::getline(input, line))
  {
    const std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#')
    {
      continue;
    }

    size_t delimiter_pos = trimmed.find('=');
    if (delimiter_pos != std::string::npos)
    {
      std::string key = trim(trimmed.substr(0, delimiter_pos));
      std::string value = trim(trimmed.substr(delimiter_pos + 1));
      if (!key.empty())
      {
        data[key] = value;
      }
    }
  }
}

bool ConfigLoader::has(const std::string &key) const
{
  return data.find(key) != data.end();
}

void ConfigLoader::set(const std::string &key, const std::string &value)
{
  data[key] = value;
}

std::string ConfigLoader::getString(const std::string &key, const std::string &defaultValue) const
{
  auto it = data.find(key);
  return (it != data.end()) ? it->second : defaultValue;
}

int ConfigLoader::getInt(const std::string &key, int defaultValue) const
{
  auto it = data.find(key);
  if (it != data.end())
  {
    try
    {
      return std::stoi(it->second);
    }
    catch (const std::logic_error &)
    {
      warnBadValue(key, it->second);
    }
  }
  return defaultValue;
}

long long ConfigLoader::getLong(const std::string &key, long long defaultValue) const
{
  auto it = data.find(key);
  if (it != data.end())
  {
    try
    {
      return std::stoll(it->second);
    }
    catch (const std::logic_error &)
    {
      warnBadValue(key, it->second);
    }
  }
  return defaultValue;
}

float ConfigLoader::getFloat(const std::string &key, float defaultValue) const
{
  auto it = data.find(key);
  if (it != data.end())
  {
    try
    {
      return std::stof(it->second);
    }
    catch (const std::logic_error &)
    {
      warnBadValue(key, it->second);
    }
  }
  return defaultValue;
}

bool ConfigLoader::getBool(const std::string &key, bool defaultValue) const
{
  auto it = data.find(key);
  if (it != data.end())
  {
    const std::string &val = it->second;
    if (val == "true" || val == "1" || val == "yes")
      return true;
    if (val == "false" || val == "0" || val == "no")
      return false;
    warnBadValue(key, val);
  }
  return defaultValue;
}
