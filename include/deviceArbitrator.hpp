#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

enum class FocusChange
{
  Gain,
  Loss,
  TransientLoss,
  TransientLossCanDuck
};

const char *focusChangeName(FocusChange change);

enum class FocusRequest
{
  Exclusive,
  Transient,
  TransientMayDuck
};

using FocusToken = uint64_t;
using FocusCallback = std::function<void(FocusChange)>;

// Host-side grant of the capture device. A token of 0 means refused.
class AudioFocusProvider
{
public:
  virtual ~AudioFocusProvider() = default;

  virtual FocusToken requestFocus(FocusCallback callback, FocusRequest request) = 0;
  virtual void abandonFocus(FocusToken token) = 0;
};

// In-process focus stack for desktop hosts where no platform arbiter exists.
// Holders are notified outside the lock, on the thread that caused the change.
class FocusBroker : public AudioFocusProvider
{
public:
  FocusToken requestFocus(FocusCallback callback, FocusRequest request) override;
  void abandonFocus(FocusToken token) override;

  // While unavailable every request is refused.
  void setAvailable(bool available);

  size_t holderCount() const;

private:
  struct Holder
  {
    FocusToken token;
    FocusRequest request;
    FocusCallback callback;
  };

  mutable std::mutex mutex_;
  std::vector<Holder> holders_; // back() is the current owner
  FocusToken nextToken_ = 1;
  bool available_ = true;
};

class DeviceListener
{
public:
  virtual ~DeviceListener() = default;

  virtual void onDeviceLost() = 0;
  virtual void onDeviceSuspended() = 0;
  virtual void onDeviceRestored() = 0;
};

// Holds exclusive capture focus for one session at a time and translates
// focus changes into listener calls.
class DeviceArbitrator
{
public:
  explicit DeviceArbitrator(AudioFocusProvider &provider);
  ~DeviceArbitrator();

  DeviceArbitrator(const DeviceArbitrator &) = delete;
  DeviceArbitrator &operator=(const DeviceArbitrator &) = delete;

  bool acquire(DeviceListener *listener);

  // Safe to call when nothing is held.
  void release();

  bool isHeld() const;

private:
  void handleFocusChange(uint64_t generation, FocusChange change);

  AudioFocusProvider &provider_;
  mutable std::mutex mutex_;
  FocusToken token_ = 0;
  uint64_t generation_ = 0; // bumped per acquire, filters late callbacks
  DeviceListener *listener_ = nullptr;
};
