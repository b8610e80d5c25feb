#include "deviceArbitrator.hpp"
#include "AppLogger.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

const char *focusChangeName(FocusChange change)
{
  switch (change)
  {
  case FocusChange::Gain:
    return "Gain";
  case FocusChange::Loss:
    return "Loss";
  case FocusChange::TransientLoss:
    return "TransientLoss";
  case FocusChange::TransientLossCanDuck:
    return "TransientLossCanDuck";
  }
  return "Unknown";
}

FocusToken FocusBroker::requestFocus(FocusCallback callback, FocusRequest request)
{
  std::vector<std::pair<FocusCallback, FocusChange>> notifications;
  FocusToken token = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_)
    {
      return 0;
    }

    if (request == FocusRequest::Exclusive)
    {
      for (const Holder &holder : holders_)
      {
        notifications.emplace_back(holder.callback, FocusChange::Loss);
      }
      holders_.clear();
    }
    else if (!holders_.empty())
    {
      const FocusChange change = request == FocusRequest::TransientMayDuck ? FocusChange::TransientLossCanDuck
                                                                            : FocusChange::TransientLoss;
      notifications.emplace_back(holders_.back().callback, change);
    }

    token = nextToken_++;
    holders_.push_back(Holder{token, request, std::move(callback)});
  }

  for (auto &notification : notifications)
  {
    if (notification.first)
      notification.first(notification.second);
  }
  return token;
}

void FocusBroker::abandonFocus(FocusToken token)
{
  FocusCallback restored;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(holders_.begin(), holders_.end(),
                           [token](const Holder &h)
                           { return h.token == token; });
    if (it == holders_.end())
    {
      return;
    }

    const bool wasTop = std::next(it) == holders_.end();
    const bool wasTransient = it->request != FocusRequest::Exclusive;
    holders_.erase(it);

    if (wasTop && wasTransient && !holders_.empty())
    {
      restored = holders_.back().callback;
    }
  }

  if (restored)
  {
    restored(FocusChange::Gain);
  }
}

void FocusBroker::setAvailable(bool available)
{
  std::lock_guard<std::mutex> lock(mutex_);
  available_ = available;
}

size_t FocusBroker::holderCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return holders_.size();
}

DeviceArbitrator::DeviceArbitrator(AudioFocusProvider &provider)
    : provider_(provider)
{
}

DeviceArbitrator::~DeviceArbitrator()
{
  release();
}

bool DeviceArbitrator::acquire(DeviceListener *listener)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (token_ != 0)
  {
    AppLogger::getInstance().warn("[DeviceArbitrator] Focus already held");
    return false;
  }

  // the provider may call back synchronously on another holder's behalf,
  // never on ours, so holding mutex_ here is safe
  const uint64_t generation = ++generation_;
  const FocusToken token = provider_.requestFocus(
      [this, generation](FocusChange change)
      { handleFocusChange(generation, change); },
      FocusRequest::Exclusive);

  if (token == 0)
  {
    AppLogger::getInstance().error("[DeviceArbitrator] Audio focus request refused");
    return false;
  }

  token_ = token;
  listener_ = listener;
  AppLogger::getInstance().debug("[DeviceArbitrator] Audio focus acquired (token " + std::to_string(token) + ")");
  return true;
}

void DeviceArbitrator::release()
{
  FocusToken token = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    token = token_;
    token_ = 0;
    listener_ = nullptr;
  }

  if (token != 0)
  {
    provider_.abandonFocus(token);
    AppLogger::getInstance().debug("[DeviceArbitrator] Audio focus released");
  }
}

bool DeviceArbitrator::isHeld() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return token_ != 0;
}

void DeviceArbitrator::handleFocusChange(uint64_t generation, FocusChange change)
{
  DeviceListener *listener = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_ == 0 || generation != generation_)
    {
      return;
    }
    listener = listener_;
    if (change == FocusChange::Loss)
    {
      // the provider has already dropped us
      token_ = 0;
      listener_ = nullptr;
    }
  }

  AppLogger::getInstance().info("[DeviceArbitrator] Focus change: " + std::string(focusChangeName(change)));
  if (listener == nullptr)
  {
    return;
  }

  switch (change)
  {
  case FocusChange::Loss:
    listener->onDeviceLost();
    break;
  case FocusChange::TransientLoss:
    listener->onDeviceSuspended();
    break;
  case FocusChange::Gain:
    listener->onDeviceRestored();
    break;
  case FocusChange::TransientLossCanDuck:
    // capture is unaffected by ducking of other streams
    break;
  }
}
