#include <gtest/gtest.h>

#include <vector>

#include "deviceArbitrator.hpp"

namespace
{

class CountingListener : public DeviceListener
{
public:
  int lost = 0;
  int suspended = 0;
  int restored = 0;

  void onDeviceLost() override { ++lost; }
  void onDeviceSuspended() override { ++suspended; }
  void onDeviceRestored() override { ++restored; }
};

} // namespace

TEST(FocusBrokerTest, ExclusiveRequestRevokesEveryHolder)
{
  FocusBroker broker;
  std::vector<FocusChange> first;
  std::vector<FocusChange> second;

  const FocusToken a = broker.requestFocus([&](FocusChange c)
                                           { first.push_back(c); },
                                           FocusRequest::Exclusive);
  const FocusToken b = broker.requestFocus([&](FocusChange c)
                                           { second.push_back(c); },
                                           FocusRequest::Transient);
  ASSERT_NE(a, 0u);
  ASSERT_NE(b, 0u);
  EXPECT_EQ(first, std::vector<FocusChange>{FocusChange::TransientLoss});

  broker.requestFocus(nullptr, FocusRequest::Exclusive);
  EXPECT_EQ(first.back(), FocusChange::Loss);
  EXPECT_EQ(second, std::vector<FocusChange>{FocusChange::Loss});
  EXPECT_EQ(broker.holderCount(), 1u);
}

TEST(FocusBrokerTest, AbandoningTransientHolderRestoresTheOneBeneath)
{
  FocusBroker broker;
  std::vector<FocusChange> owner;

  broker.requestFocus([&](FocusChange c)
                      { owner.push_back(c); },
                      FocusRequest::Exclusive);
  const FocusToken transient = broker.requestFocus(nullptr, FocusRequest::Transient);
  broker.abandonFocus(transient);

  EXPECT_EQ(owner, (std::vector<FocusChange>{FocusChange::TransientLoss, FocusChange::Gain}));
}

TEST(FocusBrokerTest, UnavailableBrokerRefusesRequests)
{
  FocusBroker broker;
  broker.setAvailable(false);
  EXPECT_EQ(broker.requestFocus(nullptr, FocusRequest::Exclusive), 0u);

  broker.setAvailable(true);
  EXPECT_NE(broker.requestFocus(nullptr, FocusRequest::Exclusive), 0u);
}

TEST(DeviceArbitratorTest, AcquireAndReleaseAreBalanced)
{
  FocusBroker broker;
  DeviceArbitrator arbitrator(broker);
  CountingListener listener;

  EXPECT_TRUE(arbitrator.acquire(&listener));
  EXPECT_TRUE(arbitrator.isHeld());
  EXPECT_FALSE(arbitrator.acquire(&listener));

  arbitrator.release();
  EXPECT_FALSE(arbitrator.isHeld());
  EXPECT_EQ(broker.holderCount(), 0u);

  // idempotent
  arbitrator.release();
  EXPECT_FALSE(arbitrator.isHeld());
}

TEST(DeviceArbitratorTest, MapsFocusChangesToListener)
{
  FocusBroker broker;
  DeviceArbitrator arbitrator(broker);
  CountingListener listener;
  ASSERT_TRUE(arbitrator.acquire(&listener));

  const FocusToken call = broker.requestFocus(nullptr, FocusRequest::Transient);
  EXPECT_EQ(listener.suspended, 1);
  broker.abandonFocus(call);
  EXPECT_EQ(listener.restored, 1);

  // ducking is ignored
  const FocusToken notification = broker.requestFocus(nullptr, FocusRequest::TransientMayDuck);
  broker.abandonFocus(notification);
  EXPECT_EQ(listener.suspended, 1);
  EXPECT_EQ(listener.restored, 2);

  broker.requestFocus(nullptr, FocusRequest::Exclusive);
  EXPECT_EQ(listener.lost, 1);
  EXPECT_FALSE(arbitrator.isHeld());
}

TEST(DeviceArbitratorTest, RefusedWhenProviderUnavailable)
{
  FocusBroker broker;
  broker.setAvailable(false);
  DeviceArbitrator arbitrator(broker);
  CountingListener listener;

  EXPECT_FALSE(arbitrator.acquire(&listener));
  EXPECT_FALSE(arbitrator.isHeld());
}

TEST(DeviceArbitratorTest, NoCallbacksAfterRelease)
{
  FocusBroker broker;
  DeviceArbitrator arbitrator(broker);
  CountingListener listener;

  ASSERT_TRUE(arbitrator.acquire(&listener));
  arbitrator.release();
  broker.requestFocus(nullptr, FocusRequest::Exclusive);

  EXPECT_EQ(listener.lost, 0);
}
