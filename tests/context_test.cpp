// cloneflow headers
#include "core/EventBridge.hpp"
#include "core/NotificationHub.hpp"
#include "core/WizardContext.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace cloneflow::test {

  using namespace cloneflow::core;
  using namespace cloneflow::protocols;

  namespace {

    WizardContext populated() {
      WizardContext ctx;
      ctx.device = DeviceInfo{ "/dev/ttyACM0", "PM3 RDV4", "v4.18" };
      ctx.firmware.status = FirmwareStatus::Matched;
      ctx.firmware.deviceVersion = "v4.18";
      ctx.credential = Credential{ Frequency::LF, CardType::EM4100, CardData{ "0F03", "", {} }, true,
                                   BlankType::T5577 };
      ctx.blank.expected = BlankType::T5577;
      ctx.setBlankDetected(BlankType::T5577, true, std::nullopt);
      ctx.setWriteProgress(100, 4, 4);
      ctx.setVerification(true, {});
      ctx.completedAt = "2025-01-01T00:00:00.000Z";
      ctx.hf.phase = "done";
      return ctx;
    }

  } // namespace

  //---context store------------------------------------------------------------

  TEST(wizard_context, reset_returns_to_empty) {
    auto ctx = populated();
    ctx.reset();
    EXPECT_EQ(ctx, WizardContext{});
  }

  TEST(wizard_context, clear_workflow_keeps_device_and_firmware) {
    auto ctx = populated();
    const auto device = ctx.device;
    const auto firmware = ctx.firmware;

    ctx.clearWorkflow();

    EXPECT_EQ(ctx.device, device);
    EXPECT_EQ(ctx.firmware, firmware);
    EXPECT_FALSE(ctx.credential);
    EXPECT_EQ(ctx.blank, BlankTarget{});
    EXPECT_EQ(ctx.write, WriteProgress{});
    EXPECT_EQ(ctx.verify, Verification{});
    EXPECT_FALSE(ctx.completedAt);
    EXPECT_FALSE(ctx.error);
    EXPECT_EQ(ctx.hf, HfProgress{});
  }

  TEST(wizard_context, block_position_is_all_or_nothing) {
    WizardContext ctx;
    ctx.setWriteProgress(150, 5, std::nullopt);
    EXPECT_EQ(ctx.write.percent, 100);
    EXPECT_FALSE(ctx.write.currentBlock);
    EXPECT_FALSE(ctx.write.totalBlocks);

    ctx.setWriteProgress(-3, 5, 12);
    EXPECT_EQ(ctx.write.percent, 0);
    EXPECT_EQ(ctx.write.currentBlock, 5);
    EXPECT_EQ(ctx.write.totalBlocks, 12);
  }

  TEST(wizard_context, keys_found_never_exceeds_total) {
    WizardContext ctx;
    ctx.setHfProgress("nested", 40, 32, 12);
    EXPECT_EQ(ctx.hf.keysFound, 32u);
    EXPECT_EQ(ctx.hf.keysTotal, 32u);
  }

  TEST(wizard_context, mismatches_only_kept_for_failed_verification) {
    WizardContext ctx;
    ctx.setVerification(false, { 3, 7 });
    EXPECT_EQ(ctx.verify.success, false);
    EXPECT_EQ(ctx.verify.mismatchedBlocks, (std::vector<std::uint16_t>{ 3, 7 }));

    ctx.setVerification(true, { 9 });
    EXPECT_EQ(ctx.verify.success, true);
    EXPECT_TRUE(ctx.verify.mismatchedBlocks.empty());
  }

  TEST(wizard_context, ready_to_write_needs_a_compatible_blank) {
    WizardContext ctx;
    ctx.setBlankDetected(BlankType::T5577, true, std::nullopt);
    EXPECT_FALSE(ctx.blank.readyToWrite) << "no expected blank yet";

    ctx.blank.expected = BlankType::T5577;
    ctx.setBlankDetected(BlankType::EM4305, true, std::string("EM4100"));
    EXPECT_FALSE(ctx.blank.readyToWrite);
    EXPECT_EQ(ctx.blank.existingData, "EM4100");

    ctx.blank.expected = BlankType::MagicMifareGen1a;
    ctx.setBlankDetected(BlankType::MagicMifareGen2, true, std::nullopt);
    EXPECT_TRUE(ctx.blank.readyToWrite);

    ctx.setBlankDetected(BlankType::MagicMifareGen2, false, std::nullopt);
    EXPECT_FALSE(ctx.blank.readyToWrite) << "device veto wins";
  }

  //---notification hub---------------------------------------------------------

  TEST(notification_hub, delivers_only_to_the_matching_channel) {
    NotificationHub hub;
    int writes = 0, flashes = 0;
    auto a = hub.subscribe<WriteProgressEvent>([&](const WriteProgressEvent&) { ++writes; });
    auto b = hub.subscribe<FirmwareCompleteEvent>([&](const FirmwareCompleteEvent&) { ++flashes; });

    hub.publish(WriteProgressEvent{ 0.1, std::nullopt, std::nullopt });
    hub.publish(WriteProgressEvent{ 0.2, std::nullopt, std::nullopt });
    hub.publish(HfProgressEvent{});

    EXPECT_EQ(writes, 2);
    EXPECT_EQ(flashes, 0);
    EXPECT_EQ(hub.subscriberCount(), 2u);
  }

  TEST(notification_hub, reset_subscription_stops_delivery) {
    NotificationHub hub;
    int calls = 0;
    auto sub = hub.subscribe<FirmwareFailedEvent>([&](const FirmwareFailedEvent&) { ++calls; });
    hub.publish(FirmwareFailedEvent{ "x" });
    sub.reset();
    hub.publish(FirmwareFailedEvent{ "y" });

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(sub.active());
    EXPECT_EQ(hub.subscriberCount(), 0u);
  }

  TEST(notification_hub, subscription_may_outlive_the_hub) {
    Subscription sub;
    {
      NotificationHub hub;
      sub = hub.subscribe<HfProgressEvent>([](const HfProgressEvent&) {});
      EXPECT_TRUE(sub.active());
    }
    EXPECT_FALSE(sub.active());
    sub.reset(); // no-op, registry already gone
  }

  TEST(notification_hub, teardown_waits_for_in_flight_delivery) {
    NotificationHub hub;
    std::atomic<bool> inHandler{ false };
    std::atomic<bool> handlerDone{ false };
    auto sub = hub.subscribe<WriteProgressEvent>([&](const WriteProgressEvent&) {
      inHandler = true;
      std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
      handlerDone = true;
    });

    std::thread publisher([&] { hub.publish(WriteProgressEvent{}); });
    while (!inHandler)
      std::this_thread::yield();

    sub.reset();
    EXPECT_TRUE(handlerDone) << "reset() returned while the handler was still running";
    publisher.join();
  }

  //---event bridge---------------------------------------------------------------

  TEST(event_bridge, percent_is_rescaled_and_clamped) {
    EXPECT_EQ(normalisePercent(0.42), 42);
    EXPECT_EQ(normalisePercent(1.0), 100);
    EXPECT_EQ(normalisePercent(0.0), 0);
    EXPECT_EQ(normalisePercent(57.0), 57);
    EXPECT_EQ(normalisePercent(250.0), 100);
    EXPECT_EQ(normalisePercent(-0.5), 0);
  }

  TEST(event_bridge, normalises_every_channel) {
    auto w = std::get<bridged::WriteProgress>(toBridged(WriteProgressEvent{ 0.42, 5, 12 }));
    EXPECT_EQ(w.percent, 42);
    EXPECT_EQ(w.currentBlock, 5);
    EXPECT_EQ(w.totalBlocks, 12);

    auto hf = std::get<bridged::HfProgress>(toBridged(HfProgressEvent{ "hardnested", 10, 32, 90 }));
    EXPECT_EQ(hf.phase, "hardnested");
    EXPECT_EQ(hf.keysFound, 10u);

    auto fw = std::get<bridged::FlashProgress>(toBridged(FirmwareProgressEvent{ "writing", 120, "block 9" }));
    EXPECT_EQ(fw.percent, 100);
    EXPECT_EQ(fw.message, "block 9");

    EXPECT_TRUE(std::holds_alternative<bridged::FlashComplete>(toBridged(FirmwareCompleteEvent{})));
    EXPECT_EQ(std::get<bridged::FlashFailed>(toBridged(FirmwareFailedEvent{ "crc" })).message, "crc");
  }

  TEST(event_bridge, detach_tears_down_all_subscriptions_together) {
    NotificationHub hub;
    std::vector<BridgedEvent> seen;
    EventBridge bridge(hub, [&](BridgedEvent ev) { seen.push_back(std::move(ev)); });
    EXPECT_TRUE(bridge.attached());
    EXPECT_EQ(hub.subscriberCount(), 5u);

    hub.publish(FirmwareCompleteEvent{});
    bridge.detach();
    hub.publish(FirmwareCompleteEvent{});
    hub.publish(WriteProgressEvent{ 0.5, std::nullopt, std::nullopt });

    EXPECT_EQ(seen.size(), 1u);
    EXPECT_FALSE(bridge.attached());
    EXPECT_EQ(hub.subscriberCount(), 0u);
  }

} // namespace cloneflow::test
