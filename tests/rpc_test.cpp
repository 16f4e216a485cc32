// cloneflow headers
#include "core/DeviceGateway.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/NotificationHub.hpp"
#include "core/RPCManager.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/Command.hpp"

// cloneflow fakes
#include "FakeSerialChannel.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>

namespace cloneflow::test {

  using cloneflow::core::DeviceGateway;
  using cloneflow::core::ErrorMonitor;
  using cloneflow::core::NotificationHub;
  using cloneflow::core::RPCManager;
  using cloneflow::core::TransportError;
  using nlohmann::json;
  using ::testing::HasSubstr;

  class RPCManagerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();

      auto channel = std::make_unique<FakeSerialChannel>();
      fake = channel.get(); // raw ptr for assertions; the manager owns it

      // Upcast to base class for RPCManager ctor
      manager = std::make_unique<RPCManager>(std::static_pointer_cast<ErrorMonitor>(errorMonitor),
                                             hub, std::move(channel));
      manager->connect("/dev/fake", B115200);
    }

    void TearDown() override { manager->disconnect(); }

    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    NotificationHub hub;
    FakeSerialChannel* fake{ nullptr };
    std::unique_ptr<RPCManager> manager;
  };

  TEST(command, toWire_is_one_crlf_terminated_json_line) {
    protocols::Command cmd;
    cmd.id = 7;
    cmd.name = "detect_blank";
    cmd.args = json{ { "port", "/dev/ttyACM0" } };

    const auto wire = cmd.toWire();
    ASSERT_TRUE(wire.ends_with("\r\n"));
    const auto j = json::parse(wire.substr(0, wire.size() - 2));
    EXPECT_EQ(j.at("id"), 7);
    EXPECT_EQ(j.at("cmd"), "detect_blank");
    EXPECT_EQ(j.at("args").at("port"), "/dev/ttyACM0");
  }

  TEST_F(RPCManagerTest, connect_opens_channel_once) {
    EXPECT_TRUE(manager->connected());
    manager->connect("/dev/fake", B115200);
    EXPECT_EQ(fake->openCalls(), 1);
  }

  TEST_F(RPCManagerTest, call_returns_ok_value_of_matching_reply) {
    fake->responder = replyOk(json{ { "step", "Idle" } });

    const auto value = manager->call("reset_wizard", json::object(), std::chrono::milliseconds{ 1000 });

    EXPECT_EQ(value.at("step"), "Idle");
    ASSERT_EQ(fake->written().size(), 1u);
    const auto request = json::parse(fake->written().front());
    EXPECT_EQ(request.at("cmd"), "reset_wizard");
    EXPECT_TRUE(request.at("args").is_object());
  }

  TEST_F(RPCManagerTest, err_reply_throws_and_reports) {
    fake->responder = [](const json& req) {
      return std::vector<std::string>{ json{ { "id", req.at("id") }, { "err", "device busy" } }.dump() };
    };
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("device busy"))).Times(1);

    EXPECT_THROW(manager->call("scan_card", json::object(), std::chrono::milliseconds{ 1000 }),
                 TransportError);
  }

  TEST_F(RPCManagerTest, reply_without_result_fails_the_call_at_once) {
    fake->responder = [](const json& req) {
      return std::vector<std::string>{ json{ { "id", req.at("id") } }.dump() };
    };
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("malformed reply"))).Times(1);

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(manager->call("hf_autopwn", json::object(), std::chrono::milliseconds{ 60000 }),
                 TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{ 5 });
  }

  TEST_F(RPCManagerTest, missing_reply_times_out) {
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("timed out"))).Times(1);

    EXPECT_THROW(manager->call("scan_card", json::object(), std::chrono::milliseconds{ 50 }),
                 TransportError);
  }

  TEST_F(RPCManagerTest, write_failure_throws) {
    fake->writeSucceeds = false;
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("failed to write"))).Times(1);

    EXPECT_THROW(manager->call("scan_card", json::object(), std::chrono::milliseconds{ 1000 }),
                 TransportError);
  }

  TEST_F(RPCManagerTest, link_loss_fails_the_pending_call) {
    fake->hangUpOnWrite = true;

    try {
      manager->call("hf_autopwn", json::object(), std::chrono::milliseconds{ 5000 });
      FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
      EXPECT_THAT(e.what(), HasSubstr("link lost"));
    }
    EXPECT_FALSE(manager->connected());
  }

  TEST_F(RPCManagerTest, call_after_disconnect_throws) {
    manager->disconnect();
    EXPECT_THROW(manager->call("scan_card", json::object(), std::chrono::milliseconds{ 10 }),
                 TransportError);
  }

  TEST_F(RPCManagerTest, event_lines_are_published_on_the_hub) {
    std::promise<protocols::WriteProgressEvent> received;
    auto sub = hub.subscribe<protocols::WriteProgressEvent>(
        [&received](const protocols::WriteProgressEvent& e) { received.set_value(e); });

    fake->feed(R"({"event":"write-progress","payload":{"progress":0.5,"current_block":3,"total_blocks":8}})");

    auto future = received.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds{ 2 }), std::future_status::ready);
    const auto e = future.get();
    EXPECT_DOUBLE_EQ(e.progress, 0.5);
    EXPECT_EQ(e.currentBlock, 3);
    EXPECT_EQ(e.totalBlocks, 8);
  }

  TEST_F(RPCManagerTest, garbage_and_late_replies_are_ignored) {
    fake->feed("not json at all");
    fake->feed(R"({"id":999,"ok":{"step":"Idle"}})");
    fake->responder = replyOk(json{ { "step", "Idle" } });

    EXPECT_NO_THROW(manager->call("reset_wizard", json::object(), std::chrono::milliseconds{ 1000 }));
  }

  //---DeviceGateway over the same fake link----------------------------------

  class DeviceGatewayTest : public RPCManagerTest {
  protected:
    json lastRequest() const { return json::parse(fake->written().back()); }
  };

  TEST_F(DeviceGatewayTest, detectDevice_decodes_device_connected) {
    fake->responder = replyOk(
        json{ { "step", "DeviceConnected" },
              { "data", { { "port", "COM3" }, { "model", "PM3 RDV4" }, { "firmware", "v4.18" } } } });
    DeviceGateway gateway(*manager);

    const auto outcome = gateway.detectDevice();

    const auto* dev = std::get_if<protocols::step::DeviceConnected>(&outcome);
    ASSERT_NE(dev, nullptr);
    EXPECT_EQ(dev->port, "COM3");
    EXPECT_EQ(dev->model, "PM3 RDV4");
    EXPECT_EQ(lastRequest().at("cmd"), "detect_device");
  }

  TEST_F(DeviceGatewayTest, writeClone_sends_snake_case_arguments) {
    fake->responder = replyOk(json{ { "step", "Verifying" } });
    DeviceGateway gateway(*manager);

    core::WriteRequest req;
    req.port = "/dev/ttyACM0";
    req.cardType = protocols::CardType::HIDProx;
    req.uid = "2006EC0C86";
    req.decoded = { { "facility_code", "118" } };
    req.blankType = protocols::BlankType::T5577;
    const auto outcome = gateway.writeClone(req);

    EXPECT_TRUE(std::holds_alternative<protocols::step::Verifying>(outcome));
    const auto request = lastRequest();
    EXPECT_EQ(request.at("cmd"), "write_clone_with_data");
    EXPECT_EQ(request.at("args").at("card_type"), "HIDProx");
    EXPECT_EQ(request.at("args").at("uid"), "2006EC0C86");
    EXPECT_EQ(request.at("args").at("blank_type"), "T5577");
    EXPECT_EQ(request.at("args").at("decoded").at("facility_code"), "118");
  }

  TEST_F(DeviceGatewayTest, domain_error_is_an_outcome_not_an_exception) {
    fake->responder = replyOk(json{ { "step", "Error" },
                                    { "data",
                                      { { "message", "no tag" },
                                        { "user_message", "Place a card" },
                                        { "recoverable", true },
                                        { "recovery_action", "Retry" } } } });
    DeviceGateway gateway(*manager);

    const auto outcome = gateway.scanCard();

    const auto* err = std::get_if<protocols::step::Error>(&outcome);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->userMessage, "Place a card");
    EXPECT_EQ(err->recoveryAction, protocols::RecoveryAction::Retry);
  }

  TEST_F(DeviceGatewayTest, unknown_step_tag_is_a_transport_error) {
    fake->responder = replyOk(json{ { "step", "Dancing" } });
    DeviceGateway gateway(*manager);

    EXPECT_THROW(gateway.scanCard(), TransportError);
  }

  TEST_F(DeviceGatewayTest, checkFirmwareVersion_reads_camel_case_reply) {
    fake->responder = replyOk(json{ { "matched", false },
                                    { "clientVersion", "v4.20" },
                                    { "deviceFirmwareVersion", "v4.18" },
                                    { "hardwareVariant", "rdv4" },
                                    { "firmwarePathExists", true } });
    DeviceGateway gateway(*manager);

    const auto check = gateway.checkFirmwareVersion("/dev/ttyACM0");

    EXPECT_FALSE(check.matched);
    EXPECT_EQ(check.deviceVersion, "v4.18");
    EXPECT_EQ(check.hardwareVariant, "rdv4");
    EXPECT_TRUE(check.imageExists);
    EXPECT_EQ(lastRequest().at("args").at("port"), "/dev/ttyACM0");
  }

  TEST_F(DeviceGatewayTest, wizardAction_wraps_the_tagged_action) {
    fake->responder = replyOk(json{ { "step", "WaitingForBlank" },
                                    { "data", { { "expected_blank", "EM4305" } } } });
    DeviceGateway gateway(*manager);

    gateway.wizardAction(protocols::action::ProceedToWrite{ protocols::BlankType::EM4305 });

    const auto request = lastRequest();
    EXPECT_EQ(request.at("cmd"), "wizard_action");
    EXPECT_EQ(request.at("args").at("action").at("action"), "ProceedToWrite");
    EXPECT_EQ(request.at("args").at("action").at("payload").at("blank_type"), "EM4305");
  }

} // namespace cloneflow::test
