// cloneflow headers
#include "protocols/CardTypes.hpp"
#include "protocols/Json.hpp"
#include "protocols/Response.hpp"
#include "protocols/WizardAction.hpp"
#include "protocols/WizardState.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace cloneflow::test {

  using namespace cloneflow::protocols;
  using nlohmann::json;

  TEST(card_catalogue, lookups_follow_the_table) {
    EXPECT_EQ(frequencyOf(CardType::HIDProx), Frequency::LF);
    EXPECT_EQ(frequencyOf(CardType::MifareClassic4K), Frequency::HF);
    EXPECT_STREQ(displayName(CardType::FDX_B), "FDX-B");
    EXPECT_STREQ(toString(CardType::FDX_B), "FDX_B");
    EXPECT_FALSE(isCloneable(CardType::COTAG));
    EXPECT_FALSE(isCloneable(CardType::DESFire));
    EXPECT_EQ(recommendedBlank(CardType::NTAG), BlankType::MagicUltralight);
    EXPECT_EQ(recommendedBlank(CardType::EM4100), BlankType::T5577);
  }

  TEST(card_catalogue, only_mifare_classic_needs_key_recovery) {
    EXPECT_TRUE(needsKeyRecovery(CardType::MifareClassic1K));
    EXPECT_TRUE(needsKeyRecovery(CardType::MifareClassic4K));
    EXPECT_FALSE(needsKeyRecovery(CardType::MifareUltralight));
    EXPECT_FALSE(needsKeyRecovery(CardType::IClass));
  }

  TEST(card_catalogue, magic_mifare_generations_are_interchangeable) {
    EXPECT_TRUE(isBlankCompatible(BlankType::T5577, BlankType::T5577));
    EXPECT_TRUE(isBlankCompatible(BlankType::MagicMifareGen1a, BlankType::MagicMifareGen4GTU));
    EXPECT_FALSE(isBlankCompatible(BlankType::T5577, BlankType::EM4305));
    EXPECT_FALSE(isBlankCompatible(BlankType::MagicMifareGen1a, BlankType::MagicUltralight));
  }

  TEST(card_catalogue, parse_rejects_unknown_names) {
    EXPECT_EQ(parseCardType("Indala"), CardType::Indala);
    EXPECT_FALSE(parseCardType("indala"));
    EXPECT_EQ(parseBlankType("IClassBlank"), BlankType::IClassBlank);
    EXPECT_FALSE(parseBlankType("Gen1a"));
    EXPECT_EQ(parseRecoveryAction("Reconnect"), RecoveryAction::Reconnect);
    EXPECT_TRUE(isKnownHardwareVariant("rdv4-bt"));
    EXPECT_FALSE(isKnownHardwareVariant("unknown"));
  }

  TEST(wire_codec, decodes_credential_identified) {
    const auto j = json::parse(R"({"step":"CardIdentified","data":{
        "frequency":"LF","card_type":"EM4100","cloneable":true,"recommended_blank":"T5577",
        "card_data":{"uid":"0F0368568B","raw":"FF8000","decoded":{"id":"0F0368568B"}}}})");

    const auto state = decodeState(j);

    const auto* card = std::get_if<step::CardIdentified>(&state);
    ASSERT_NE(card, nullptr);
    EXPECT_EQ(card->cardType, CardType::EM4100);
    EXPECT_EQ(card->cardData.uid, "0F0368568B");
    EXPECT_EQ(card->cardData.decoded.at("id"), "0F0368568B");
    EXPECT_EQ(stepName(state), "CardIdentified");
  }

  TEST(wire_codec, credential_without_derived_fields_uses_catalogue) {
    const auto j = json::parse(
        R"({"step":"CardIdentified","data":{"card_type":"MifareClassic1K","card_data":{"uid":"A1B2C3D4"}}})");

    const auto card = std::get<step::CardIdentified>(decodeState(j));

    EXPECT_EQ(card.frequency, Frequency::HF);
    EXPECT_TRUE(card.cloneable);
    EXPECT_EQ(card.recommendedBlank, BlankType::MagicMifareGen1a);
  }

  TEST(wire_codec, error_outcome_keeps_missing_recovery_action_empty) {
    const auto j = json::parse(R"({"step":"Error","data":{"message":"tag lost","recoverable":false}})");

    const auto err = std::get<step::Error>(decodeState(j));

    EXPECT_EQ(err.message, "tag lost");
    EXPECT_EQ(err.userMessage, "tag lost");
    EXPECT_FALSE(err.recoverable);
    EXPECT_FALSE(err.recoveryAction.has_value());
  }

  TEST(wire_codec, dataless_steps_need_no_data) {
    EXPECT_TRUE(std::holds_alternative<step::Verifying>(decodeState(json{ { "step", "Verifying" } })));
    EXPECT_EQ(encodeState(step::Idle{}), json({ { "step", "Idle" } }));
  }

  TEST(wire_codec, unknown_tags_and_names_are_rejected) {
    EXPECT_THROW(decodeState(json{ { "step", "Teleporting" } }), std::invalid_argument);
    EXPECT_THROW(decodeState(json::parse(R"({"step":"WaitingForBlank","data":{"expected_blank":"Paper"}})")),
                 std::invalid_argument);
    EXPECT_THROW(decodeState(json::parse(R"({"step":"DeviceConnected","data":{}})")),
                 json::exception);
    EXPECT_THROW(decodeNotification("beep", json::object()), std::invalid_argument);
  }

  TEST(wire_codec, load_saved_card_payload_is_flat) {
    SavedCard card;
    card.name = "office";
    card.frequency = Frequency::LF;
    card.cardType = CardType::AWID;
    card.data = CardData{ "2004A1", "", { { "fc", "50" } } };
    card.recommendedBlank = BlankType::T5577;

    const auto j = encodeAction(action::LoadSavedCard{ card });

    EXPECT_EQ(j.at("action"), "LoadSavedCard");
    EXPECT_EQ(j.at("payload").at("card_type"), "AWID");
    EXPECT_EQ(j.at("payload").at("uid"), "2004A1");
    EXPECT_EQ(j.at("payload").at("recommended_blank"), "T5577");
    EXPECT_EQ(actionName(action::LoadSavedCard{ card }), "LoadSavedCard");
  }

  TEST(wire_codec, mark_complete_carries_both_summaries) {
    const auto j = encodeAction(action::MarkComplete{ { "EM4100", "0F03", "EM4100" },
                                                      { "T5577", "0F03", "T5577" } });

    EXPECT_EQ(j.at("payload").at("source").at("card_type"), "EM4100");
    EXPECT_EQ(j.at("payload").at("target").at("display_name"), "T5577");
    EXPECT_FALSE(encodeAction(action::Reset{}).contains("payload"));
  }

  TEST(response, classifies_replies_and_events) {
    auto ok = Response::fromWire(R"({"id":4,"ok":{"step":"Idle"}})");
    ASSERT_TRUE(ok);
    const auto& reply = std::get<Reply>(ok->body);
    EXPECT_EQ(reply.id, 4u);
    EXPECT_TRUE(reply.ok);

    auto err = Response::fromWire(R"({"id":5,"err":"busy"})");
    ASSERT_TRUE(err);
    EXPECT_FALSE(std::get<Reply>(err->body).ok);
    EXPECT_EQ(std::get<Reply>(err->body).error, "busy");

    auto ev = Response::fromWire(R"({"event":"firmware-failed","payload":{"message":"bad crc"}})");
    ASSERT_TRUE(ev);
    const auto& note = std::get<Notification>(ev->body);
    EXPECT_EQ(channelName(note), "firmware-failed");
    EXPECT_EQ(std::get<FirmwareFailedEvent>(note).message, "bad crc");
  }

  TEST(response, malformed_lines_are_dropped) {
    EXPECT_FALSE(Response::fromWire("{"));
    EXPECT_FALSE(Response::fromWire("[1,2]"));
    EXPECT_FALSE(Response::fromWire(R"({"id":-1,"ok":1})"));
    EXPECT_FALSE(Response::fromWire(R"({"event":"write-progress","payload":{}})"));
  }

  TEST(response, reply_without_ok_or_err_is_an_error_reply) {
    auto r = Response::fromWire(R"({"id":1})");
    ASSERT_TRUE(r);
    const auto& reply = std::get<Reply>(r->body);
    EXPECT_EQ(reply.id, 1u);
    EXPECT_FALSE(reply.ok);
    EXPECT_EQ(reply.error, "malformed reply");
  }

} // namespace cloneflow::test
