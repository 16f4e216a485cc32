/* @file DeviceGateway.cpp
 * @brief command names / argument shapes of the device-side machine
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// cloneflow headers
#include "core/DeviceGateway.hpp"
#include "protocols/Json.hpp"

using namespace cloneflow::core;
using namespace cloneflow::protocols;
using nlohmann::json;

namespace {

  json hfCloneArgs(const HfCloneRequest& req) {
    return json{ { "source_uid", req.uid },
                 { "card_type", req.cardType },
                 { "blank_type", req.blankType } };
  }

} // namespace

DeviceGateway::DeviceGateway(RPCManager& rpc, GatewayTimeouts timeouts)
    : rpc_(rpc), timeouts_(timeouts) {}

WizardState DeviceGateway::detectDevice() {
  return callState("detect_device", json::object(), timeouts_.standard);
}

WizardState DeviceGateway::scanCard() {
  return callState("scan_card", json::object(), timeouts_.standard);
}

WizardState DeviceGateway::detectBlank(const std::string& port) {
  return callState("detect_blank", json{ { "port", port } }, timeouts_.standard);
}

WizardState DeviceGateway::writeClone(const WriteRequest& req) {
  json args{ { "port", req.port },
             { "card_type", req.cardType },
             { "uid", req.uid },
             { "decoded", req.decoded } };
  if (req.blankType)
    args["blank_type"] = *req.blankType;
  return callState("write_clone_with_data", std::move(args), timeouts_.write);
}

WizardState DeviceGateway::verifyClone(const VerifyRequest& req) {
  json args{ { "port", req.port }, { "source_uid", req.uid }, { "source_card_type", req.cardType } };
  if (req.decoded)
    args["source_decoded"] = *req.decoded;
  if (req.blankType)
    args["blank_type"] = *req.blankType;
  return callState("verify_clone", std::move(args), timeouts_.verify);
}

WizardState DeviceGateway::hfAutopwn() {
  return callState("hf_autopwn", json::object(), timeouts_.hfProcess);
}

WizardState DeviceGateway::hfDump() {
  return callState("hf_dump", json::object(), timeouts_.hfProcess);
}

WizardState DeviceGateway::hfWriteClone(const HfCloneRequest& req) {
  return callState("hf_write_clone", hfCloneArgs(req), timeouts_.write);
}

WizardState DeviceGateway::hfVerifyClone(const HfCloneRequest& req) {
  return callState("hf_verify_clone", hfCloneArgs(req), timeouts_.verify);
}

void DeviceGateway::cancelHfOperation() {
  rpc_.call("cancel_hf_operation", json::object(), timeouts_.control);
}

FirmwareCheck DeviceGateway::checkFirmwareVersion(const std::string& port) {
  auto value = rpc_.call("check_firmware_version", json{ { "port", port } }, timeouts_.standard);
  try {
    return value.get<FirmwareCheck>();
  } catch (const std::exception& e) {
    throw TransportError(std::string("check_firmware_version: malformed reply: ") + e.what());
  }
}

void DeviceGateway::flashFirmware(const std::string& port, const std::string& hardwareVariant) {
  rpc_.call("flash_firmware", json{ { "port", port }, { "hardware_variant", hardwareVariant } },
            timeouts_.control);
}

void DeviceGateway::cancelFlash() { rpc_.call("cancel_flash", json::object(), timeouts_.control); }

WizardState DeviceGateway::resetWizard() { return wizardAction(action::Reset{}); }

WizardState DeviceGateway::wizardAction(const WizardAction& a) {
  return callState("wizard_action", json{ { "action", encodeAction(a) } }, timeouts_.control);
}

WizardState DeviceGateway::callState(const char* cmd, json args, std::chrono::milliseconds timeout) {
  auto value = rpc_.call(cmd, std::move(args), timeout);
  try {
    return decodeState(value);
  } catch (const std::exception& e) {
    throw TransportError(std::string(cmd) + ": malformed reply: " + e.what());
  }
}
