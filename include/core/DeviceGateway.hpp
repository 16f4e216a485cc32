#pragma once
/** @file  DeviceGateway.hpp
 *  @brief CommandGateway implementation that speaks the JSON RPC of the device-side machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>

#include "core/CommandGateway.hpp"
#include "core/RPCManager.hpp"
#include "core/Settings.hpp"

namespace cloneflow {
  namespace core {

    /**
 * @class DeviceGateway
 * @brief Maps each typed operation onto one `RPCManager::call` and decodes the reply.
 *
 *  * A reply that does not decode is a TransportError, same as a lost link.
 *  * Holds the RPCManager by reference; it must outlive the gateway.
 */
    class DeviceGateway : public CommandGateway {
    public:
      explicit DeviceGateway(RPCManager& rpc, GatewayTimeouts timeouts = {});

      protocols::WizardState detectDevice() override;
      protocols::WizardState scanCard() override;
      protocols::WizardState detectBlank(const std::string& port) override;
      protocols::WizardState writeClone(const WriteRequest& req) override;
      protocols::WizardState verifyClone(const VerifyRequest& req) override;

      protocols::WizardState hfAutopwn() override;
      protocols::WizardState hfDump() override;
      protocols::WizardState hfWriteClone(const HfCloneRequest& req) override;
      protocols::WizardState hfVerifyClone(const HfCloneRequest& req) override;
      void cancelHfOperation() override;

      protocols::FirmwareCheck checkFirmwareVersion(const std::string& port) override;
      void flashFirmware(const std::string& port, const std::string& hardwareVariant) override;
      void cancelFlash() override;

      protocols::WizardState resetWizard() override;
      protocols::WizardState wizardAction(const protocols::WizardAction& action) override;

    private:
      protocols::WizardState callState(const char* cmd, nlohmann::json args,
                                       std::chrono::milliseconds timeout);

      RPCManager& rpc_;
      GatewayTimeouts timeouts_;
    };

  } // namespace core
} // namespace cloneflow
