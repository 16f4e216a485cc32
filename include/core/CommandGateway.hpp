#pragma once
/** @file  CommandGateway.hpp
 *  @brief Typed request/response boundary to the authoritative device machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

// cloneflow headers
#include "protocols/CardTypes.hpp"
#include "protocols/WizardAction.hpp"
#include "protocols/WizardState.hpp"

namespace cloneflow::core {

  /**
 * @class TransportError
 * @brief The call itself was rejected: I/O, framing, decoding, timeout, link loss,
 *        or an `err` reply. Domain failures are `step::Error` values instead.
 */
  class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  struct WriteRequest {
    std::string port;
    protocols::CardType cardType{ protocols::CardType::EM4100 };
    std::string uid;
    std::map<std::string, std::string> decoded;
    std::optional<protocols::BlankType> blankType;
  };

  struct VerifyRequest {
    std::string port;
    std::string uid;
    protocols::CardType cardType{ protocols::CardType::EM4100 };
    std::optional<std::map<std::string, std::string>> decoded; ///< enables field-level compare
    std::optional<protocols::BlankType> blankType;
  };

  /// Dump-based HF write / verify parameters.
  struct HfCloneRequest {
    std::string uid;
    protocols::CardType cardType{ protocols::CardType::MifareClassic1K };
    protocols::BlankType blankType{ protocols::BlankType::MagicMifareGen1a };
  };

  /**
 * @class CommandGateway
 * @brief One blocking call per orchestrator-invoked operation.
 *
 *  * Every method either returns the authoritative result or throws
 *    `TransportError`; other exceptions are treated the same by callers.
 *  * Calls are issued from a single executor thread, except `cancelHfOperation`
 *    and `cancelFlash`, which may run on a second thread while another call
 *    is blocked. Implementations must allow that overlap.
 */
  class CommandGateway {
  public:
    virtual ~CommandGateway() = default;

    virtual protocols::WizardState detectDevice() = 0;
    virtual protocols::WizardState scanCard() = 0;
    virtual protocols::WizardState detectBlank(const std::string& port) = 0;
    virtual protocols::WizardState writeClone(const WriteRequest& req) = 0;
    virtual protocols::WizardState verifyClone(const VerifyRequest& req) = 0;

    virtual protocols::WizardState hfAutopwn() = 0;
    virtual protocols::WizardState hfDump() = 0;
    virtual protocols::WizardState hfWriteClone(const HfCloneRequest& req) = 0;
    virtual protocols::WizardState hfVerifyClone(const HfCloneRequest& req) = 0;
    virtual void cancelHfOperation() = 0;

    virtual protocols::FirmwareCheck checkFirmwareVersion(const std::string& port) = 0;
    /// Returns once the flash has started; progress arrives as notifications.
    virtual void flashFirmware(const std::string& port, const std::string& hardwareVariant) = 0;
    virtual void cancelFlash() = 0;

    virtual protocols::WizardState resetWizard() = 0;
    virtual protocols::WizardState wizardAction(const protocols::WizardAction& action) = 0;
  };

} // namespace cloneflow::core
