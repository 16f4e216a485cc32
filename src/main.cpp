/* @file main.cpp
 * @brief cloneflow CLI: one workflow intent per stdin line, transitions on stdout
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

// cloneflow headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceGateway.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Executor.hpp"
#include "core/HistoryLogger.hpp"
#include "core/NotificationHub.hpp"
#include "core/Orchestrator.hpp"
#include "core/RPCManager.hpp"
#include "core/Settings.hpp"
#include "io/SerialChannel.hpp"

using namespace cloneflow;

namespace {

  using Intent = std::function<void(core::Orchestrator&, const std::string& arg)>;

  const std::map<std::string, Intent>& intents() {
    static const std::map<std::string, Intent> table{
      { "detect", [](core::Orchestrator& o, const std::string&) { o.detect(); } },
      { "scan", [](core::Orchestrator& o, const std::string&) { o.scan(); } },
      { "blank",
        [](core::Orchestrator& o, const std::string& arg) {
          if (auto blank = protocols::parseBlankType(arg))
            o.skipToBlank(*blank);
          else
            std::cerr << "[cloneflow] unknown blank type '" << arg << "'\n";
        } },
      { "hf", [](core::Orchestrator& o, const std::string&) { o.startHfProcess(); } },
      { "hf-cancel", [](core::Orchestrator& o, const std::string&) { o.cancelHf(); } },
      { "write", [](core::Orchestrator& o, const std::string&) { o.write(); } },
      { "finish", [](core::Orchestrator& o, const std::string&) { o.finish(); } },
      { "retry", [](core::Orchestrator& o, const std::string&) { o.recover(); } },
      { "reset", [](core::Orchestrator& o, const std::string&) { o.reset(); } },
      { "soft-reset", [](core::Orchestrator& o, const std::string&) { o.softReset(); } },
      { "back", [](core::Orchestrator& o, const std::string&) { o.backToScan(); } },
      { "disconnect", [](core::Orchestrator& o, const std::string&) { o.disconnect(); } },
      { "redetect-blank", [](core::Orchestrator& o, const std::string&) { o.reDetectBlank(); } },
      { "fw-update", [](core::Orchestrator& o, const std::string&) { o.updateFirmware(); } },
      { "fw-skip", [](core::Orchestrator& o, const std::string&) { o.skipFirmware(); } },
      { "fw-cancel", [](core::Orchestrator& o, const std::string&) { o.cancelFirmware(); } },
      { "variant", [](core::Orchestrator& o, const std::string& arg) { o.selectVariant(arg); } },
    };
    return table;
  }

  core::Settings loadSettings(int argc, char** argv) {
    if (argc < 2)
      return core::Settings{};
    return core::Settings::fromJson(core::ConfigLoader(argv[1]).load());
  }

  /// Printed on the loop thread after each transition.
  void describe(core::State from, core::State to, const core::WizardContext& ctx) {
    std::cout << core::toString(from) << " -> " << core::toString(to);
    if (to == core::State::Error && ctx.error) {
      std::cout << "  [" << core::toString(ctx.error->source) << "] " << ctx.error->userMessage;
      if (ctx.error->recoveryAction)
        std::cout << " (" << protocols::toString(*ctx.error->recoveryAction) << ")";
    } else if (to == core::State::DeviceConnected && ctx.device) {
      std::cout << "  " << ctx.device->model << " on " << ctx.device->port;
    } else if (to == core::State::CredentialIdentified && ctx.credential) {
      std::cout << "  " << protocols::displayName(ctx.credential->cardType) << " "
                << ctx.credential->data.uid;
    } else if (to == core::State::FirmwareOutdated) {
      std::cout << "  device " << ctx.firmware.deviceVersion << ", client "
                << ctx.firmware.clientVersion << ", variant " << ctx.firmware.hardwareVariant;
    }
    std::cout << std::endl;
  }

} // namespace

int main(int argc, char** argv) {
  core::Settings settings;
  try {
    settings = loadSettings(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[cloneflow] config: " << e.what() << '\n';
    return 1;
  }

  auto monitor = std::make_shared<core::ErrorMonitor>();
  monitor->registerEscalation([](const std::string& msg) { std::cout << "! " << msg << std::endl; });

  core::NotificationHub hub;
  core::RPCManager rpc(monitor, hub);
  try {
    rpc.connect(settings.linkDevice, *io::baudFromInt(settings.linkBaud)); // validated by fromJson
  } catch (const std::exception& e) {
    std::cerr << "[cloneflow] " << e.what() << '\n';
    return 2;
  }

  auto gateway = std::make_shared<core::DeviceGateway>(rpc, settings.timeouts);
  std::shared_ptr<core::HistoryLogger> history;
  if (!settings.historyPath.empty())
    history = std::make_shared<core::HistoryLogger>(settings.historyPath);

  {
    core::WorkerExecutor executor;
    core::WorkerExecutor abortExecutor; // cancels must not queue behind hf_autopwn / hf_dump
    core::Orchestrator orchestrator(gateway, executor, abortExecutor, hub, monitor, history,
                                    settings.timers);
    orchestrator.onTransition([&orchestrator](core::State from, core::State to) {
      describe(from, to, orchestrator.context());
    });
    orchestrator.start();

    std::thread loopThread([&orchestrator] { orchestrator.loop().run(); });

    std::string line;
    while (std::getline(std::cin, line)) {
      std::istringstream words(line);
      std::string verb, arg;
      words >> verb >> arg;
      if (verb.empty())
        continue;
      if (verb == "quit")
        break;

      const auto it = intents().find(verb);
      if (it == intents().end()) {
        std::cerr << "[cloneflow] unknown command '" << verb << "'\n";
        continue;
      }
      it->second(orchestrator, arg);
    }

    orchestrator.shutdown();
    orchestrator.loop().stop();
    loopThread.join();

    // fails any call still in flight so the executor's worker can be joined
    rpc.disconnect();
  }
  return 0;
}
