#pragma once
/** @file  RPCManager.hpp
 *  @brief Line-framed JSON RPC multiplexer over the link to the authoritative machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cloneflow headers
#include "core/ErrorMonitor.hpp"    // RPCManager reports link faults to the error monitor
#include "core/NotificationHub.hpp" // event lines are published here
#include "io/SerialChannel.hpp"     // RPCManager owns the channel and requires full type knowledge
#include "protocols/Response.hpp"

namespace cloneflow {
  namespace core {

    /**
 * @class RPCManager
 * @brief Owns the SerialChannel plus a reader thread that demultiplexes replies
 *        (matched to pending calls by id) from event lines (published on the hub).
 *
 *  * `call()` blocks the calling thread only; the reader keeps events flowing
 *    while a call is pending and while no call is pending at all.
 *  * Every failure surfaces as `TransportError` and is reported to ErrorMonitor.
 */
    class RPCManager {
    public:
      RPCManager(std::shared_ptr<ErrorMonitor> errMonitor, NotificationHub& hub,
                 std::unique_ptr<io::SerialChannel> channel = std::make_unique<io::SerialChannel>());
      ~RPCManager(); ///< stops the reader and closes the link

      //---public APIs------------------------------------------------------
      void connect(const std::string& devPath, speed_t baud); ///<- opens the channel, starts reader
      void disconnect();
      bool connected() const { return connected_.load(); }

      /** Send `{"id","cmd","args"}` and wait for the matching reply.
       *  @returns the reply's `ok` value; throws TransportError otherwise. */
      nlohmann::json call(const std::string& cmd, nlohmann::json args,
                          std::chrono::milliseconds timeout);

      RPCManager(const RPCManager&) = delete;
      RPCManager& operator=(const RPCManager&) = delete;

    private:
      static constexpr std::chrono::milliseconds kReadSlice{ 100 };
      static constexpr std::size_t kMaxLine = 64 * 1024;

      void readerLoop();
      void handleLine(const std::string& line);
      void failPending(const std::string& reason);
      [[noreturn]] void fail(const std::string& message);

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      NotificationHub& hub_;
      std::unique_ptr<io::SerialChannel> channel_;

      std::mutex pendingMtx_;
      std::unordered_map<std::uint64_t, std::promise<protocols::Reply>> pending_;
      std::atomic<std::uint64_t> nextId_{ 1 };

      std::thread reader_;
      std::atomic<bool> running_{ false };
      std::atomic<bool> connected_{ false };
    };

  } // namespace core
} // namespace cloneflow
