#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking line I/O to the authoritative machine (tty, pty or USB CDC).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace cloneflow {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames I/O as `\r\n`-terminated lines (one JSON document per line).
 *  * One reader thread and any number of writer threads may use it
 *    concurrently; writes are serialised, the receive buffer is touched by
 *    the reader only.
 *  * A hangup seen by the reader only marks the link down. The fd stays
 *    allocated until `close()`, which must not race `readLine()`.
 *  * *Non-copyable*, but move-constructible.
 */
    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO / hangup
      /** @returns the next line without CRLF, or std::nullopt on timeout,
       *  disconnect or error (check isOpen() to tell them apart). */
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0 && !hungUp_; }
      virtual void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      static constexpr std::size_t kMaxBuffered = 256 * 1024; ///< drop garbage without CRLF

      std::optional<std::string> takeLine();
      bool waitWritable(int ms);

      int fd_{ -1 };                      ///< POSIX fd (-1==closed)
      std::atomic<bool> hungUp_{ false }; ///< set by the reader on EOF / POLLHUP / read error
      std::mutex writeMtx_;               ///< one line on the wire at a time; also guards close()
      std::string rx_buffer_{};           ///< bytes received but not yet returned as a line
    };

    /// Map a numeric baud rate from config onto termios; std::nullopt if unsupported.
    std::optional<speed_t> baudFromInt(int baud);

  } // namespace io
} // namespace cloneflow
