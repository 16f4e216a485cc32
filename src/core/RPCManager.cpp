/* @file RPCManager.cpp
 * @brief request/reply correlation and event fan-out over the serial link
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <iostream>
#include <string>

// cloneflow headers
#include "core/CommandGateway.hpp" // TransportError
#include "core/RPCManager.hpp"
#include "protocols/Command.hpp"

using namespace cloneflow::core;

RPCManager::RPCManager(std::shared_ptr<ErrorMonitor> errorMonitor, NotificationHub& hub,
                       std::unique_ptr<io::SerialChannel> channel)
    : errorMonitor_(std::move(errorMonitor)), hub_(hub), channel_(std::move(channel)) {
  assert(errorMonitor_ && "[RPCManager] error monitor is nullptr");
  assert(channel_ && "[RPCManager] serial channel is nullptr");
}

RPCManager::~RPCManager() { disconnect(); }

void RPCManager::connect(const std::string& devPath, speed_t baud) {
  if (connected_)
    return;
  if (reader_.joinable())
    reader_.join(); // previous reader exited on link loss

  if (!channel_->open(devPath, baud))
    fail("[RPCManager] serial device: " + devPath + " open failed");

  connected_ = true;
  running_ = true;
  reader_ = std::thread(&RPCManager::readerLoop, this);
  std::cerr << "[RPCManager] link up on " << devPath << '\n';
}

void RPCManager::disconnect() {
  running_ = false;
  if (reader_.joinable())
    reader_.join();
  // the reader only marks a lost link down; the fd is released here, after the join
  channel_->close();
  if (connected_.exchange(false))
    failPending("link closed");
}

nlohmann::json RPCManager::call(const std::string& cmd, nlohmann::json args,
                                std::chrono::milliseconds timeout) {
  if (!connected_)
    fail("[RPCManager] " + cmd + ": not connected");

  protocols::Command command;
  command.id = nextId_++;
  command.name = cmd;
  command.args = std::move(args);

  std::future<protocols::Reply> reply;
  {
    std::lock_guard<std::mutex> lock(pendingMtx_);
    reply = pending_[command.id].get_future();
  }

  const auto wire = command.toWire();
  assert(wire.size() <= kMaxLine && "[RPCManager] command exceeds line limit");

  if (!channel_->writeLine(wire)) {
    {
      std::lock_guard<std::mutex> lock(pendingMtx_);
      pending_.erase(command.id);
    }
    fail("[RPCManager] " + cmd + ": failed to write to serial device");
  }

  if (reply.wait_for(timeout) != std::future_status::ready) {
    {
      std::lock_guard<std::mutex> lock(pendingMtx_);
      pending_.erase(command.id);
    }
    fail("[RPCManager] " + cmd + ": timed out after " + std::to_string(timeout.count()) + " ms");
  }

  protocols::Reply r = reply.get();
  if (!r.ok)
    fail("[RPCManager] " + cmd + " rejected: " + r.error);
  return std::move(r.value);
}

void RPCManager::readerLoop() {
  while (running_) {
    auto line = channel_->readLine(kReadSlice);
    if (!line) {
      if (!channel_->isOpen()) {
        errorMonitor_->notifyFailure("[RPCManager] link lost");
        connected_ = false;
        failPending("link lost");
        return;
      }
      continue; // read slice elapsed
    }
    if (!line->empty())
      handleLine(*line);
  }
}

void RPCManager::handleLine(const std::string& line) {
  auto response = protocols::Response::fromWire(line);
  if (!response) {
    std::cerr << "[RPCManager] dropping unparseable line: " << line << '\n';
    return;
  }

  if (auto* note = std::get_if<protocols::Notification>(&response->body)) {
    hub_.publish(*note);
    return;
  }

  auto& reply = std::get<protocols::Reply>(response->body);
  std::lock_guard<std::mutex> lock(pendingMtx_);
  auto it = pending_.find(reply.id);
  if (it == pending_.end()) {
    std::cerr << "[RPCManager] late reply for id " << reply.id << " ignored\n";
    return;
  }
  it->second.set_value(std::move(reply));
  pending_.erase(it);
}

void RPCManager::failPending(const std::string& reason) {
  std::lock_guard<std::mutex> lock(pendingMtx_);
  for (auto& [id, promise] : pending_) {
    protocols::Reply r;
    r.id = id;
    r.error = reason;
    promise.set_value(std::move(r));
  }
  pending_.clear();
}

void RPCManager::fail(const std::string& message) {
  errorMonitor_->notifyFailure(message);
  throw TransportError(message);
}
