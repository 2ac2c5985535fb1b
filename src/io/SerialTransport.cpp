/* @file SerialTransport.cpp
 * @brief background reader + serialised writer on top of SerialChannel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// tvlink headers
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/SerialTransport.hpp"

using namespace tvlink::io;
using tvlink::core::ConnectionError;
using tvlink::core::IOError;

namespace {
  constexpr const char* kSource = "SerialTransport";
}

SerialTransport::SerialTransport(std::shared_ptr<core::Logger> logger,
                                 std::shared_ptr<core::ErrorMonitor> errMonitor,
                                 std::unique_ptr<SerialChannel> channel)
    : logger_(std::move(logger)), errorMonitor_(std::move(errMonitor)),
      channel_(std::move(channel)) {
  if (!logger_ || !errorMonitor_ || !channel_)
    throw std::invalid_argument("[SerialTransport] logger, error monitor and channel are required");
}

SerialTransport::~SerialTransport() { close(); }

void SerialTransport::open(const std::string& path, int baud, const FrameConfig& frame) {
  close();

  if (!channel_->open(path, baud, frame)) {
    std::string errMsg = "[SerialTransport] open " + path + " failed: " + channel_->lastError();
    logger_->error(kSource, errMsg);
    errorMonitor_->notifyFailure(errMsg);
    throw ConnectionError(errMsg);
  }

  path_ = path;
  running_ = true;
  reader_ = std::thread(&SerialTransport::readLoop, this);
  logger_->info(kSource, "opened " + path + " at " + std::to_string(baud) + " baud");
}

void SerialTransport::close() {
  running_ = false;
  if (reader_.joinable())
    reader_.join();

  std::lock_guard<std::mutex> lock(writeMtx_);
  if (channel_->isOpen() || !path_.empty()) {
    channel_->close();
    if (!path_.empty())
      logger_->info(kSource, "closed " + path_);
    path_.clear();
  }
}

bool SerialTransport::isOpen() const { return channel_->isOpen(); }

void SerialTransport::write(const std::string& bytes) {
  std::lock_guard<std::mutex> lock(writeMtx_);
  if (!channel_->write(bytes)) {
    std::string errMsg = "[SerialTransport] write failed: " + channel_->lastError();
    logger_->warn(kSource, errMsg);
    throw IOError(errMsg);
  }
}

Transport::SubscriptionId SerialTransport::subscribe(LineHandler onLine) {
  std::lock_guard<std::mutex> lock(handlersMtx_);
  const SubscriptionId id = nextId_++;
  handlers_.emplace_back(id, std::move(onLine));
  return id;
}

void SerialTransport::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(handlersMtx_);
  handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                 [id](const auto& h) { return h.first == id; }),
                  handlers_.end());
}

void SerialTransport::readLoop() {
  while (running_) {
    auto line = channel_->readLine(kReadSlice);
    if (line) {
      publish(*line);
      continue;
    }

    if (!channel_->isOpen()) {
      std::string errMsg = "[SerialTransport] link " + path_ + " lost: " + channel_->lastError();
      logger_->error(kSource, errMsg);
      errorMonitor_->notifyFailure(errMsg);
      running_ = false;
    }
  }
}

void SerialTransport::publish(const std::string& line) {
  // handlers run under the lock so unsubscribe() can't race a delivery in flight
  std::lock_guard<std::mutex> lock(handlersMtx_);
  for (auto& [id, handler] : handlers_) {
    try {
      handler(line);
    } catch (const std::exception& e) {
      logger_->error(kSource, "line handler " + std::to_string(id) + " threw: " + e.what());
    }
  }
}
