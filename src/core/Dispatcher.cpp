/* @file Dispatcher.cpp
 * @brief queue + single-flight dispatch + line correlation + response watchdog
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>
#include <utility>

// tvlink headers
#include "core/Dispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"

using namespace tvlink::core;

namespace {

  constexpr const char* kSource = "Dispatcher";

  /// "POWR1   \r" → "POWR1   \\r" for log lines.
  std::string printable(const std::string& frame) {
    std::string out;
    out.reserve(frame.size() + 4);
    for (char c : frame) {
      if (c == '\r')
        out += "\\r";
      else if (c == '\n')
        out += "\\n";
      else
        out += c;
    }
    return out;
  }

  DispatcherOptions clamped(DispatcherOptions options) {
    if (options.responseTimeout > DispatcherOptions::kMaxResponseTimeout)
      options.responseTimeout = DispatcherOptions::kMaxResponseTimeout;
    return options;
  }

} // namespace

const char* tvlink::core::toString(Dispatcher::State state) {
  return state == Dispatcher::State::Idle ? "Idle" : "Busy";
}

Dispatcher::Dispatcher(io::Transport& transport, std::shared_ptr<Logger> logger,
                       std::shared_ptr<ErrorMonitor> errMonitor, DispatcherOptions options)
    : transport_(transport), logger_(std::move(logger)), errorMonitor_(std::move(errMonitor)),
      options_(clamped(options)) {
  if (!logger_ || !errorMonitor_)
    throw std::invalid_argument("[Dispatcher] logger and error monitor are required");

  if (options_.responseTimeout != options.responseTimeout)
    logger_->warn(kSource, "response timeout clamped to " +
                               std::to_string(options_.responseTimeout.count()) + " ms");

  worker_ = std::thread(&Dispatcher::workerLoop, this);

  // last: line events may start arriving as soon as we are subscribed
  subscription_ = transport_.subscribe([this](const std::string& line) { onLine(line); });
}

Dispatcher::~Dispatcher() {
  transport_.unsubscribe(subscription_);
  shutdown();

  {
    std::lock_guard<std::mutex> lock(mtx_);
    exiting_ = true;
    cv_.notify_all();
  }
  if (worker_.joinable())
    worker_.join();
}

void Dispatcher::send(std::string payload, ResponseHandler onResponse) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (stopping_) {
    completions_.push_back(
        { std::move(onResponse), Reply::failure(ErrorKind::Shutdown, "dispatcher shut down") });
  } else if (options_.maxQueueDepth > 0 && queue_.size() >= options_.maxQueueDepth) {
    ++stats_.rejected;
    logger_->warn(kSource, "queue full (" + std::to_string(queue_.size()) + "), rejecting " +
                               printable(payload));
    completions_.push_back({ std::move(onResponse),
                             Reply::failure(ErrorKind::Rejected, "command queue full") });
  } else {
    queue_.push_back({ std::move(payload), std::move(onResponse) });
    dispatchNextLocked(); // no-op while busy
  }
  cv_.notify_all();
}

void Dispatcher::onLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!current_) {
    ++stats_.discardedLines;
    logger_->debug(kSource, "discarding unsolicited line '" + printable(line) + "'");
    return;
  }

  ++stats_.answered;
  logger_->debug(kSource, "got '" + printable(line) + "' for " +
                              printable(current_->command.payload));
  resolveCurrentLocked(Reply::success(line));
  dispatchNextLocked();
}

void Dispatcher::shutdown() {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!stopping_) {
    stopping_ = true;
    if (current_)
      resolveCurrentLocked(Reply::failure(ErrorKind::Shutdown, "dispatcher shut down"));
    for (auto& p : queue_)
      completions_.push_back(
          { std::move(p.onResponse), Reply::failure(ErrorKind::Shutdown, "dispatcher shut down") });
    queue_.clear();
    cv_.notify_all();
  }

  // from a handler the worker is this thread; it drains once we return
  if (worker_.get_id() == std::this_thread::get_id())
    return;
  cv_.wait(lock, [this] { return completions_.empty() && faults_.empty() && !delivering_; });
}

Dispatcher::State Dispatcher::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return current_ ? State::Busy : State::Idle;
}

std::size_t Dispatcher::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

Dispatcher::Stats Dispatcher::stats() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return stats_;
}

// -------------------------------------------------------------------
// Dispatcher::dispatchNextLocked
// Idle + non-empty queue → pop head, write it, become Busy.
// A failed write resolves that command and tries the next one.
// -------------------------------------------------------------------
void Dispatcher::dispatchNextLocked() {
  while (!current_ && !queue_.empty() && !stopping_) {
    Pending next = std::move(queue_.front());
    queue_.pop_front();
    ++stats_.dispatched;

    try {
      transport_.write(next.payload);
    } catch (const std::exception& e) {
      ++stats_.writeFailures;
      std::string errMsg = "[Dispatcher] write of " + printable(next.payload) + " failed: " + e.what();
      logger_->warn(kSource, errMsg);
      faults_.push_back(errMsg);
      completions_.push_back({ std::move(next.onResponse), Reply::failure(ErrorKind::IO, e.what()) });
      continue;
    }

    logger_->debug(kSource, "sent " + printable(next.payload) + " (" +
                                std::to_string(queue_.size()) + " queued)");
    current_ = InFlight{ std::move(next), Clock::now() + options_.responseTimeout };
  }
  cv_.notify_all(); // arm the deadline, wake the worker for new completions
}

void Dispatcher::resolveCurrentLocked(Reply reply) {
  completions_.push_back({ std::move(current_->command.onResponse), std::move(reply) });
  current_.reset();
  cv_.notify_all();
}

void Dispatcher::expireCurrentLocked() {
  ++stats_.timedOut;
  std::string errMsg = "[Dispatcher] no response to " + printable(current_->command.payload) +
                       " within " + std::to_string(options_.responseTimeout.count()) + " ms";
  logger_->warn(kSource, errMsg);
  faults_.push_back(errMsg);
  resolveCurrentLocked(Reply::failure(ErrorKind::Stall, errMsg));
  dispatchNextLocked();
}

void Dispatcher::invoke(Completion& completion) {
  if (!completion.handler)
    return;
  try {
    completion.handler(completion.reply);
  } catch (const std::exception& e) {
    std::string errMsg = std::string("[Dispatcher] response handler threw: ") + e.what();
    logger_->error(kSource, errMsg);
    errorMonitor_->notifyFailure(errMsg);
  }
}

// -------------------------------------------------------------------
// Dispatcher::workerLoop
// Drains the completion FIFO with the lock released, so handlers see
// enqueue order and may call send() again. Between deliveries it waits
// for the current command's deadline.
// -------------------------------------------------------------------
void Dispatcher::workerLoop() {
  const bool watchdog = options_.responseTimeout.count() > 0;
  std::unique_lock<std::mutex> lock(mtx_);
  for (;;) {
    if (!completions_.empty() || !faults_.empty()) {
      std::vector<std::string> faults = std::move(faults_);
      faults_.clear();

      std::optional<Completion> next;
      if (!completions_.empty()) {
        next = std::move(completions_.front());
        completions_.pop_front();
      }

      delivering_ = true;
      lock.unlock();
      for (const auto& f : faults)
        errorMonitor_->notifyFailure(f);
      if (next)
        invoke(*next);
      lock.lock();
      delivering_ = false;
      cv_.notify_all(); // shutdown() waits for the FIFO to empty
      continue;
    }

    if (exiting_)
      return;

    if (watchdog && current_) {
      const auto deadline = current_->deadline;
      if (Clock::now() >= deadline)
        expireCurrentLocked();
      else
        cv_.wait_until(lock, deadline); // re-check: current may have been answered meanwhile
      continue;
    }

    cv_.wait(lock);
  }
}
