#pragma once
/** @file  Dispatcher.hpp
 *  @brief Single-in-flight command queue with temporal response correlation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// tvlink headers
#include "core/CommandSink.hpp"
#include "io/Transport.hpp"

namespace tvlink {
  namespace core {

    class ErrorMonitor;
    class Logger;

    struct DispatcherOptions {
      /// Larger timeouts are clamped to this.
      static constexpr std::chrono::milliseconds kMaxResponseTimeout{ std::chrono::hours{ 1 } };

      /// Deadline armed at every dispatch; zero disables the watchdog.
      std::chrono::milliseconds responseTimeout{ 5000 };
      /// Queued commands beyond Current; zero means unbounded.
      std::size_t maxQueueDepth{ 0 };
    };

    /**
 * @class Dispatcher
 * @brief Owns the command queue and the one command in flight ("current").
 *
 * The device has no request ids, so the next line after a write is taken as
 * the answer to that write. Hence:
 *
 *  * at most one command is current; nothing is written while one is;
 *  * a line arriving with no current command is dropped;
 *  * replies are delivered in enqueue order, exactly once each;
 *  * a write failure or an expired deadline resolves current as failed and
 *    the queue moves on.
 *
 * Locking: `mtx_` guards queue, current, completions and stats. Transport
 * writes happen under `mtx_`; response handlers never run under it.
 *
 * Threading: one worker thread delivers every completion, in order, and
 * enforces the response deadline. Handlers therefore never run on the thread
 * that called send(). The dispatcher must not be destroyed from a handler.
 */
    class Dispatcher : public CommandSink {
    public:
      enum class State { Idle, Busy };

      struct Stats {
        std::uint64_t dispatched{ 0 };
        std::uint64_t answered{ 0 };
        std::uint64_t timedOut{ 0 };
        std::uint64_t writeFailures{ 0 };
        std::uint64_t rejected{ 0 };
        std::uint64_t discardedLines{ 0 };
      };

      /// Subscribes to \p transport, which must outlive the dispatcher.
      Dispatcher(io::Transport& transport, std::shared_ptr<Logger> logger,
                 std::shared_ptr<ErrorMonitor> errMonitor, DispatcherOptions options = {});
      ~Dispatcher() override; ///< unsubscribes, then shutdown()

      //---CommandSink------------------------------------------
      void send(std::string payload, ResponseHandler onResponse) override;

      /// Line event from the transport; public so tests can drive it directly.
      void onLine(const std::string& line);

      /// Resolve current and every queued command with ErrorKind::Shutdown.
      /// Returns once those handlers have run (unless called from a handler).
      void shutdown();

      State state() const;
      std::size_t pending() const; ///< queued, excluding current
      Stats stats() const;

      //---non-copyable-----------------------------------------
      Dispatcher(const Dispatcher&) = delete;
      Dispatcher& operator=(const Dispatcher&) = delete;

    private:
      using Clock = std::chrono::steady_clock;

      struct Pending {
        std::string payload;
        ResponseHandler onResponse;
      };

      struct InFlight {
        Pending command;
        Clock::time_point deadline;
      };

      struct Completion {
        ResponseHandler handler;
        Reply reply;
      };

      void dispatchNextLocked();
      void resolveCurrentLocked(Reply reply);
      void expireCurrentLocked();
      void invoke(Completion& completion);
      void workerLoop();

      io::Transport& transport_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      const DispatcherOptions options_;

      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::deque<Pending> queue_;
      std::optional<InFlight> current_;
      std::deque<Completion> completions_; ///< resolved, awaiting delivery in order
      std::vector<std::string> faults_;    ///< reported to the ErrorMonitor outside the lock
      bool delivering_{ false };
      bool stopping_{ false };
      bool exiting_{ false }; ///< worker leaves once completions are drained
      Stats stats_{};

      std::thread worker_;
      io::Transport::SubscriptionId subscription_{ 0 };
    };

    const char* toString(Dispatcher::State state);

  } // namespace core
} // namespace tvlink
