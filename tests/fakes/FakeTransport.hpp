#pragma once
/** @file  FakeTransport.hpp
 *  @brief In-memory Transport: records writes, injects lines, can fail writes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/Errors.hpp"
#include "io/Transport.hpp"

namespace tvlink {
  namespace test {

    class FakeTransport : public tvlink::io::Transport {
    public:
      void write(const std::string& bytes) override {
        std::unique_lock<std::mutex> lock(mtx_);
        if (fail_writes > 0) {
          --fail_writes;
          const auto delay = fail_after;
          lock.unlock();
          std::this_thread::sleep_for(delay);
          throw tvlink::core::IOError("fake link down");
        }
        written_.push_back(bytes);
        cv_.notify_all();
      }

      SubscriptionId subscribe(LineHandler onLine) override {
        std::lock_guard<std::mutex> lock(mtx_);
        handlers_[next_id_] = std::move(onLine);
        return next_id_++;
      }

      void unsubscribe(SubscriptionId id) override {
        std::lock_guard<std::mutex> lock(mtx_);
        handlers_.erase(id);
      }

      /// Deliver \p line to every subscriber, as the reader thread would.
      void inject(const std::string& line) {
        std::map<SubscriptionId, LineHandler> handlers;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          handlers = handlers_;
        }
        // unlocked: handlers write back into us
        for (auto& [id, h] : handlers)
          h(line);
      }

      std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return written_;
      }

      bool waitForWrites(std::size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        return cv_.wait_for(lock, timeout, [&] { return written_.size() >= n; });
      }

      std::size_t subscribers() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return handlers_.size();
      }

      int fail_writes = 0; ///< number of upcoming writes that throw IOError
      std::chrono::milliseconds fail_after{ 0 }; ///< how long a failing write hangs first

    private:
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::vector<std::string> written_;
      std::map<SubscriptionId, LineHandler> handlers_;
      SubscriptionId next_id_ = 1;
    };

  } // namespace test
} // namespace tvlink
