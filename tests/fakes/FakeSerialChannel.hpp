#pragma once
/** @file  FakeSerialChannel.hpp
 *  @brief SerialChannel derivative with controlled method outputs for transport/system testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>

#include "io/SerialChannel.hpp"

namespace tvlink {
  namespace test {

    /**
 * @class FakeSerialChannel
 * @brief Behaves like a device that answers known frames with canned lines.
 */
    class FakeSerialChannel : public tvlink::io::SerialChannel {
    public:
      std::atomic<bool> open_called{ false };
      bool open_succeeds = true;
      bool write_succeeds = true;

      bool open(const std::string&, int, const tvlink::io::FrameConfig&) override {
        open_called = true;
        opened_ = open_succeeds;
        return open_succeeds;
      }

      bool write(const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(mtx_);
        last_written_ = bytes;
        if (!write_succeeds)
          return false;
        if (auto it = replies_.find(bytes); it != replies_.end())
          rx_.push_back(it->second);
        cv_.notify_all();
        return true;
      }

      std::optional<std::string> readLine(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [&] { return !rx_.empty() || hung_up_ || !opened_; });
        if (rx_.empty())
          return std::nullopt;
        std::string line = rx_.front();
        rx_.pop_front();
        return line;
      }

      bool isOpen() const override { return opened_ && !hung_up_; }

      void close() override {
        opened_ = false;
        cv_.notify_all();
      }

      //---test controls-----------------------------------------
      /// Answer every write of \p frame with \p line.
      void reply(const std::string& frame, const std::string& line) {
        std::lock_guard<std::mutex> lock(mtx_);
        replies_[frame] = line;
      }

      /// Push an unsolicited line.
      void pushLine(const std::string& line) {
        std::lock_guard<std::mutex> lock(mtx_);
        rx_.push_back(line);
        cv_.notify_all();
      }

      void hangUp() {
        hung_up_ = true;
        cv_.notify_all();
      }

      std::string getLastWritten() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_written_;
      }

    private:
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::deque<std::string> rx_;
      std::map<std::string, std::string> replies_;
      std::string last_written_;
      std::atomic<bool> opened_{ false };
      std::atomic<bool> hung_up_{ false };
    };

  } // namespace test
} // namespace tvlink
