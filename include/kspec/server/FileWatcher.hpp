#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace kspec::server {

class ConnectionRegistry;

// Polls a project's .kspec directory for *.yaml changes and turns them into
// broadcasts: "file_changed" on files:updates, "error" on files:errors.
// Rapid writes to the same file collapse into one event after the debounce.
class FileWatcher {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::milliseconds kPollInterval{250};
  static constexpr std::chrono::milliseconds kDebounce{500};

  FileWatcher(boost::asio::io_context& ioc,
              ConnectionRegistry& registry,
              std::filesystem::path dir,
              Clock::duration pollInterval = kPollInterval,
              Clock::duration debounce     = kDebounce);
  ~FileWatcher();

  FileWatcher(const FileWatcher&)            = delete;
  FileWatcher& operator=(const FileWatcher&) = delete;

  // Records the current files as the baseline (no events), then polls.
  void start();
  void stop() noexcept;   // idempotent
  bool running() const { return running_.load(std::memory_order_acquire); }

  // Take the baseline without emitting anything.
  void prime();

  // One scan. Returns the number of events broadcast.
  std::size_t poll(Clock::time_point now);

  const std::filesystem::path& dir() const { return dir_; }

private:
  struct Stamp {
    std::filesystem::file_time_type mtime{};
    std::uintmax_t size = 0;
    bool operator==(const Stamp& o) const { return mtime == o.mtime && size == o.size; }
    bool operator!=(const Stamp& o) const { return !(*this == o); }
  };

  bool scan(std::map<std::string, Stamp>& out, std::string& error) const;
  void emitChange(const std::string& name);
  void emitError(const std::string& name, const std::string& message);
  void arm();

private:
  boost::asio::steady_timer timer_;
  std::mutex timerMx_;
  ConnectionRegistry& registry_;
  std::filesystem::path dir_;
  Clock::duration pollInterval_;
  Clock::duration debounce_;
  std::atomic<bool> running_{false};

  std::mutex stateMx_;
  std::map<std::string, Stamp> known_;
  std::map<std::string, Clock::time_point> pending_;
  bool dirAvailable_{true};
};

} // namespace kspec::server
