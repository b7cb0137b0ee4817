#include "kspec/server/FileWatcher.hpp"
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/util/Metrics.hpp"
#include "kspec/ws/Protocol.hpp"

#include <boost/asio/error.hpp>
#include <rapidjson/document.h>

#include <fstream>
#include <system_error>
#include <vector>

namespace kspec::server {

using util::LogLevel;
using util::logger;

namespace fs = std::filesystem;

FileWatcher::FileWatcher(boost::asio::io_context& ioc,
                         ConnectionRegistry& registry,
                         fs::path dir,
                         Clock::duration pollInterval,
                         Clock::duration debounce)
  : timer_(ioc)
  , registry_(registry)
  , dir_(std::move(dir))
  , pollInterval_(pollInterval)
  , debounce_(debounce)
{}

FileWatcher::~FileWatcher() {
  stop();
}

void FileWatcher::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return; // already running
  }
  prime();
  logger().log(LogLevel::Info, "watcher started",
               {{"dir", dir_.string()},
                {"interval_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(pollInterval_).count())}});
  arm();
}

void FileWatcher::stop() noexcept {
  if (!running_.exchange(false, std::memory_order_acq_rel)) return;
  std::lock_guard<std::mutex> lk(timerMx_);
  timer_.cancel();
}

void FileWatcher::arm() {
  std::lock_guard<std::mutex> lk(timerMx_);
  if (!running_.load(std::memory_order_acquire)) return;
  timer_.expires_after(pollInterval_);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return;
    if (!running_.load(std::memory_order_acquire)) return;
    poll(Clock::now());
    arm();
  });
}

void FileWatcher::prime() {
  std::map<std::string, Stamp> current;
  std::string error;
  const bool ok = scan(current, error);

  std::lock_guard<std::mutex> lk(stateMx_);
  known_ = std::move(current);
  pending_.clear();
  dirAvailable_ = ok;
  if (!ok) {
    logger().log(LogLevel::Warn, "watch directory unavailable", {{"dir", dir_.string()}, {"error", error}});
  }
}

bool FileWatcher::scan(std::map<std::string, Stamp>& out, std::string& error) const {
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec) {
    error = ec.message();
    return false;
  }
  const fs::directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    const auto& p = it->path();
    if (p.extension() != ".yaml") continue;

    std::error_code fec;
    if (!it->is_regular_file(fec) || fec) continue;
    Stamp st;
    st.mtime = fs::last_write_time(p, fec);
    if (fec) continue;
    st.size = fs::file_size(p, fec);
    if (fec) continue;
    out.emplace(p.filename().string(), st);
  }
  if (ec) {
    error = ec.message();
    return false;
  }
  return true;
}

std::size_t FileWatcher::poll(Clock::time_point now) {
  std::map<std::string, Stamp> current;
  std::string error;
  const bool ok = scan(current, error);

  std::vector<std::string> due;
  bool lost = false;
  {
    std::lock_guard<std::mutex> lk(stateMx_);
    if (!ok) {
      // Report an outage once, then keep retrying quietly on every poll.
      lost = dirAvailable_;
      dirAvailable_ = false;
    } else if (!dirAvailable_) {
      logger().log(LogLevel::Info, "watch directory available again", {{"dir", dir_.string()}});
      dirAvailable_ = true;
      known_ = std::move(current);
      pending_.clear();
      return 0;
    } else {
      for (const auto& kv : current) {
        auto it = known_.find(kv.first);
        if (it == known_.end() || it->second != kv.second) {
          pending_[kv.first] = now; // restart the debounce window
        }
      }
      for (auto it = pending_.begin(); it != pending_.end();) {
        if (current.count(it->first) == 0) {
          it = pending_.erase(it);
        } else if (now - it->second >= debounce_) {
          due.push_back(it->first);
          it = pending_.erase(it);
        } else {
          ++it;
        }
      }
      known_ = std::move(current);
    }
  }

  if (lost) {
    logger().log(LogLevel::Warn, "watch directory unavailable", {{"dir", dir_.string()}, {"error", error}});
    emitError(std::string(), error);
    return 1;
  }

  std::size_t events = 0;
  for (const auto& name : due) {
    std::ifstream in(dir_ / name, std::ios::binary);
    if (!in) {
      emitError(name, "cannot read file");
    } else {
      emitChange(name);
    }
    ++events;
  }
  return events;
}

void FileWatcher::emitChange(const std::string& name) {
  rapidjson::Document d;
  d.SetObject();
  auto& a = d.GetAllocator();
  d.AddMember("file", rapidjson::Value(name.c_str(), a), a);

  const auto n = registry_.broadcast(ws::kTopicFileUpdates, "file_changed", d);
  KSPEC_METRIC_HIT("kspec.watcher.changes");
  logger().log(LogLevel::Info, "file changed", {{"file", name}, {"delivered", std::to_string(n)}});
}

void FileWatcher::emitError(const std::string& name, const std::string& message) {
  rapidjson::Document d;
  d.SetObject();
  auto& a = d.GetAllocator();
  if (!name.empty()) d.AddMember("file", rapidjson::Value(name.c_str(), a), a);
  d.AddMember("error", rapidjson::Value(message.c_str(), a), a);

  registry_.broadcast(ws::kTopicFileErrors, "error", d);
  KSPEC_METRIC_HIT("kspec.watcher.errors");
  logger().log(LogLevel::Error, "watcher error", {{"file", name}, {"error", message}});
}

} // namespace kspec::server
