#pragma once

#include "kspec/server/IConnection.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace kspec::test {

// In-memory IConnection: records frames, pings and close requests.
// bufferedAmount() is whatever the test sets.
class FakeConnection : public server::IConnection {
public:
    explicit FakeConnection(std::string id) : id_(std::move(id)) {}

    const std::string& sessionId() const override { return id_; }

    void sendText(std::string text) override {
        std::lock_guard<std::mutex> lk(mx_);
        sent_.push_back(std::move(text));
    }

    std::size_t bufferedAmount() const override { return buffered_.load(); }

    void ping() override { ++pings_; }

    void close(std::uint16_t code, std::string reason) override {
        std::lock_guard<std::mutex> lk(mx_);
        ++closes_;
        closeCode_ = code;
        closeReason_ = std::move(reason);
    }

    void setBuffered(std::size_t n) { buffered_.store(n); }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lk(mx_);
        return sent_;
    }
    std::string lastSent() const {
        std::lock_guard<std::mutex> lk(mx_);
        return sent_.empty() ? std::string() : sent_.back();
    }
    void clearSent() {
        std::lock_guard<std::mutex> lk(mx_);
        sent_.clear();
    }

    int pings() const { return pings_.load(); }
    int closes() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closes_;
    }
    std::uint16_t closeCode() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closeCode_;
    }
    std::string closeReason() const {
        std::lock_guard<std::mutex> lk(mx_);
        return closeReason_;
    }

private:
    std::string id_;
    mutable std::mutex mx_;
    std::vector<std::string> sent_;
    std::atomic<std::size_t> buffered_{0};
    std::atomic<int> pings_{0};
    int closes_{0};
    std::uint16_t closeCode_{0};
    std::string closeReason_;
};

} // namespace kspec::test
