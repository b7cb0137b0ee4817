#include "kspec/util/Ulid.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace kspec::util;

TEST(UlidTest, FormatIsCrockfordBase32) {
    auto id = ulid();
    ASSERT_EQ(id.size(), 26u);
    for (char c : id) {
        EXPECT_NE(std::string("0123456789ABCDEFGHJKMNPQRSTVWXYZ").find(c), std::string::npos) << c;
    }
}

TEST(UlidTest, EncodesTimestamp) {
    UlidGenerator gen(42);
    const std::uint64_t ms = 1700000000123ULL;
    auto id = gen.next(ms);
    auto decoded = ulidTime(id);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, ms);
}

TEST(UlidTest, SortsByTime) {
    UlidGenerator gen(1);
    auto a = gen.next(1000);
    auto b = gen.next(2000);
    auto c = gen.next(3000);
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
}

TEST(UlidTest, MonotonicWithinOneMillisecond) {
    UlidGenerator gen(7);
    std::string prev = gen.next(5000);
    for (int i = 0; i < 1000; ++i) {
        auto next = gen.next(5000);
        EXPECT_LT(prev, next);
        prev = next;
    }
    // A clock step backwards does not break ordering either.
    auto back = gen.next(4000);
    EXPECT_LT(prev, back);
    EXPECT_EQ(ulidTime(back).value(), 5000u);
}

TEST(UlidTest, UniqueAcrossThreads) {
    constexpr int kThreads = 4;
    constexpr int kPer = 2000;
    std::vector<std::vector<std::string>> out(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&out, t] {
            for (int i = 0; i < kPer; ++i) out[t].push_back(ulid());
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::string> all;
    for (const auto& v : out) all.insert(v.begin(), v.end());
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPer));
}

TEST(UlidTest, RejectsMalformedIds) {
    EXPECT_FALSE(ulidTime("").has_value());
    EXPECT_FALSE(ulidTime("01ARZ3NDEKTSV4RRFFQ69G5FA").has_value());   // 25 chars
    EXPECT_FALSE(ulidTime("01ARZ3NDEKTSV4RRFFQ69G5FAU").has_value());  // 'U' is excluded
    EXPECT_TRUE(ulidTime("01ARZ3NDEKTSV4RRFFQ69G5FAV").has_value());
    EXPECT_TRUE(ulidTime("01arz3ndektsv4rrffq69g5fav").has_value());
}
