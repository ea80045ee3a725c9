#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/sandbox/concurrency_token.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace Shardrun;
using namespace std::chrono_literals;

TEST(ConcurrencyTokenTest, RejectsNonPositiveMaximum) {
    EXPECT_THROW(ConcurrencyToken(0), ConfigurationError);
    EXPECT_THROW(ConcurrencyToken(-3), ConfigurationError);
}

TEST(ConcurrencyTokenTest, PermitReleasesOnScopeExit) {
    ConcurrencyToken token(2);
    {
        ConcurrencyToken::Permit a(token);
        ConcurrencyToken::Permit b(token);
        EXPECT_EQ(token.in_flight(), 2);
    }
    EXPECT_EQ(token.in_flight(), 0);
    EXPECT_EQ(token.total_acquired(), 2);
}

TEST(ConcurrencyTokenTest, OverReleaseDoesNotGoNegative) {
    ConcurrencyToken token(1);
    token.Release();
    EXPECT_EQ(token.in_flight(), 0);
}

TEST(ConcurrencyTokenTest, BoundHoldsUnderContention) {
    for (int max : {1, 2, 4}) {
        ConcurrencyToken token(max);
        std::atomic<int> current{0};
        std::atomic<int> observed_max{0};

        std::vector<std::thread> threads;
        for (int t = 0; t < 12; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 3; ++i) {
                    ConcurrencyToken::Permit permit(token);
                    int now = ++current;
                    int prev = observed_max.load();
                    while (now > prev && !observed_max.compare_exchange_weak(prev, now)) {
                    }
                    std::this_thread::sleep_for(2ms);
                    --current;
                }
            });
        }
        for (auto& t : threads) t.join();

        EXPECT_LE(observed_max.load(), max);
        EXPECT_LE(token.peak_in_flight(), max);
        EXPECT_EQ(token.total_acquired(), 36);
        EXPECT_EQ(token.in_flight(), 0);
    }
}

TEST(ConcurrencyTokenTest, ProvisioningMutexSerializes) {
    ConcurrencyToken token(4);
    std::atomic<int> inside{0};
    std::atomic<bool> overlap{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&]() {
            absl::MutexLock lock(&token.provisioning_mutex());
            if (++inside > 1) overlap = true;
            std::this_thread::sleep_for(1ms);
            --inside;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_FALSE(overlap.load());
}
