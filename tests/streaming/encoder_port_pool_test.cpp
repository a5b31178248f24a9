// MediaRelay - WebRTC SFU Signaling Server
// Tests for Encoder Port Pool

#include <gtest/gtest.h>
#include "mediarelay/streaming/encoder_port_pool.hpp"
#include "support/fake_port_watcher.hpp"

#include <set>
#include <thread>
#include <vector>

namespace mediarelay {
namespace streaming {
namespace test {

using mediarelay::test::FakePortWatcher;

class EncoderPortPoolTest : public ::testing::Test {
protected:
    FakePortWatcher portWatcher_;
};

TEST_F(EncoderPortPoolTest, HandsOutEvenPortsInOrder) {
    EncoderPortPool pool(50000, 50009, portWatcher_);

    auto first = pool.acquire();
    auto second = pool.acquire();

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, 50000);
    EXPECT_EQ(*second, 50002);
    EXPECT_EQ(pool.inUse(), 2u);
}

TEST_F(EncoderPortPoolTest, OddMinimumRoundsUp) {
    EncoderPortPool pool(50001, 50009, portWatcher_);

    auto port = pool.acquire();

    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 50002);
}

TEST_F(EncoderPortPoolTest, RangeWithoutRtcpNeighbourIsEmpty) {
    EncoderPortPool pool(50000, 50000, portWatcher_);

    EXPECT_FALSE(pool.acquire().has_value());
}

TEST_F(EncoderPortPoolTest, ExhaustedRangeReturnsNothing) {
    EncoderPortPool pool(50000, 50003, portWatcher_);
    ASSERT_TRUE(pool.acquire().has_value());
    ASSERT_TRUE(pool.acquire().has_value());

    EXPECT_FALSE(pool.acquire().has_value());
}

TEST_F(EncoderPortPoolTest, ReleasedPortIsReused) {
    EncoderPortPool pool(50000, 50003, portWatcher_);
    auto first = pool.acquire();
    ASSERT_TRUE(pool.acquire().has_value());

    pool.release(*first);
    auto again = pool.acquire();

    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *first);
}

TEST_F(EncoderPortPoolTest, SkipsPortsBoundElsewhere) {
    portWatcher_.setListening(50000);
    portWatcher_.setListening(50003);
    EncoderPortPool pool(50000, 50009, portWatcher_);

    auto port = pool.acquire();

    // 50000 is taken, 50002's RTCP neighbour 50003 is taken
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, 50004);
}

TEST_F(EncoderPortPoolTest, ConcurrentAcquiresNeverShareAPort) {
    EncoderPortPool pool(50000, 50199, portWatcher_);
    std::vector<std::thread> threads;
    std::vector<std::vector<uint16_t>> acquired(4);

    for (size_t t = 0; t < acquired.size(); ++t) {
        threads.emplace_back([&pool, &acquired, t]() {
            for (int i = 0; i < 20; ++i) {
                auto port = pool.acquire();
                if (port) {
                    acquired[t].push_back(*port);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<uint16_t> unique;
    size_t total = 0;
    for (const auto& ports : acquired) {
        total += ports.size();
        unique.insert(ports.begin(), ports.end());
    }
    EXPECT_EQ(total, 80u);
    EXPECT_EQ(unique.size(), total);
    EXPECT_EQ(pool.inUse(), 80u);
}

} // namespace test
} // namespace streaming
} // namespace mediarelay
