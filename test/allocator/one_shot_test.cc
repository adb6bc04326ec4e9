#include <gtest/gtest.h>
#include "../../src/allocator/one_shot.h"

#include <string>

using namespace Sluice;

TEST(OneShotTest, MatrixShape) {
    auto exchange = PromiseFutures<int>(3, 2);
    ASSERT_EQ(exchange.first.size(), 3u);
    ASSERT_EQ(exchange.second.size(), 2u);
    for (const auto& row : exchange.first) {
        EXPECT_EQ(row.size(), 2u);
    }
    for (const auto& row : exchange.second) {
        EXPECT_EQ(row.size(), 3u);
    }
}

TEST(OneShotTest, SenderRowFeedsReceiverColumn) {
    auto exchange = PromiseFutures<std::string>(2, 2);
    auto& sends = exchange.first;
    auto& recvs = exchange.second;

    for (size_t i = 0; i < 2; ++i) {
        for (size_t j = 0; j < 2; ++j) {
            sends[i][j].set_value(std::to_string(i) + "->" + std::to_string(j));
        }
    }
    EXPECT_EQ(recvs[0][0].get(), "0->0");
    EXPECT_EQ(recvs[0][1].get(), "1->0");
    EXPECT_EQ(recvs[1][0].get(), "0->1");
    EXPECT_EQ(recvs[1][1].get(), "1->1");
}

TEST(OneShotTest, DroppedSenderBreaksHandoff) {
    auto exchange = PromiseFutures<int>(1, 1);
    exchange.first.clear();
    EXPECT_THROW(exchange.second[0][0].get(), std::future_error);
}
