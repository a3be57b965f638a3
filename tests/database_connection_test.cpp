#include <gtest/gtest.h>
#include "database_connection.hpp"

TEST(HumanizeBytesTest, SmallValuesStayInBytes) {
    EXPECT_EQ(humanizeBytes(0), "0 B");
    EXPECT_EQ(humanizeBytes(512), "512 B");
    EXPECT_EQ(humanizeBytes(1023), "1023 B");
}

TEST(HumanizeBytesTest, LargerValuesUseBinaryUnits) {
    EXPECT_EQ(humanizeBytes(1024), "1.0 KiB");
    EXPECT_EQ(humanizeBytes(1536), "1.5 KiB");
    EXPECT_EQ(humanizeBytes(5ull * 1024 * 1024), "5.0 MiB");
    EXPECT_EQ(humanizeBytes(3ull * 1024 * 1024 * 1024), "3.0 GiB");
    EXPECT_EQ(humanizeBytes(2048ull * 1024 * 1024 * 1024 * 1024), "2048.0 TiB");
}

TEST(ApplyOverheadTest, TruncatesProduct) {
    EXPECT_EQ(applyOverhead(1000, 1.2), 1200u);
    EXPECT_EQ(applyOverhead(1000, 1.15), 1150u);
    EXPECT_EQ(applyOverhead(1000, 1.25), 1250u);
    EXPECT_EQ(applyOverhead(0, 1.3), 0u);
}

TEST(ConnectionStatusTest, OnlyConnectedIsUsable) {
    EXPECT_TRUE(ConnectionStatus::connected().isConnected());
    EXPECT_FALSE(ConnectionStatus::disconnected().isConnected());

    auto status = ConnectionStatus::error("refused");
    EXPECT_FALSE(status.isConnected());
    EXPECT_EQ(status.state(), ConnectionStatus::State::Error);
    EXPECT_EQ(status.message(), "refused");
}
