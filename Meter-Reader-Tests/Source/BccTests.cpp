#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "Core/Iec/Bcc.hpp"

TEST(Bcc, XorAfterStxThroughEtx) {
    // 'A' CR LF '!' CR LF ETX: CR e LF si annullano a coppie
    const Bytes frame{ kStx, 'A', kCr, kLf, '!', kCr, kLf, kEtx };
    EXPECT_EQ(ComputeBcc(frame), std::optional<std::uint8_t>(0x63));
}

TEST(Bcc, StartsAfterFirstSohAndIncludesStx) {
    const Bytes frame{ 'x', kSoh, 'P', '0', kStx, '(', ')', kEtx, 0x60 };
    EXPECT_EQ(ComputeBcc(frame), std::optional<std::uint8_t>(0x60));
}

TEST(Bcc, IncompleteFrame) {
    EXPECT_FALSE(ComputeBcc(Bytes{ kStx, 'A', 'B' }));
    EXPECT_FALSE(ComputeBcc(Bytes{ 'A', 'B', kEtx }));
    EXPECT_FALSE(ComputeBcc(Bytes{}));
}

TEST(Bcc, AccumulatorMatchesFrame) {
    const Bytes block = MakeDataBlock({ "1.8.0(0015.557*kWh)", "2.8.0(0000000.000*kWh)" });

    BccAccumulator acc;
    acc.add(Bytes(block.begin() + 1, block.end() - 1));
    EXPECT_EQ(acc.value(), block.back());

    acc.reset();
    EXPECT_EQ(acc.value(), 0);
}
