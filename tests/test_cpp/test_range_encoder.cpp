#include <gtest/gtest.h>
#include <random>
#include <utility>
#include <vector>
#include "range_encoder.hpp"
#include "cdf_model.hpp"

// Test: RangeEncoder_InitialState
TEST(RangeEncoderTest, InitialState) {
    RangeEncoder encoder;

    EXPECT_EQ(encoder.state(), RangeEncoder::State::FRESH);
    EXPECT_FALSE(encoder.is_finalized());

    // One bit is reserved for terminating the stream
    EXPECT_EQ(encoder.tell(), 1);
    EXPECT_EQ(encoder.tell_frac(), 8u);
}

// Test: RangeEncoder_EmptyStream
TEST(RangeEncoderTest, EmptyStream) {
    RangeEncoder encoder;

    std::vector<uint8_t> out = encoder.done();

    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(encoder.is_finalized());
    EXPECT_EQ(encoder.state(), RangeEncoder::State::FINALIZED);
}

// Test: RangeEncoder_BooleansGoldenBytes
TEST(RangeEncoderTest, BooleansGoldenBytes) {
    RangeEncoder encoder;

    encoder.encode_bool(false, 1);
    EXPECT_EQ(encoder.state(), RangeEncoder::State::ACTIVE);
    encoder.encode_bool(true, 2);
    encoder.encode_bool(false, 3);
    encoder.encode_bool(true, 1);
    encoder.encode_bool(true, 2);
    encoder.encode_bool(false, 3);

    std::vector<uint8_t> expected = {0xFF, 0xFD, 0xFF, 0xEF, 0xFF, 0xF0};
    EXPECT_EQ(encoder.done(), expected);
}

// Test: RangeEncoder_CdfGoldenBytes
TEST(RangeEncoderTest, CdfGoldenBytes) {
    const std::vector<uint16_t> cdf = {7296, 3819, 1716, 0, 0};
    const std::vector<uint16_t> untouched = cdf;
    RangeEncoder encoder;

    for (int symbol : {0, 0, 0, 1, 1, 1, 2, 2, 2}) {
        encoder.encode_cdf(symbol, cdf);
    }

    std::vector<uint8_t> expected = {0x68, 0xC6, 0x5E};
    EXPECT_EQ(encoder.done(), expected);
    EXPECT_EQ(cdf, untouched);
}

// Test: RangeEncoder_LiteralIsRawBits
TEST(RangeEncoderTest, LiteralIsRawBits) {
    // Equiprobable bits pass through the coder unchanged
    RangeEncoder encoder;
    encoder.encode_literal(0xDEADBEEF, 32);

    std::vector<uint8_t> expected = {0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(encoder.done(), expected);
}

// Test: RangeEncoder_HighlyProbableSymbolsAreCheap
TEST(RangeEncoderTest, HighlyProbableSymbolsAreCheap) {
    RangeEncoder encoder;
    for (int i = 0; i < 1000; i++) {
        encoder.encode_bool(false, 1);
    }
    std::vector<uint8_t> out = encoder.done();

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], 0x00);
}

// Test: RangeEncoder_ImprobableSymbolsAreExpensive
TEST(RangeEncoderTest, ImprobableSymbolsAreExpensive) {
    // Each true at f = 1/32768 costs about 15 bits
    RangeEncoder encoder;
    for (int i = 0; i < 8; i++) {
        encoder.encode_bool(true, 1);
    }
    std::vector<uint8_t> out = encoder.done();

    EXPECT_EQ(out, std::vector<uint8_t>(15, 0xFF));
}

// Test: RangeEncoder_Tell
TEST(RangeEncoderTest, Tell) {
    RangeEncoder encoder;
    for (int i = 0; i < 100; i++) {
        encoder.encode_bit(0);
        EXPECT_EQ(encoder.tell(), i + 2);
    }

    encoder.encode_bool(true, 2);
    EXPECT_EQ(encoder.tell(), 115);
    EXPECT_EQ(encoder.tell_frac(), 115u * 8);
}

// Test: RangeEncoder_LengthMonotonicity
TEST(RangeEncoderTest, LengthMonotonicity) {
    std::mt19937 rng(2024);

    for (int trial = 0; trial < 50; trial++) {
        std::vector<std::pair<bool, unsigned>> calls;
        for (int i = 0; i < 60; i++) {
            bool value = rng() % 2 == 0;
            unsigned f = 1 + rng() % 32767;
            calls.emplace_back(value, f);
        }

        size_t previous = 0;
        for (size_t k = 0; k <= calls.size(); k++) {
            RangeEncoder encoder;
            for (size_t i = 0; i < k; i++) {
                encoder.encode_bool(calls[i].first, calls[i].second);
            }
            size_t length = encoder.done().size();
            EXPECT_GE(length, previous) << "prefix " << k;
            previous = length;
        }
    }
}

// Test: RangeEncoder_AdaptiveSymbolUpdatesModel
TEST(RangeEncoderTest, AdaptiveSymbolUpdatesModel) {
    RangeEncoder encoder;
    CdfModel model = CdfModel::uniform(4);
    CdfModel reference = CdfModel::uniform(4);

    encoder.encode_symbol(2, model);
    reference.update(2);

    EXPECT_EQ(model, reference);
    EXPECT_EQ(model.count(), 1);
}

// Test: RangeEncoder_InvalidProbability
TEST(RangeEncoderTest, InvalidProbability) {
    RangeEncoder encoder;

    EXPECT_THROW(encoder.encode_bool(true, 0), std::invalid_argument);
    EXPECT_THROW(encoder.encode_bool(true, 32768), std::invalid_argument);

    // A rejected call leaves the encoder untouched
    EXPECT_EQ(encoder.state(), RangeEncoder::State::FRESH);
}

// Test: RangeEncoder_InvalidTable
TEST(RangeEncoderTest, InvalidTable) {
    RangeEncoder encoder;
    const std::vector<uint16_t> cdf = {7296, 3819, 1716, 0, 0};

    // Symbol 4 has zero width
    EXPECT_THROW(encoder.encode_cdf(4, cdf), std::invalid_argument);
    EXPECT_THROW(encoder.encode_cdf(5, cdf), std::invalid_argument);
    EXPECT_THROW(encoder.encode_cdf(-1, cdf), std::invalid_argument);

    // Not terminated
    EXPECT_THROW(encoder.encode_cdf(0, {7296, 3819}), std::invalid_argument);

    // Increasing
    EXPECT_THROW(encoder.encode_cdf(0, {3819, 7296, 0}), std::invalid_argument);

    EXPECT_THROW(encoder.encode_q15(100, 100), std::invalid_argument);
    EXPECT_THROW(encoder.encode_q15(32769, 100), std::invalid_argument);

    CdfModel model = CdfModel::uniform(3);
    EXPECT_THROW(encoder.encode_symbol(3, model), std::invalid_argument);
    EXPECT_EQ(model.count(), 0);
}

// Test: RangeEncoder_InvalidLiteralWidth
TEST(RangeEncoderTest, InvalidLiteralWidth) {
    RangeEncoder encoder;

    EXPECT_THROW(encoder.encode_literal(0, 0), std::invalid_argument);
    EXPECT_THROW(encoder.encode_literal(0, 33), std::invalid_argument);
}

// Test: RangeEncoder_CallsAfterDoneThrow
TEST(RangeEncoderTest, CallsAfterDoneThrow) {
    RangeEncoder encoder;
    CdfModel model = CdfModel::uniform(2);
    encoder.encode_bool(true, 16384);
    encoder.done();

    EXPECT_THROW(encoder.encode_bool(true, 16384), std::logic_error);
    EXPECT_THROW(encoder.encode_bit(1), std::logic_error);
    EXPECT_THROW(encoder.encode_cdf(0, {16384, 0}), std::logic_error);
    EXPECT_THROW(encoder.encode_symbol(0, model), std::logic_error);
    EXPECT_THROW(encoder.done(), std::logic_error);

    // The model is not touched by the rejected call
    EXPECT_EQ(model.count(), 0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
