#ifndef RANGE_ENCODER_HPP
#define RANGE_ENCODER_HPP

/**
 * @file range_encoder.hpp
 * @brief Adaptive range encoder with Q15 probabilities
 *
 * This implementation follows the range coder used by the
 * Daala and AV1 video codecs ("od_ec"). The interval is kept as a 32-bit
 * window position (low) and a 16-bit width (rng), renormalized so that
 * 32768 <= rng < 65536 after every call.
 *
 * Bytes shifted out of low cannot be written immediately because a later
 * addition may still carry into them. They go to a PrecarryOutputStream and
 * all carries are resolved by a single backward pass in done().
 *
 * @see RangeDecoder for the symmetric half
 */

#include "byte_stream.hpp"
#include "cdf_model.hpp"
#include <cstdint>
#include <vector>

/**
 * @brief Adaptive Range Encoder
 *
 * Three call shapes are supported:
 * - encode_bool(): a binary value with a Q15 probability of being true.
 * - encode_cdf(): a symbol from a fixed inverted CDF table.
 * - encode_symbol(): a symbol from a CdfModel, which is then adapted.
 *
 * The encoder is Fresh until the first call, Active afterward and Finalized
 * once done() has returned the stream. A finalized encoder rejects any
 * further call with std::logic_error.
 */
class RangeEncoder {
public:
    enum class State : uint8_t {
        FRESH,
        ACTIVE,
        FINALIZED
    };

    RangeEncoder();

    /**
     * Encode a single binary value.
     *
     * @param value The value to encode
     * @param f Probability that the value is true, scaled by 32768 (1 to 32767)
     */
    void encode_bool(bool value, unsigned f);

    /**
     * Encode one equiprobable bit.
     *
     * @param bit Bit to encode (0 or 1)
     */
    void encode_bit(int bit);

    /**
     * Encode the low bits of an integer as equiprobable bits, MSB first.
     *
     * @param value Value whose low bits are written
     * @param num_bits Number of bits to write (1 to 32)
     */
    void encode_literal(uint32_t value, int num_bits);

    /**
     * Encode a symbol given an inverted CDF table in Q15.
     *
     * The table is not modified.
     *
     * @param symbol Index of the symbol to encode
     * @param icdf Table such that the symbol occupies
     *             [symbol > 0 ? 32768 - icdf[symbol - 1] : 0, 32768 - icdf[symbol]).
     *             Non-increasing, at most 16 entries, last entry 0.
     */
    void encode_cdf(int symbol, const std::vector<uint16_t>& icdf);

    /**
     * Encode a symbol with an adaptive model and update the model.
     *
     * @param symbol Index of the symbol to encode (0 to num_symbols-1)
     * @param model Caller-owned model, borrowed for this call only
     */
    void encode_symbol(int symbol, CdfModel& model);

    /**
     * Encode a symbol given its frequency range in Q15.
     *
     * @param fl 32768 minus the cumulative frequency of all symbols before
     *           the one to be encoded
     * @param fh 32768 minus the cumulative frequency of all symbols up to and
     *           including the one to be encoded
     */
    void encode_q15(unsigned fl, unsigned fh);

    /**
     * Finish the stream.
     *
     * Writes the minimum number of bits that ensures the symbols encoded so
     * far decode correctly regardless of the bits that follow, then resolves
     * the carries.
     *
     * @return The finished byte stream
     */
    std::vector<uint8_t> done();

    /**
     * Number of bits written so far, including one bit reserved for
     * terminating the stream.
     */
    int tell() const;

    /**
     * Same as tell(), in 1/8 bit units.
     */
    uint32_t tell_frac() const;

    State state() const { return state_; }

    bool is_finalized() const { return state_ == State::FINALIZED; }

private:
    uint32_t low_;                    // Low end of the current range
    uint16_t rng_;                    // Number of values in the current range
    int16_t cnt_;                     // Number of bits of data in the current value
    PrecarryOutputStream precarry_;   // Output units awaiting carry resolution
    State state_;

    /**
     * Takes updated low and range values, renormalizes them so that
     * 32768 <= rng < 65536 (flushing bytes from low to the precarry buffer
     * if necessary) and stores them back in the encoder.
     *
     * @param low New value of low
     * @param rng New value of the range
     */
    void normalize(uint32_t low, unsigned rng);

    void check_active(const char* op) const;

    // Narrow to symbol's sub-range of an already validated table
    void encode_cdf_q15(int symbol, const uint16_t* icdf);
};

#endif // RANGE_ENCODER_HPP
