#ifndef RANGE_DECODER_HPP
#define RANGE_DECODER_HPP

/**
 * @file range_decoder.hpp
 * @brief Adaptive range decoder, the symmetric half of RangeEncoder
 *
 * The decoder keeps a 32-bit window "dif" holding the difference between
 * the top of the current range and the coded value, minus one. Its top 16
 * bits are compared against the same splits the encoder computed, so the
 * range evolves symbol for symbol exactly as on the encoder side.
 *
 * Input is pulled into the window byte by byte whenever the bit counter
 * goes negative. Once the declared end of the buffer is reached the window
 * keeps being fed zero bits: the encoder omits trailing bits that any
 * continuation would satisfy.
 */

#include "byte_stream.hpp"
#include "cdf_model.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief Adaptive Range Decoder
 *
 * Calls must be issued in the same order and with the same shapes
 * (probabilities, tables, models) as the encoder calls that produced the
 * stream; the stream itself carries no framing.
 *
 * The decoder owns a copy of its input. Reading past the end is not an
 * error by itself; has_overflowed() reports whether more bits were consumed
 * than the stream holds, and the decoder then reports State::ERROR.
 */
class RangeDecoder {
public:
    enum class State : uint8_t {
        FRESH,
        ACTIVE,
        ERROR
    };

    /**
     * Start decoding a finished stream.
     *
     * @param buffer Bytes returned by RangeEncoder::done()
     */
    explicit RangeDecoder(std::vector<uint8_t> buffer);

    /**
     * Start decoding the first @p storage bytes at @p data.
     *
     * @param data Stream bytes (copied)
     * @param storage Declared length in bytes
     */
    RangeDecoder(const uint8_t* data, size_t storage);

    /**
     * Decode a single binary value.
     *
     * @param f Probability that the value is true, scaled by 32768 (1 to 32767)
     * @return The decoded value
     */
    bool decode_bool(unsigned f);

    /**
     * Decode one equiprobable bit.
     */
    int decode_bit();

    /**
     * Decode an integer written with RangeEncoder::encode_literal().
     *
     * @param num_bits Number of bits to read (1 to 32)
     */
    uint32_t decode_literal(int num_bits);

    /**
     * Decode a symbol given an inverted CDF table in Q15.
     *
     * @param icdf Same table the encoder used
     * @return Decoded symbol index
     */
    int decode_cdf(const std::vector<uint16_t>& icdf);

    /**
     * Decode a symbol with an adaptive model and update the model.
     *
     * @param model Caller-owned model in the same state as the encoder's
     * @return Decoded symbol index
     */
    int decode_symbol(CdfModel& model);

    /**
     * Number of bits consumed so far. Matches RangeEncoder::tell() at the
     * same position in the symbol stream.
     */
    int tell() const;

    /**
     * Same as tell(), in 1/8 bit units.
     */
    uint32_t tell_frac() const;

    /**
     * Check whether decoding has consumed more bits than the stream holds
     * (not counting the bit the encoder reserves for termination).
     */
    bool has_overflowed() const { return error_; }

    State state() const { return error_ ? State::ERROR : state_; }

private:
    ByteInputStream input_;
    uint32_t dif_;        // Top of range minus coded value minus one
    uint16_t rng_;        // Number of values in the current range
    int16_t cnt_;         // Number of valid bits in dif below the top 16
    int32_t tell_offs_;   // Correction to the bit count once input ran out
    State state_;
    bool error_;

    void init();
    void refill();

    /**
     * Renormalize dif and rng after a call and refill if needed.
     *
     * @return ret, unchanged
     */
    int normalize(uint32_t dif, unsigned rng, int ret);

    int decode_cdf_q15(const uint16_t* icdf);
};

#endif // RANGE_DECODER_HPP
