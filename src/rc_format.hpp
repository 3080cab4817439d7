#ifndef RC_FORMAT_HPP
#define RC_FORMAT_HPP

/**
 * @file rc_format.hpp
 * @brief Range coder bit-stream constants and shared numeric helpers
 * 
 * The encoder and decoder must run the exact same integer arithmetic, so
 * every constant that shapes the bit stream lives here.
 * 
 * Stream layout:
 * - No header, length prefix or magic: the byte count travels out-of-band.
 * - Probabilities are Q15 (32768 == 1.0).
 * - CDF tables are stored inverted: icdf[i] = 32768 - cdf[i], so a table
 *   is non-increasing and terminates at 0.
 */

#include <cstdint>
#include <cstddef>

/**
 * @brief Range coder format constants and helpers
 * 
 * The window/range geometry matches the Daala/AV1 "od_ec" entropy coder
 * with a 32-bit window.
 */

namespace RCFormat {
    // Q15 probability scale: 32768 represents probability 1.0
    static constexpr uint32_t PROB_TOP = 32768;

    // Width in bits of the encoder's low / decoder's dif window
    static constexpr int WINDOW_SIZE = 32;

    // Initial interval width (Fresh state)
    static constexpr uint16_t RNG_INIT = 0x8000;

    // Largest alphabet an (adaptive) CDF table may describe
    static constexpr int MAX_SYMBOLS = 16;

    // Ceiling of the adaptation counter stored after the last CDF entry
    static constexpr uint16_t MAX_ADAPT_COUNT = 32;

    // Fractional bits reported by tell_frac()
    static constexpr int BITRES = 3;

    // Encoder bit counter start: crosses zero after one byte + one carry bit
    static constexpr int16_t ENCODER_CNT_INIT = -9;

    // Decoder bit counter start (before the first refill)
    static constexpr int16_t DECODER_CNT_INIT = -15;

    // Sentinel bit count loaded once the decoder runs out of input
    static constexpr int16_t LOTS_OF_BITS = 0x4000;

    /**
     * @brief Number of significant bits in a non-zero value.
     * 
     * @param x Value, must be > 0
     * @return 1 + floor(log2(x))
     */
    inline int ilog_nz(uint32_t x) {
        int n = 0;
        while (x) {
            n++;
            x >>= 1;
        }
        return n;
    }

    /**
     * @brief Convert between forward and inverted CDF values.
     * 
     * The mapping is its own inverse.
     */
    inline uint16_t icdf(uint32_t x) {
        return static_cast<uint16_t>(PROB_TOP - x);
    }

    /**
     * @brief Refine a whole-bit count with the current range.
     * 
     * Given the value returned by tell() and the coder's current range,
     * computes the number of bits used in 1/8th bit units. The log2 of the
     * range is approximated by repeated squaring.
     * 
     * @param nbits_total Bits used, as reported by tell()
     * @param rng Current interval width (0x8000..0xFFFF)
     * @return Bits used, scaled by 1 << BITRES
     */
    inline uint32_t tell_frac(uint32_t nbits_total, uint32_t rng) {
        uint32_t nbits = nbits_total << BITRES;
        uint32_t l = 0;
        for (int i = BITRES; i-- > 0;) {
            rng = rng * rng >> 15;
            uint32_t b = rng >> 16;
            l = l << 1 | b;
            rng >>= b;
        }
        return nbits - l;
    }
}

#endif // RC_FORMAT_HPP
