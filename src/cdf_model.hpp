#ifndef CDF_MODEL_HPP
#define CDF_MODEL_HPP

/**
 * @file cdf_model.hpp
 * @brief Adaptive Q15 CDF table for the range coder
 *
 * A CdfModel is the probability model of one coding context. It is owned by
 * the caller and borrowed by RangeEncoder / RangeDecoder for the duration of
 * a single call. After each adaptive call both sides apply the exact same
 * integer update, so the models stay in lockstep without any side
 * information in the bit stream.
 *
 * Table layout (n symbols, 2 <= n <= 16):
 * - icdf[0..n-1]: inverted CDF, icdf[i] = 32768 - P(symbol <= i) in Q15.
 *   Non-increasing, icdf[n-1] == 0.
 * - icdf[n]: adaptation counter, saturating at 32.
 */

#include <vector>
#include <cstdint>

/**
 * @brief Adaptive probability model for range coding
 *
 * The adaptation rate starts fast and slows down as the counter grows and as
 * the alphabet gets larger:
 *   rate = 4 + (count > 31) + floor(log2(n))
 *
 * Every entry is moved 1/2^rate of the way toward a target table that gives
 * the coded symbol almost all of the mass, with a floor of 32/32768 for each
 * other symbol.
 */
class CdfModel {
public:
    /**
     * Constructor.
     *
     * @param icdf Inverted CDF values, one per symbol, last one 0. The
     *             adaptation counter is appended and starts at 0.
     * @throw std::invalid_argument If the table is malformed.
     */
    explicit CdfModel(const std::vector<uint16_t>& icdf);

    /**
     * Build a model with equal probabilities for every symbol.
     *
     * @param num_symbols Alphabet size (2 to 16)
     */
    static CdfModel uniform(int num_symbols);

    /**
     * Update the model after encoding/decoding a symbol.
     *
     * @param symbol Symbol that was coded (0 to num_symbols-1)
     */
    void update(int symbol);

    /**
     * Get the full table: num_symbols inverted CDF entries followed by the
     * adaptation counter.
     */
    const std::vector<uint16_t>& icdf() const { return icdf_; }

    /**
     * Get the number of symbols in the alphabet.
     */
    int num_symbols() const { return num_symbols_; }

    /**
     * Get the adaptation counter (0 to 32).
     */
    int count() const { return icdf_[num_symbols_]; }

    /**
     * Get the Q15 probability currently assigned to a symbol.
     *
     * @param symbol Symbol index
     * @return Width of the symbol's sub-range out of 32768
     */
    uint32_t probability(int symbol) const;

    /**
     * Restore the table passed at construction.
     */
    void reset();

    bool operator==(const CdfModel& other) const { return icdf_ == other.icdf_; }
    bool operator!=(const CdfModel& other) const { return !(*this == other); }

    /**
     * Check that a table is a valid inverted CDF: 2 to 16 entries,
     * non-increasing, first entry below 32768, last entry 0.
     *
     * @param icdf Table without adaptation counter
     * @throw std::invalid_argument If any of the conditions fails
     */
    static void validate(const std::vector<uint16_t>& icdf);

    /**
     * Apply the adaptation rule to a raw table in place.
     *
     * @param icdf Table of num_symbols entries plus the counter cell
     * @param symbol Symbol that was coded
     * @param num_symbols Alphabet size
     */
    static void update_cdf(uint16_t* icdf, int symbol, int num_symbols);

private:
    int num_symbols_;
    std::vector<uint16_t> icdf_;     // Inverted CDF + adaptation counter
    std::vector<uint16_t> initial_;  // Table as constructed, for reset()
};

#endif // CDF_MODEL_HPP
