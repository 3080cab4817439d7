#include "cdf_model.hpp"
#include "rc_debug.hpp"
#include "rc_format.hpp"
#include <stdexcept>

CdfModel::CdfModel(const std::vector<uint16_t>& icdf) {
    validate(icdf);

    num_symbols_ = static_cast<int>(icdf.size());
    icdf_ = icdf;
    icdf_.push_back(0);  // Adaptation counter
    initial_ = icdf_;
}

CdfModel CdfModel::uniform(int num_symbols) {
    if (num_symbols < 2 || num_symbols > RCFormat::MAX_SYMBOLS) {
        throw std::invalid_argument("num_symbols must be between 2 and 16");
    }

    std::vector<uint16_t> icdf(num_symbols);
    for (int i = 0; i < num_symbols; i++) {
        uint32_t cdf = (static_cast<uint32_t>(i) + 1) * RCFormat::PROB_TOP / num_symbols;
        icdf[i] = RCFormat::icdf(cdf);
    }
    return CdfModel(icdf);
}

void CdfModel::update(int symbol) {
    if (symbol < 0 || symbol >= num_symbols_) {
        throw std::invalid_argument("Symbol index out of range");
    }
    update_cdf(icdf_.data(), symbol, num_symbols_);
}

uint32_t CdfModel::probability(int symbol) const {
    if (symbol < 0 || symbol >= num_symbols_) {
        throw std::invalid_argument("Symbol index out of range");
    }
    uint32_t fl = symbol > 0 ? icdf_[symbol - 1] : RCFormat::PROB_TOP;
    return fl - icdf_[symbol];
}

void CdfModel::reset() {
    icdf_ = initial_;
}

void CdfModel::validate(const std::vector<uint16_t>& icdf) {
    if (icdf.size() < 2 || icdf.size() > static_cast<size_t>(RCFormat::MAX_SYMBOLS)) {
        RC_DEBUG_LOG("CDF table with " << icdf.size() << " entries rejected");
        throw std::invalid_argument("CDF table must have between 2 and 16 entries");
    }
    // Symbol 0 spans up to the top of the interval on both sides only if
    // its inverted entry is below 32768
    if (icdf[0] >= RCFormat::PROB_TOP) {
        throw std::invalid_argument("First CDF entry must leave symbol 0 non-zero probability");
    }
    for (size_t i = 1; i < icdf.size(); i++) {
        if (icdf[i] > icdf[i - 1]) {
            RC_DEBUG_LOG("CDF table not monotone at entry " << i);
            throw std::invalid_argument("CDF table must be monotone");
        }
    }
    if (icdf.back() != 0) {
        throw std::invalid_argument("CDF table must terminate at 32768");
    }
}

void CdfModel::update_cdf(uint16_t* icdf, int symbol, int num_symbols) {
    const int prob_top = static_cast<int>(RCFormat::PROB_TOP);
    const int count = icdf[num_symbols];

    // Slower adaptation for well-trained contexts and larger alphabets
    const int rate = 4 + (count > 31 ? 1 : 0) + (RCFormat::ilog_nz(num_symbols) - 1);

    // Minimum mass kept by every symbol: 1 << rate2 in Q15
    const int rate2 = 5;
    const int tmp0 = 1 << rate2;
    const int diff = ((prob_top - (num_symbols << rate2)) >> rate) << rate;

    // tmp walks the target table; it drops by diff at the coded symbol
    int tmp = prob_top - tmp0;
    for (int i = 0; i < num_symbols - 1; i++) {
        if (i == symbol) {
            tmp -= diff;
        }
        const int prev = icdf[i];
        icdf[i] = static_cast<uint16_t>(prev + ((tmp - prev) >> rate));
        tmp -= tmp0;
    }

    if (icdf[num_symbols] < RCFormat::MAX_ADAPT_COUNT) {
        icdf[num_symbols]++;
    }
}
