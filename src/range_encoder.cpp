#include "range_encoder.hpp"
#include "rc_debug.hpp"
#include "rc_format.hpp"
#include <stdexcept>
#include <string>

RangeEncoder::RangeEncoder()
    : low_(0),
      rng_(RCFormat::RNG_INIT),
      cnt_(RCFormat::ENCODER_CNT_INIT),
      state_(State::FRESH) {
}

void RangeEncoder::encode_bool(bool value, unsigned f) {
    check_active("encode_bool");
    if (f < 1 || f >= RCFormat::PROB_TOP) {
        RC_DEBUG_LOG("encode_bool: probability " << f << " out of range");
        throw std::invalid_argument("Probability must be between 1 and 32767");
    }

    uint32_t l = low_;
    uint32_t r = rng_;
    uint32_t v = ((r >> 8) * f) >> 7;

    // A true value takes the top v values of the interval
    if (value) {
        l += r - v;
    }
    r = value ? v : r - v;

    normalize(l, r);
}

void RangeEncoder::encode_bit(int bit) {
    encode_bool(bit != 0, RCFormat::PROB_TOP >> 1);
}

void RangeEncoder::encode_literal(uint32_t value, int num_bits) {
    if (num_bits < 1 || num_bits > 32) {
        throw std::invalid_argument("num_bits must be between 1 and 32");
    }
    for (int i = num_bits - 1; i >= 0; i--) {
        encode_bit((value >> i) & 1);
    }
}

void RangeEncoder::encode_cdf(int symbol, const std::vector<uint16_t>& icdf) {
    check_active("encode_cdf");
    CdfModel::validate(icdf);
    if (symbol < 0 || symbol >= static_cast<int>(icdf.size())) {
        throw std::invalid_argument("Symbol index out of range");
    }
    encode_cdf_q15(symbol, icdf.data());
}

void RangeEncoder::encode_symbol(int symbol, CdfModel& model) {
    check_active("encode_symbol");
    if (symbol < 0 || symbol >= model.num_symbols()) {
        throw std::invalid_argument("Symbol index out of range");
    }
    encode_cdf_q15(symbol, model.icdf().data());
    model.update(symbol);
}

void RangeEncoder::encode_cdf_q15(int symbol, const uint16_t* icdf) {
    unsigned fl = symbol > 0 ? icdf[symbol - 1] : RCFormat::PROB_TOP;
    encode_q15(fl, icdf[symbol]);
}

void RangeEncoder::encode_q15(unsigned fl, unsigned fh) {
    check_active("encode_q15");
    if (fl > RCFormat::PROB_TOP || fh >= fl) {
        RC_DEBUG_LOG("encode_q15: empty range fl=" << fl << " fh=" << fh);
        throw std::invalid_argument("Symbol has zero probability in CDF table");
    }

    uint32_t l = low_;
    uint32_t r = rng_;
    if (fl < RCFormat::PROB_TOP) {
        uint32_t u = ((r >> 8) * fl) >> 7;
        uint32_t v = ((r >> 8) * fh) >> 7;
        l += r - u;
        r = u - v;
    } else {
        r -= ((r >> 8) * fh) >> 7;
    }

    normalize(l, r);
}

std::vector<uint8_t> RangeEncoder::done() {
    check_active("done");

    // Find the shortest value e in [low, low + rng) whose trailing bits can
    // be anything: e is low rounded up to a multiple of m + 1
    uint32_t l = low_;
    uint32_t r = rng_;
    int c = cnt_;
    int s = 9;
    uint32_t m = 0x7FFF;
    uint32_t e = (l + m) & ~m;
    while ((e | m) >= l + r) {
        s++;
        m >>= 1;
        e = (l + m) & ~m;
    }
    s += c;

    // Flush the significant bits of e through the precarry buffer
    if (s > 0) {
        uint32_t n = (1U << (c + 16)) - 1;
        do {
            precarry_.write_unit(static_cast<uint16_t>(e >> (c + 16)));
            e &= n;
            s -= 8;
            c -= 8;
            n >>= 8;
        } while (s > 0);
    }

    state_ = State::FINALIZED;
    std::vector<uint8_t> out = precarry_.resolve();
    RC_DEBUG_LOG("done: " << out.size() << " bytes");
    return out;
}

int RangeEncoder::tell() const {
    // The 10 counteracts the -9 baked into cnt and adds one bit reserved
    // for terminating the stream
    return cnt_ + 10 + static_cast<int>(precarry_.size()) * 8;
}

uint32_t RangeEncoder::tell_frac() const {
    return RCFormat::tell_frac(static_cast<uint32_t>(tell()), rng_);
}

void RangeEncoder::normalize(uint32_t low, unsigned rng) {
    int c = cnt_;
    const int d = 16 - RCFormat::ilog_nz(rng);
    int s = c + d;

    // Enough bits accumulated: move one or two bytes (plus carry) out of low
    if (s >= 0) {
        c += 16;
        uint32_t m = (1U << c) - 1;
        if (s >= 8) {
            precarry_.write_unit(static_cast<uint16_t>(low >> c));
            low &= m;
            c -= 8;
            m >>= 8;
        }
        precarry_.write_unit(static_cast<uint16_t>(low >> c));
        s = c + d - 24;
        low &= m;
    }

    low_ = low << d;
    rng_ = static_cast<uint16_t>(rng << d);
    cnt_ = static_cast<int16_t>(s);
    state_ = State::ACTIVE;
}

void RangeEncoder::check_active(const char* op) const {
    if (state_ == State::FINALIZED) {
        RC_DEBUG_LOG(op << " called on a finalized encoder");
        throw std::logic_error(std::string("RangeEncoder: ") + op + " after done()");
    }
}
