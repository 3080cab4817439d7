#include "range_decoder.hpp"
#include "rc_debug.hpp"
#include "rc_format.hpp"
#include <stdexcept>
#include <utility>

RangeDecoder::RangeDecoder(std::vector<uint8_t> buffer)
    : input_(std::move(buffer)) {
    init();
}

RangeDecoder::RangeDecoder(const uint8_t* data, size_t storage)
    : input_(data, storage) {
    init();
}

void RangeDecoder::init() {
    // The window starts as the complement of an all-zero input
    dif_ = (static_cast<uint32_t>(1) << (RCFormat::WINDOW_SIZE - 1)) - 1;
    rng_ = RCFormat::RNG_INIT;
    cnt_ = RCFormat::DECODER_CNT_INIT;
    tell_offs_ = 10 - (RCFormat::WINDOW_SIZE - 8);
    state_ = State::FRESH;
    error_ = false;
    refill();
}

bool RangeDecoder::decode_bool(unsigned f) {
    if (f < 1 || f >= RCFormat::PROB_TOP) {
        RC_DEBUG_LOG("decode_bool: probability " << f << " out of range");
        throw std::invalid_argument("Probability must be between 1 and 32767");
    }

    uint32_t dif = dif_;
    uint32_t r = rng_;
    uint32_t v = ((r >> 8) * f) >> 7;
    uint32_t vw = v << (RCFormat::WINDOW_SIZE - 16);

    // The top v values of the range decode as true
    int ret = 1;
    uint32_t r_new = v;
    if (dif >= vw) {
        r_new = r - v;
        dif -= vw;
        ret = 0;
    }
    return normalize(dif, r_new, ret) != 0;
}

int RangeDecoder::decode_bit() {
    return decode_bool(RCFormat::PROB_TOP >> 1) ? 1 : 0;
}

uint32_t RangeDecoder::decode_literal(int num_bits) {
    if (num_bits < 1 || num_bits > 32) {
        throw std::invalid_argument("num_bits must be between 1 and 32");
    }

    uint32_t value = 0;
    for (int i = num_bits - 1; i >= 0; i--) {
        value |= static_cast<uint32_t>(decode_bit()) << i;
    }
    return value;
}

int RangeDecoder::decode_cdf(const std::vector<uint16_t>& icdf) {
    CdfModel::validate(icdf);
    return decode_cdf_q15(icdf.data());
}

int RangeDecoder::decode_symbol(CdfModel& model) {
    int symbol = decode_cdf_q15(model.icdf().data());
    model.update(symbol);
    return symbol;
}

int RangeDecoder::decode_cdf_q15(const uint16_t* icdf) {
    uint32_t dif = dif_;
    uint32_t r = rng_;
    uint32_t c = dif >> (RCFormat::WINDOW_SIZE - 16);

    // Walk the splits from the top of the range down; the table ends in 0,
    // so the loop stops at the last symbol at the latest
    uint32_t u;
    uint32_t v = r;
    int ret = -1;
    do {
        u = v;
        v = ((r >> 8) * static_cast<uint32_t>(icdf[++ret])) >> 7;
    } while (c < v);

    r = u - v;
    dif -= v << (RCFormat::WINDOW_SIZE - 16);
    return normalize(dif, r, ret);
}

int RangeDecoder::tell() const {
    return static_cast<int>(input_.position()) * 8 - cnt_ + tell_offs_;
}

uint32_t RangeDecoder::tell_frac() const {
    return RCFormat::tell_frac(static_cast<uint32_t>(tell()), rng_);
}

void RangeDecoder::refill() {
    uint32_t dif = dif_;
    int cnt = cnt_;
    int s = RCFormat::WINDOW_SIZE - 9 - (cnt + 15);
    for (; s >= 0 && !input_.eof(); s -= 8) {
        dif ^= static_cast<uint32_t>(input_.read_byte()) << s;
        cnt += 8;
    }

    // Out of input: pretend there are lots of zero bits left and book the
    // difference so tell() stays exact
    if (input_.eof()) {
        tell_offs_ += RCFormat::LOTS_OF_BITS - cnt;
        cnt = RCFormat::LOTS_OF_BITS;
    }

    dif_ = dif;
    cnt_ = static_cast<int16_t>(cnt);
}

int RangeDecoder::normalize(uint32_t dif, unsigned rng, int ret) {
    const int d = 16 - RCFormat::ilog_nz(rng);
    cnt_ = static_cast<int16_t>(cnt_ - d);

    // This is equivalent to shifting in 1's instead of 0's
    dif_ = ((dif + 1) << d) - 1;
    rng_ = static_cast<uint16_t>(rng << d);
    if (cnt_ < 0) {
        refill();
    }

    state_ = State::ACTIVE;
    if (!error_ && tell() - 1 > static_cast<int>(input_.size()) * 8) {
        error_ = true;
        RC_DEBUG_LOG("read past end of " << input_.size() << "-byte stream, tell=" << tell());
    }
    return ret;
}
