/**
 * @file byte_stream.cpp
 * @brief Implementation of memory-based byte stream utilities.
 */

#include "byte_stream.hpp"
#include <utility>

// ============================================================================
//  PrecarryOutputStream Implementation
// ============================================================================

void PrecarryOutputStream::write_unit(uint16_t unit) {
    units_.push_back(unit);
}

std::vector<uint8_t> PrecarryOutputStream::resolve() const {
    std::vector<uint8_t> out(units_.size());

    // Ripple carries from the least significant (last) unit backward
    uint32_t carry = 0;
    for (size_t offs = units_.size(); offs > 0; offs--) {
        carry += units_[offs - 1];
        out[offs - 1] = static_cast<uint8_t>(carry);
        carry >>= 8;
    }
    return out;
}

void PrecarryOutputStream::clear() {
    units_.clear();
}

// ============================================================================
//  ByteInputStream Implementation
// ============================================================================

ByteInputStream::ByteInputStream(std::vector<uint8_t> source_buffer)
    : buffer_(std::move(source_buffer)), byte_pos_(0) {
}

ByteInputStream::ByteInputStream(const uint8_t* data, size_t storage)
    : byte_pos_(0) {
    if (data == nullptr && storage > 0) {
        throw std::invalid_argument("ByteInputStream: null buffer with non-zero length");
    }
    if (storage > 0) {
        buffer_.assign(data, data + storage);
    }
}

uint8_t ByteInputStream::read_byte() {
    // Past the declared end the stream reads as zeros
    if (byte_pos_ >= buffer_.size()) {
        return 0;
    }
    return buffer_[byte_pos_++];
}

bool ByteInputStream::eof() const {
    return byte_pos_ >= buffer_.size();
}
