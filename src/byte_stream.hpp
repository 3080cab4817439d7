#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

/**
 * @file byte_stream.hpp
 * @brief Memory-based byte stream utilities for the range coder.
 * * This file defines the PrecarryOutputStream and ByteInputStream classes.
 * The encoder renormalizes into a PrecarryOutputStream; the decoder refills
 * its window from a ByteInputStream.
 * * Key Features:
 * - Delayed carry: output units are 16 bits wide so a carry out of the
 *   encoder window can still land on an already-emitted byte.
 * - Single backward pass: carries are resolved once, when the stream ends.
 * - Owned input: the decoder side keeps its own copy of the bytes.
 * - Zero synthesis: reading past the declared end yields zero bytes.
 */

#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

/**
 * @brief Append-only log of not-yet-carry-resolved output units.
 * * Each unit holds one output byte in its low 8 bits plus any carry
 * that has to be added into the preceding byte. resolve() ripples the
 * carries backward and truncates every unit to a byte.
 */
class PrecarryOutputStream {
public:
    PrecarryOutputStream() = default;

    /**
     * @brief Append one unit to the log.
     * * @param unit Byte value plus carry (at most 0x1FF in practice).
     */
    void write_unit(uint16_t unit);

    /**
     * @brief Number of units appended so far (== bytes that resolve() emits).
     */
    size_t size() const { return units_.size(); }

    /**
     * @brief Resolve all carries and return the finished bytes.
     * * Walks the log from the last unit to the first, adding the running
     * carry to each unit and keeping the low byte. A carry out of the first
     * unit is dropped. The log itself is left untouched.
     * * @return std::vector<uint8_t> One byte per unit.
     */
    std::vector<uint8_t> resolve() const;

    /**
     * @brief Drop all buffered units.
     */
    void clear();

private:
    std::vector<uint16_t> units_; ///< Pending units in emission order.
};

/**
 * @brief Reads bytes from an owned memory buffer.
 * * The stream is bounded by a declared length which may be shorter than
 * the buffer handed in. Once the cursor reaches that length, eof() becomes
 * true and read_byte() keeps returning zero so the decoder can finish
 * deterministically.
 */
class ByteInputStream {
public:
    /**
     * @brief Construct a new Byte Input Stream object.
     * * @param source_buffer The compressed bytes (moved in).
     */
    explicit ByteInputStream(std::vector<uint8_t> source_buffer);

    /**
     * @brief Construct from the first @p storage bytes of a buffer.
     * * @param data Pointer to the compressed bytes (may be null if storage is 0).
     * @param storage Declared length in bytes.
     * @throw std::invalid_argument If data is null and storage is non-zero.
     */
    ByteInputStream(const uint8_t* data, size_t storage);

    /**
     * @brief Read the next byte.
     * * @return The byte at the cursor, or 0 once the declared end is reached.
     */
    uint8_t read_byte();

    /**
     * @brief Check if the declared end of the stream has been reached.
     */
    bool eof() const;

    /**
     * @brief Number of bytes consumed from the buffer.
     */
    size_t position() const { return byte_pos_; }

    /**
     * @brief Declared length of the stream in bytes.
     */
    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_; ///< Owned copy of the input data.
    size_t byte_pos_;             ///< Current index in the byte vector.
};

#endif // BYTE_STREAM_HPP
