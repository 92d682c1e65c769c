#ifndef BITSTREAM_H
#define BITSTREAM_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "status.hpp"

namespace QR
{

    /// Growable MSB-first bit buffer with an append cursor and an independent read cursor.
    class BitStream
    {
    public:
        BitStream() : length(0), read_pos(0) { }

        /// Append the low bits of a value, most significant bit first
        /// \param value - must be below 2^bit_count
        /// \param bit_count - number of bits, 0 appends nothing
        /// \return STATUS_INVALID_VALUE if value does not fit
        Status Append(uint32_t value, uint8_t bit_count)
        {
            if(bit_count == 0) return STATUS_OK;
            if(bit_count > 32 || (uint64_t)value >= ((uint64_t)1 << bit_count)) return STATUS_INVALID_VALUE;

            PushBits(value, bit_count);
            return STATUS_OK;
        }

        /// Bulk append of 8-bit groups
        void AppendBytes(const uint8_t* src, size_t count)
        {
            if(length % 8 == 0)
            {
                bytes.insert(bytes.end(), src, src + count);
                length += count * 8;
                return;
            }
            for(size_t i = 0; i < count; i++)
            {
                PushBits(src[i], 8);
            }
        }

        inline void AppendBytes(const std::vector<uint8_t>& src)
        {
            if(!src.empty()) AppendBytes(&src[0], src.size());
        }

        /// Consume the next unread bit
        /// \return false once every written bit has been read
        bool PopBit(uint8_t* bit)
        {
            if(read_pos >= length) return false;
            *bit = (uint8_t)((bytes[read_pos / 8] >> (7 - read_pos % 8)) & 1);
            read_pos++;
            return true;
        }

        /// Total bits written
        inline size_t Length() const
        {
            return length;
        }

        inline size_t Remaining() const
        {
            return length - read_pos;
        }

        /// Copy out the backing bytes
        /// \return STATUS_MISALIGNED unless the length is a multiple of 8
        Status GetBytes(std::vector<uint8_t>* dst) const
        {
            if(length % 8 != 0) return STATUS_MISALIGNED;
            *dst = bytes;
            return STATUS_OK;
        }

        /// Restart reading from the first bit
        inline void Rewind()
        {
            read_pos = 0;
        }

        inline void Clear()
        {
            bytes.clear();
            length = 0;
            read_pos = 0;
        }

    private:
        void PushBits(uint32_t value, uint8_t bit_count)
        {
            for(int i = bit_count - 1; i >= 0; i--)
            {
                size_t byte_index = length / 8;
                uint8_t bit_in_byte = (uint8_t)(length % 8);

                if(bit_in_byte == 0) bytes.push_back(0);
                if((value >> i) & 1) bytes[byte_index] |= (uint8_t)(1 << (7 - bit_in_byte));
                length++;
            }
        }

        std::vector<uint8_t> bytes;
        size_t length;   ///< bits written
        size_t read_pos; ///< bits consumed
    };

} // namespace QR

#endif // BITSTREAM_H
