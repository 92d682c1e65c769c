#ifndef QR_HPP
#define QR_HPP

#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "bitstream.hpp"
#include "format.hpp"
#include "mask.hpp"
#include "matrix.hpp"
#include "rs.hpp"
#include "status.hpp"
#include "version.hpp"

namespace QR
{

#define QR_PAD_BYTE_0 0xEC
#define QR_PAD_BYTE_1 0x11

    /// Turns a byte payload into a finished QR Code module grid for one version and level
    class Encoder
    {
    public:
        Encoder() : info(), initialized(false), mask_pattern(MASK_AUTO), selected_mask(MASK_AUTO), penalty(0) { }

        /// Select the symbol parameters
        /// \param version - 1..40
        /// \param ecl - error correction level
        /// \param mask - 0..7 pins the mask, MASK_AUTO searches all eight
        /// \return STATUS_INVALID_INPUT or STATUS_INVALID_MASK
        Status Init(int version, Ecc ecl, int mask = MASK_AUTO)
        {
            initialized = false;
            Status st = GetVersionInfo(version, ecl, &info);
            if(st != STATUS_OK) return st;
            if(mask != MASK_AUTO && (mask < 0 || mask >= MASK_COUNT)) return STATUS_INVALID_MASK;

            mask_pattern = mask;
            selected_mask = MASK_AUTO;
            penalty = 0;
            initialized = true;
            return STATUS_OK;
        }

        /// Encode the payload and produce the finished grid
        /// \param data - payload bytes
        /// \param mode - mode indicator, only MODE_BYTE is supported
        /// \param dst - receives a fully resolved grid, untouched on failure
        Status Render(const std::vector<uint8_t>& data, Mode mode, Matrix* dst)
        {
            if(!initialized) return STATUS_INVALID_INPUT;

            std::vector<uint8_t> codewords;
            Status st = BuildDataCodewords(data, mode, &codewords);
            if(st != STATUS_OK) return st;

            BitStream final_stream;
            st = InterleaveBlocks(codewords, &final_stream);
            if(st != STATUS_OK) return st;

            Matrix result;
            if(mask_pattern != MASK_AUTO)
            {
                st = GenerateMatrix(final_stream, mask_pattern, &result);
                if(st != STATUS_OK) return st;
                selected_mask = mask_pattern;
                penalty = 0;
            }
            else
            {
                st = FindBestMask(final_stream, &result);
                if(st != STATUS_OK) return st;
            }

            *dst = result;
            return STATUS_OK;
        }

        inline Status Render(const uint8_t* data, size_t len, Matrix* dst)
        {
            return Render(std::vector<uint8_t>(data, data + len), MODE_BYTE, dst);
        }

        /// Mode header, length field, payload, terminator and pad codewords
        /// \param dst - exactly data_codeword_count bytes
        /// \return STATUS_CAPACITY_EXCEEDED if the payload does not fit
        Status BuildDataCodewords(const std::vector<uint8_t>& data, Mode mode, std::vector<uint8_t>* dst) const
        {
            if(!initialized || mode != MODE_BYTE) return STATUS_INVALID_INPUT;

            const size_t capacity_bits = (size_t)info.data_codeword_count * 8;
            const size_t required_bits = 4 + (size_t)info.char_count_bits + data.size() * 8;
            if(required_bits > capacity_bits) return STATUS_CAPACITY_EXCEEDED;

            BitStream bits;
            Status st = bits.Append((uint32_t)mode, 4);
            if(st != STATUS_OK) return st;

            st = bits.Append((uint32_t)data.size(), (uint8_t)info.char_count_bits);
            if(st == STATUS_INVALID_VALUE) return STATUS_CAPACITY_EXCEEDED;
            if(st != STATUS_OK) return st;

            bits.AppendBytes(data);

            if(bits.Length() + 4 <= capacity_bits)
            {
                st = bits.Append(0, 4);
                if(st != STATUS_OK) return st;
            }
            while(bits.Length() % 8 != 0)
            {
                st = bits.Append(0, 1);
                if(st != STATUS_OK) return st;
            }

            static const uint8_t PAD_BYTES[2] = { QR_PAD_BYTE_0, QR_PAD_BYTE_1 };
            for(int i = 0; bits.Length() < capacity_bits; i++)
            {
                st = bits.Append(PAD_BYTES[i % 2], 8);
                if(st != STATUS_OK) return st;
            }

            return bits.GetBytes(dst);
        }

        /// Split into blocks, append Reed-Solomon ECC per block and interleave
        /// \param dst - exactly total_codeword_count * 8 bits
        /// \return STATUS_INTERNAL_FAULT on a length mismatch
        Status InterleaveBlocks(const std::vector<uint8_t>& data_codewords, BitStream* dst)
        {
            if(!initialized) return STATUS_INVALID_INPUT;

            const int ecc_count = info.ecc_per_block;
            const int block_count = info.block_count;
            const int total_count = info.total_codeword_count;

            const int long_block_count = total_count % block_count;
            const int short_block_count = block_count - long_block_count;
            const int short_block_len = total_count / block_count;
            const int short_block_data_len = short_block_len - ecc_count;
            const int long_block_data_len = short_block_data_len + 1;

            std::vector< std::vector<uint8_t> > data_blocks(block_count);
            std::vector< std::vector<uint8_t> > ecc_blocks(block_count);

            size_t offset = 0;
            for(int i = 0; i < block_count; i++)
            {
                size_t len = (size_t)(i < short_block_count ? short_block_data_len : long_block_data_len);
                if(offset + len > data_codewords.size()) return STATUS_INTERNAL_FAULT;

                data_blocks[i].assign(data_codewords.begin() + offset, data_codewords.begin() + offset + len);
                offset += len;

                Status st = coder.Encode(data_blocks[i], ecc_count, &ecc_blocks[i]);
                if(st != STATUS_OK) return st;
            }

            dst->Clear();
            for(int i = 0; i < long_block_data_len; i++)
            {
                for(int j = 0; j < block_count; j++)
                {
                    /* short blocks have one data codeword less */
                    if(j < short_block_count && i == short_block_data_len) continue;
                    dst->AppendBytes(&data_blocks[j][i], 1);
                }
            }
            for(int i = 0; i < ecc_count; i++)
            {
                for(int j = 0; j < block_count; j++)
                {
                    dst->AppendBytes(&ecc_blocks[j][i], 1);
                }
            }

            if(dst->Length() != (size_t)total_count * 8) return STATUS_INTERNAL_FAULT;
            return STATUS_OK;
        }

        /// One mask trial: function patterns, format/version information, then masked data
        /// \param stream - replayed from its first bit, the caller's copy is not consumed
        Status GenerateMatrix(const BitStream& stream, int mask, Matrix* dst) const
        {
            if(mask < 0 || mask >= MASK_COUNT) return STATUS_INVALID_MASK;

            dst->Reset(info.module_count);
            DrawFunctionPatterns(mask, dst);

            BitStream bits(stream);
            bits.Rewind();
            return DrawData(&bits, mask, dst);
        }

        /// Everything but the data modules
        void DrawFunctionPatterns(int mask, Matrix* dst) const
        {
            DrawFixedPatterns(dst);
            dst->DrawFormatInfo(GenerateFormatBits(info.ecl, mask));
            if(info.version >= 7) dst->DrawVersionInfo(GenerateVersionInfoBits(info.version));
        }

        inline const VersionInfo& Info() const
        {
            return info;
        }

        /// Mask used by the last successful Render
        inline int SelectedMask() const
        {
            return selected_mask;
        }

        /// Penalty of the selected grid, 0 when the mask was pinned
        inline int Penalty() const
        {
            return penalty;
        }

#ifndef QR_DEBUG
    private:
#endif

        Status FindBestMask(const BitStream& stream, Matrix* dst)
        {
            int min_penalty = INT_MAX;
            int best_mask = 0;

            for(int mask = 0; mask < MASK_COUNT; mask++)
            {
                Matrix trial;
                Status st = GenerateMatrix(stream, mask, &trial);
                if(st != STATUS_OK) return st;

                int score = PenaltyScore(trial);
                if(score < min_penalty)
                {
                    min_penalty = score;
                    best_mask = mask;
                    *dst = trial;
                }
            }

            selected_mask = best_mask;
            penalty = min_penalty;
            return STATUS_OK;
        }

        void DrawFixedPatterns(Matrix* dst) const
        {
            const int size = info.module_count;

            dst->DrawFinderPattern(-1, -1);
            dst->DrawFinderPattern(size - 8, -1);
            dst->DrawFinderPattern(-1, size - 8);

            uint8_t positions[7];
            int count = AlignmentPatternPositions(info.version, positions);
            for(int i = 0; i < count; i++)
            {
                for(int j = 0; j < count; j++)
                {
                    dst->DrawAlignmentPattern(positions[j] - 2, positions[i] - 2);
                }
            }

            dst->DrawTimingPattern(8, 6, size - 16, false);
            dst->DrawTimingPattern(6, 8, size - 16, true);
            dst->set(8, size - 8, MODULE_DARK);
        }

        /// Deposit bits along the zigzag path into every still unset module
        Status DrawData(BitStream* bits, int mask, Matrix* dst) const
        {
            std::vector<Cell> path = ZigzagPath(dst->size());
            for(size_t i = 0; i < path.size(); i++)
            {
                const Cell& c = path[i];
                if(dst->at(c.x, c.y) != MODULE_UNSET) continue;

                uint8_t bit = 0;
                if(!bits->PopBit(&bit)) bit = 0;

                bool flip = false;
                Status st = MaskBit(mask, c.x, c.y, &flip);
                if(st != STATUS_OK) return st;

                dst->set(c.x, c.y, (int8_t)(flip ? bit ^ 1 : bit));
            }
            return STATUS_OK;
        }

        VersionInfo info;
        ReedSolomon coder;
        bool        initialized;
        int         mask_pattern;   ///< requested mask or MASK_AUTO
        int         selected_mask;
        int         penalty;
    };

} // namespace QR

#endif // QR_HPP
