#ifndef VERSION_H
#define VERSION_H

#include <stdint.h>

#include "status.hpp"

namespace QR
{

#define QR_MIN_VERSION 1
#define QR_MAX_VERSION 40

    /// Error correction level, values are the table index
    enum Ecc
    {
        ECC_L = 0,
        ECC_M,
        ECC_Q,
        ECC_H
    };

    /// Mode indicator written in the 4-bit header
    enum Mode
    {
        MODE_NUMERIC      = 1,
        MODE_ALPHANUMERIC = 2,
        MODE_BYTE         = 4,
        MODE_KANJI        = 8
    };

    /// Two-bit level code packed into the format information
    inline uint8_t EccFormatBits(Ecc ecl)
    {
        switch(ecl)
        {
            case ECC_L: return 1;
            case ECC_M: return 0;
            case ECC_Q: return 3;
            case ECC_H: return 2;
        }
        return 0;
    }

    inline char EccName(Ecc ecl)
    {
        static const char names[] = "LMQH";
        return names[ecl & 3];
    }

    /// ECC codewords per block, indexed [level][version]
    static const int8_t ECC_CODEWORDS_PER_BLOCK[4][QR_MAX_VERSION + 1] =
    {
        // Version: (index 0 is padding)
        //0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40
        { -1,  7, 10, 15, 20, 26, 18, 20, 24, 30, 18, 20, 24, 26, 30, 22, 24, 28, 30, 28, 28, 28, 28, 30, 30, 26, 28, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30 }, // L
        { -1, 10, 16, 26, 18, 24, 16, 18, 22, 22, 26, 30, 22, 22, 24, 24, 28, 28, 26, 26, 26, 26, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28, 28 }, // M
        { -1, 13, 22, 18, 26, 18, 24, 18, 22, 20, 24, 28, 26, 24, 20, 30, 24, 28, 28, 26, 30, 28, 30, 30, 30, 30, 28, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30 }, // Q
        { -1, 17, 28, 22, 16, 22, 28, 26, 26, 24, 28, 24, 28, 22, 24, 24, 30, 28, 28, 26, 28, 30, 24, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30, 30 }  // H
    };

    /// Error correction block count, indexed [level][version]
    static const int8_t NUM_ERROR_CORRECTION_BLOCKS[4][QR_MAX_VERSION + 1] =
    {
        { -1,  1,  1,  1,  1,  1,  2,  2,  2,  2,  4,  4,  4,  4,  4,  6,  6,  6,  6,  7,  8,  8,  9,  9, 10, 12, 12, 12, 13, 14, 15, 16, 17, 18, 19, 19, 20, 21, 22, 24, 25 }, // L
        { -1,  1,  1,  1,  2,  2,  4,  4,  4,  5,  5,  5,  8,  9,  9, 10, 10, 11, 13, 14, 16, 17, 17, 18, 20, 21, 23, 25, 26, 28, 29, 31, 33, 35, 37, 38, 40, 43, 45, 47, 49 }, // M
        { -1,  1,  1,  2,  2,  4,  4,  6,  6,  8,  8,  8, 10, 12, 16, 12, 17, 16, 18, 21, 20, 23, 23, 25, 27, 29, 34, 34, 35, 38, 40, 43, 45, 48, 51, 53, 56, 59, 62, 65, 68 }, // Q
        { -1,  1,  1,  2,  4,  4,  4,  5,  6,  8,  8, 11, 11, 16, 16, 18, 16, 19, 21, 25, 25, 25, 34, 30, 32, 35, 37, 40, 42, 45, 48, 51, 54, 57, 60, 63, 66, 70, 74, 77, 81 }  // H
    };

    /// Per (version, level) symbol parameters
    struct VersionInfo
    {
        int version;
        Ecc ecl;
        int module_count;          ///< side of the module grid
        int total_codeword_count;  ///< data + ECC codewords
        int align_pattern_count;   ///< alignment pattern centers per axis
        int char_count_bits;       ///< width of the byte-mode length field
        int ecc_per_block;
        int block_count;
        int data_codeword_count;
    };

    /// Modules available for codewords once every function pattern is placed, remainder bits included
    inline int RawDataModuleCount(int version)
    {
        assert(version >= QR_MIN_VERSION && version <= QR_MAX_VERSION);
        int result = (16 * version + 128) * version + 64;
        if(version >= 2)
        {
            int num_align = version / 7 + 2;
            result -= (25 * num_align - 10) * num_align - 55;
            if(version >= 7) result -= 36;
        }
        return result;
    }

    inline int AlignmentPatternCount(int version)
    {
        return version == 1 ? 0 : version / 7 + 2;
    }

    /// Alignment pattern center coordinates, ascending, same on both axes
    /// \param dst - at least 7 entries
    /// \return number of coordinates written
    inline int AlignmentPatternPositions(int version, uint8_t* dst)
    {
        int count = AlignmentPatternCount(version);
        if(count == 0) return 0;

        int size = 21 + (version - 1) * 4;
        int step = (version == 32) ? 26 : (version * 4 + count * 2 + 1) / (count * 2 - 2) * 2;

        dst[0] = 6;
        for(int i = count - 1, pos = size - 7; i >= 1; i--, pos -= step)
        {
            dst[i] = (uint8_t)pos;
        }
        return count;
    }

    /// Byte-mode length field width. Versions 10-26 and 27-40 are both 16 bits for byte mode.
    inline int CharCountBits(int version)
    {
        return version <= 9 ? 8 : 16;
    }

    /// Look up the symbol parameters
    /// \return STATUS_INVALID_INPUT for a version outside [1,40] or an unknown level
    inline Status GetVersionInfo(int version, Ecc ecl, VersionInfo* dst)
    {
        if(version < QR_MIN_VERSION || version > QR_MAX_VERSION) return STATUS_INVALID_INPUT;
        if((int)ecl < (int)ECC_L || (int)ecl > (int)ECC_H) return STATUS_INVALID_INPUT;

        VersionInfo info;
        info.version = version;
        info.ecl = ecl;
        info.module_count = 21 + (version - 1) * 4;
        info.total_codeword_count = RawDataModuleCount(version) / 8;
        info.align_pattern_count = AlignmentPatternCount(version);
        info.char_count_bits = CharCountBits(version);
        info.ecc_per_block = ECC_CODEWORDS_PER_BLOCK[ecl][version];
        info.block_count = NUM_ERROR_CORRECTION_BLOCKS[ecl][version];
        info.data_codeword_count = info.total_codeword_count - info.ecc_per_block * info.block_count;

        if(info.data_codeword_count < 0) return STATUS_INTERNAL_FAULT;

        *dst = info;
        return STATUS_OK;
    }

} // namespace QR

#endif // VERSION_H
