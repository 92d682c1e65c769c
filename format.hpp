#ifndef FORMAT_H
#define FORMAT_H

#include <stdint.h>

#include "mask.hpp"
#include "status.hpp"
#include "version.hpp"

namespace QR
{

#define QR_FORMAT_GENERATOR  0x537  ///< x^10 + x^8 + x^5 + x^4 + x^2 + x + 1
#define QR_FORMAT_XOR_MASK   0x5412
#define QR_VERSION_GENERATOR 0x1F25 ///< x^12 + x^11 + x^10 + x^9 + x^8 + x^5 + x^2 + 1

    /// 15-bit format information: level code, mask index and a 10-bit BCH remainder, masked
    /// \param mask - 0..7, callers validate it first
    inline uint16_t GenerateFormatBits(Ecc ecl, int mask)
    {
        assert(mask >= 0 && mask < MASK_COUNT);

        uint32_t info = ((uint32_t)EccFormatBits(ecl) << 3) | (uint32_t)mask;
        uint32_t data = info << 10;
        for(int i = 14; i >= 10; i--)
        {
            if((data >> i) & 1) data ^= (uint32_t)QR_FORMAT_GENERATOR << (i - 10);
        }
        return (uint16_t)(((info << 10) | (data & 0x3FF)) ^ QR_FORMAT_XOR_MASK);
    }

    /// 18-bit version information: 6-bit version and a 12-bit BCH remainder
    inline uint32_t GenerateVersionInfoBits(int version)
    {
        uint32_t data = (uint32_t)version << 12;
        for(int i = 17; i >= 12; i--)
        {
            if((data >> i) & 1) data ^= (uint32_t)QR_VERSION_GENERATOR << (i - 12);
        }
        return ((uint32_t)version << 12) | data;
    }

} // namespace QR

#endif // FORMAT_H
