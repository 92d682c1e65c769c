#ifndef GF_H
#define GF_H

#include <stdint.h>
#include <string.h>

#include "status.hpp"

namespace QR
{

#define GF_ORDER     256   ///< number of field elements
#define GF_PRIMITIVE 0x11D ///< x^8 + x^4 + x^3 + x^2 + 1

    /// GF(2^8) arithmetic through exp/log tables.
    class GaloisField
    {
    public:
        /// Builds the tables by repeated multiplication by 2 reduced modulo the primitive polynomial
        /// \param primitive - 9-bit primitive polynomial
        explicit GaloisField(uint16_t primitive = GF_PRIMITIVE)
        {
            memset(_exp, 0, sizeof(_exp));
            memset(_log, 0, sizeof(_log));

            uint16_t x = 1;
            for(uint16_t i = 0; i < GF_ORDER - 1; i++)
            {
                _exp[i] = (uint8_t)x;
                _log[x] = (uint8_t)i;
                x <<= 1;
                if(x > GF_ORDER - 1) x ^= primitive;
            }
        }

        inline uint8_t add(uint8_t a, uint8_t b) const
        {
            return a ^ b;
        }

        inline uint8_t sub(uint8_t a, uint8_t b) const
        {
            return a ^ b;
        }

        inline uint8_t mul(uint8_t a, uint8_t b) const
        {
            if(a == 0 || b == 0) return 0;
            return _exp[((uint16_t)_log[a] + _log[b]) % (GF_ORDER - 1)];
        }

        /// Field division a / b
        /// \param dst - quotient, untouched on failure
        /// \return STATUS_DIVISION_BY_ZERO if b is zero
        inline Status div(uint8_t a, uint8_t b, uint8_t* dst) const
        {
            if(b == 0) return STATUS_DIVISION_BY_ZERO;
            if(a == 0)
            {
                *dst = 0;
                return STATUS_OK;
            }
            *dst = _exp[((uint16_t)_log[a] + (GF_ORDER - 1) - _log[b]) % (GF_ORDER - 1)];
            return STATUS_OK;
        }

        /// Discrete logarithm of a nonzero element
        /// \return STATUS_UNDEFINED_LOG for zero
        inline Status log(uint8_t a, uint8_t* dst) const
        {
            if(a == 0) return STATUS_UNDEFINED_LOG;
            *dst = _log[a];
            return STATUS_OK;
        }

        /// alpha^i, i taken modulo the multiplicative group order
        inline uint8_t exp(uint16_t i) const
        {
            return _exp[i % (GF_ORDER - 1)];
        }

    private:
        uint8_t  _exp[GF_ORDER - 1];
        uint8_t  _log[GF_ORDER];
    };

} // namespace QR

#endif // GF_H
