#ifndef RS_HPP
#define RS_HPP

#include <stdint.h>
#include <vector>

#include "gf.hpp"
#include "poly.hpp"

namespace QR
{

    /// Systematic Reed-Solomon encoder over GF(256) with generator roots alpha^0 .. alpha^(n-1).
    class ReedSolomon
    {
    public:
        ReedSolomon() : field(GF_PRIMITIVE), generator_ecc_length(0), generator_cached(false) { }

        /// Compute ECC codewords for one message block
        /// \param msg - message bytes, highest-degree coefficient first
        /// \param ecc_length - number of ECC codewords; empty result when <= 0
        /// \param dst - receives exactly ecc_length codewords
        Status Encode(const std::vector<uint8_t>& msg, int ecc_length, std::vector<uint8_t>* dst)
        {
            dst->clear();
            if(ecc_length <= 0) return STATUS_OK;

            const Poly& gen = Generator((uint16_t)ecc_length);

            Poly info(&field, msg);
            info = info.MultiplyByMonomial((uint16_t)ecc_length, 1);

            Poly remainder;
            Status st = info.Divide(gen, NULL, &remainder);
            if(st != STATUS_OK) return st;

            /* remainder degree may be below ecc_length - 1, left-pad with zeros */
            const std::vector<uint8_t>& coeffs = remainder.Coeffs();
            dst->assign((size_t)ecc_length - coeffs.size(), 0);
            dst->insert(dst->end(), coeffs.begin(), coeffs.end());
            return STATUS_OK;
        }

        /// Construct generator polynomial g(x) = (x - a^0)(x - a^1)...(x - a^(n-1))
        const Poly& Generator(uint16_t ecc_length)
        {
            if(generator_cached && generator_ecc_length == ecc_length) return generator_cache;

            Poly gen(&field, std::vector<uint8_t>(1, 1));
            std::vector<uint8_t> mulp(2, 1);
            for(uint16_t i = 0; i < ecc_length; i++)
            {
                mulp[1] = field.exp(i);
                gen = gen.Multiply(Poly(&field, mulp));
            }

            generator_cache = gen;
            generator_ecc_length = ecc_length;
            generator_cached = true;
            return generator_cache;
        }

        inline const GaloisField& Field() const
        {
            return field;
        }

    private:
        GaloisField field;
        Poly        generator_cache;      ///< last generator built, blocks of one symbol share it
        uint16_t    generator_ecc_length;
        bool        generator_cached;

        ReedSolomon(const ReedSolomon&);
        ReedSolomon& operator=(const ReedSolomon&);
    };

} // namespace QR

#endif // RS_HPP
