#ifndef POLY_H
#define POLY_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "gf.hpp"

namespace QR
{

    /// Polynomial over GF(256), highest-degree coefficient first.
    /// Always normalized: no leading zero unless it is the zero polynomial [0].
    /// Operations never mutate the operands, they return a new polynomial.
    struct Poly
    {
        Poly() : _field(NULL), _coeffs(1, 0) { }

        Poly(const GaloisField* field, const std::vector<uint8_t>& coeffs) : _field(field), _coeffs(coeffs)
        {
            Normalize();
        }

        Poly(const GaloisField* field, const uint8_t* src, uint16_t len) : _field(field), _coeffs(src, src + len)
        {
            Normalize();
        }

        /// x^degree * coefficient
        static Poly Monomial(const GaloisField* field, uint16_t degree, uint8_t coefficient)
        {
            std::vector<uint8_t> coeffs((size_t)degree + 1, 0);
            coeffs[0] = coefficient;
            return Poly(field, coeffs);
        }

        inline bool IsZero() const
        {
            return _coeffs.size() == 1 && _coeffs[0] == 0;
        }

        inline uint16_t Degree() const
        {
            return (uint16_t)(_coeffs.size() - 1);
        }

        /// Coefficient of the highest-degree term
        inline uint8_t Lead() const
        {
            return _coeffs[0];
        }

        inline uint8_t at(uint16_t i) const
        {
            assert(i < _coeffs.size());
            return _coeffs[i];
        }

        inline const std::vector<uint8_t>& Coeffs() const
        {
            return _coeffs;
        }

        inline const GaloisField* field() const
        {
            return _field;
        }

        /// Sum (and difference) of two polynomials: overlapping terms are XORed from the low-degree end
        Poly AddOrSubtract(const Poly& other) const
        {
            if(IsZero()) return other;
            if(other.IsZero()) return *this;

            const std::vector<uint8_t>* shorter = &_coeffs;
            const std::vector<uint8_t>* longer = &other._coeffs;
            if(shorter->size() > longer->size())
            {
                const std::vector<uint8_t>* tmp = shorter;
                shorter = longer;
                longer = tmp;
            }

            std::vector<uint8_t> sum(*longer);
            size_t diff = longer->size() - shorter->size();
            for(size_t i = 0; i < shorter->size(); i++)
            {
                sum[diff + i] = _field->add(sum[diff + i], (*shorter)[i]);
            }

            return Poly(_field, sum);
        }

        /// Full convolution
        Poly Multiply(const Poly& other) const
        {
            if(IsZero() || other.IsZero()) return Poly(_field, std::vector<uint8_t>(1, 0));

            std::vector<uint8_t> product(_coeffs.size() + other._coeffs.size() - 1, 0);
            for(size_t i = 0; i < _coeffs.size(); i++)
            {
                if(_coeffs[i] == 0) continue;
                for(size_t j = 0; j < other._coeffs.size(); j++)
                {
                    product[i + j] = _field->add(product[i + j], _field->mul(_coeffs[i], other._coeffs[j]));
                }
            }

            return Poly(_field, product);
        }

        /// Scales every coefficient and raises the degree
        /// \param degree - number of zero terms appended at the low end
        /// \param coefficient - field scale factor
        Poly MultiplyByMonomial(uint16_t degree, uint8_t coefficient) const
        {
            if(IsZero() || coefficient == 0) return Poly(_field, std::vector<uint8_t>(1, 0));

            std::vector<uint8_t> product(_coeffs.size() + degree, 0);
            for(size_t i = 0; i < _coeffs.size(); i++)
            {
                product[i] = _field->mul(_coeffs[i], coefficient);
            }

            return Poly(_field, product);
        }

        /// Long division over the field
        /// \param divisor - must not be the zero polynomial
        /// \param quotient - may be NULL
        /// \param remainder - may be NULL
        /// \return STATUS_POLY_DIVISION_BY_ZERO for a zero divisor
        Status Divide(const Poly& divisor, Poly* quotient, Poly* remainder) const
        {
            if(divisor.IsZero()) return STATUS_POLY_DIVISION_BY_ZERO;

            Poly quot(_field, std::vector<uint8_t>(1, 0));
            Poly rem(*this);

            const uint16_t divisor_degree = divisor.Degree();
            const uint8_t  divisor_lead = divisor.Lead();

            while(!rem.IsZero() && rem.Degree() >= divisor_degree)
            {
                uint16_t degree_diff = (uint16_t)(rem.Degree() - divisor_degree);
                uint8_t scale = 0;
                Status st = _field->div(rem.Lead(), divisor_lead, &scale);
                if(st != STATUS_OK) return st;

                quot = quot.AddOrSubtract(Monomial(_field, degree_diff, scale));
                rem = rem.AddOrSubtract(divisor.MultiplyByMonomial(degree_diff, scale));
            }

            if(quotient) *quotient = quot;
            if(remainder) *remainder = rem;
            return STATUS_OK;
        }

    protected:

        /// Strips leading zero coefficients, an empty or all-zero input becomes [0]
        void Normalize()
        {
            size_t first_nonzero = 0;
            while(first_nonzero < _coeffs.size() && _coeffs[first_nonzero] == 0) first_nonzero++;

            if(first_nonzero == _coeffs.size())
            {
                _coeffs.assign(1, 0);
            }
            else if(first_nonzero > 0)
            {
                _coeffs.erase(_coeffs.begin(), _coeffs.begin() + (ptrdiff_t)first_nonzero);
            }
        }

        const GaloisField*   _field;  ///< Field the coefficients live in, not owned
        std::vector<uint8_t> _coeffs; ///< Coefficients, highest degree first
    };

} // namespace QR

#endif // POLY_H
