#ifndef STATUS_H
#define STATUS_H

#if !defined QR_DEBUG && !defined __CC_ARM && !defined QR_NO_ASSERT
#include <assert.h>
#else
#undef assert
#define assert(dummy)
#endif

namespace QR
{

    /// Result of every fallible operation. STATUS_OK is zero so callers may test with `if(status)`.
    enum Status
    {
        STATUS_OK = 0,
        STATUS_INVALID_INPUT,           ///< version, level or option text out of range
        STATUS_INVALID_VALUE,           ///< value does not fit in the requested bit count
        STATUS_MISALIGNED,              ///< bit length is not a multiple of 8
        STATUS_CAPACITY_EXCEEDED,       ///< payload does not fit the symbol
        STATUS_UNDEFINED_LOG,           ///< log(0) in GF(256)
        STATUS_DIVISION_BY_ZERO,        ///< division by the zero field element
        STATUS_POLY_DIVISION_BY_ZERO,   ///< division by the zero polynomial
        STATUS_INVALID_MASK,            ///< mask index outside [0,7]
        STATUS_INTERNAL_FAULT           ///< table or logic defect
    };

    inline const char* StatusName(Status s)
    {
        switch(s)
        {
            case STATUS_OK:                    return "OK";
            case STATUS_INVALID_INPUT:         return "INVALID_INPUT";
            case STATUS_INVALID_VALUE:         return "INVALID_VALUE";
            case STATUS_MISALIGNED:            return "MISALIGNED";
            case STATUS_CAPACITY_EXCEEDED:     return "CAPACITY_EXCEEDED";
            case STATUS_UNDEFINED_LOG:         return "UNDEFINED_LOG";
            case STATUS_DIVISION_BY_ZERO:      return "DIVISION_BY_ZERO";
            case STATUS_POLY_DIVISION_BY_ZERO: return "POLY_DIVISION_BY_ZERO";
            case STATUS_INVALID_MASK:          return "INVALID_MASK";
            case STATUS_INTERNAL_FAULT:        return "INTERNAL_FAULT";
        }
        return "UNKNOWN";
    }

    inline const char* StatusMessage(Status s)
    {
        switch(s)
        {
            case STATUS_OK:                    return "success";
            case STATUS_INVALID_INPUT:         return "invalid input parameter";
            case STATUS_INVALID_VALUE:         return "value is too large for the requested bit count";
            case STATUS_MISALIGNED:            return "bit length must be a multiple of 8";
            case STATUS_CAPACITY_EXCEEDED:     return "data does not fit in the selected version and error correction level";
            case STATUS_UNDEFINED_LOG:         return "log(0) is undefined";
            case STATUS_DIVISION_BY_ZERO:      return "division by zero";
            case STATUS_POLY_DIVISION_BY_ZERO: return "division by the zero polynomial";
            case STATUS_INVALID_MASK:          return "mask pattern must be between 0 and 7";
            case STATUS_INTERNAL_FAULT:        return "final bit stream length mismatch";
        }
        return "unknown error";
    }

} // namespace QR

#endif // STATUS_H
