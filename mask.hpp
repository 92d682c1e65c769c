#ifndef MASK_H
#define MASK_H

#include <stdint.h>
#include <stdlib.h>

#include "matrix.hpp"
#include "status.hpp"

namespace QR
{

#define MASK_AUTO  (-1)
#define MASK_COUNT  8

#define PENALTY_N1  3
#define PENALTY_N2  3
#define PENALTY_N3 40
#define PENALTY_N4 10

    /// Mask condition at column x, row y. True flips the data bit.
    /// \return STATUS_INVALID_MASK for an index outside [0,7]
    inline Status MaskBit(int mask, int x, int y, bool* dst)
    {
        switch(mask)
        {
            case 0: *dst = (x + y) % 2 == 0; break;
            case 1: *dst = y % 2 == 0; break;
            case 2: *dst = x % 3 == 0; break;
            case 3: *dst = (x + y) % 3 == 0; break;
            case 4: *dst = (y / 2 + x / 3) % 2 == 0; break;
            case 5: *dst = (x * y) % 2 + (x * y) % 3 == 0; break;
            case 6: *dst = ((x * y) % 2 + (x * y) % 3) % 2 == 0; break;
            case 7: *dst = ((x + y) % 2 + (x * y) % 3) % 2 == 0; break;
            default: return STATUS_INVALID_MASK;
        }
        return STATUS_OK;
    }

    /* Rule 1: runs of five or more same-colored modules in a row or column */
    inline int PenaltyRule1(const Matrix& m)
    {
        const int size = m.size();
        int penalty = 0;
        for(int i = 0; i < size; i++)
        {
            int row_run = 0, col_run = 0;
            int8_t last_row = MODULE_UNSET, last_col = MODULE_UNSET;
            for(int j = 0; j < size; j++)
            {
                if(m.at(j, i) == last_row)
                {
                    row_run++;
                }
                else
                {
                    if(row_run >= 5) penalty += PENALTY_N1 + (row_run - 5);
                    last_row = m.at(j, i);
                    row_run = 1;
                }

                if(m.at(i, j) == last_col)
                {
                    col_run++;
                }
                else
                {
                    if(col_run >= 5) penalty += PENALTY_N1 + (col_run - 5);
                    last_col = m.at(i, j);
                    col_run = 1;
                }
            }
            if(row_run >= 5) penalty += PENALTY_N1 + (row_run - 5);
            if(col_run >= 5) penalty += PENALTY_N1 + (col_run - 5);
        }
        return penalty;
    }

    /* Rule 2: every 2x2 block of one color, overlapping blocks counted */
    inline int PenaltyRule2(const Matrix& m)
    {
        const int size = m.size();
        int penalty = 0;
        for(int y = 0; y < size - 1; y++)
        {
            for(int x = 0; x < size - 1; x++)
            {
                int8_t color = m.at(x, y);
                if(color == m.at(x + 1, y) && color == m.at(x, y + 1) && color == m.at(x + 1, y + 1))
                    penalty += PENALTY_N2;
            }
        }
        return penalty;
    }

    /* Rule 3: 1:1:3:1:1 finder-like sequence with four light modules on either side */
    inline int PenaltyRule3(const Matrix& m)
    {
        static const int8_t PATTERNS[2][11] =
        {
            { 1, 0, 1, 1, 1, 0, 1, 0, 0, 0, 0 },
            { 0, 0, 0, 0, 1, 0, 1, 1, 1, 0, 1 }
        };

        const int size = m.size();
        int penalty = 0;
        for(int line = 0; line < size; line++)
        {
            for(int start = 0; start + 11 <= size; start++)
            {
                for(int p = 0; p < 2; p++)
                {
                    bool row_match = true, col_match = true;
                    for(int k = 0; k < 11 && (row_match || col_match); k++)
                    {
                        if(m.at(start + k, line) != PATTERNS[p][k]) row_match = false;
                        if(m.at(line, start + k) != PATTERNS[p][k]) col_match = false;
                    }
                    if(row_match) penalty += PENALTY_N3;
                    if(col_match) penalty += PENALTY_N3;
                }
            }
        }
        return penalty;
    }

    /* Rule 4: 10 points per full 5% step the dark proportion deviates from 50% */
    inline int PenaltyRule4(const Matrix& m)
    {
        const long total = (long)m.size() * m.size();
        if(total == 0) return 0;
        const long dark = m.DarkCount();

        /* floor(|100*dark/total - 50| / 5) computed exactly in integers */
        long deviation = labs(100 * dark - 50 * total);
        return (int)(deviation / (5 * total)) * PENALTY_N4;
    }

    inline int PenaltyScore(const Matrix& m)
    {
        return PenaltyRule1(m) + PenaltyRule2(m) + PenaltyRule3(m) + PenaltyRule4(m);
    }

} // namespace QR

#endif // MASK_H
