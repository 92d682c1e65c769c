#ifndef MATRIX_H
#define MATRIX_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "status.hpp"

namespace QR
{

#define MODULE_UNSET (-1)
#define MODULE_LIGHT  0
#define MODULE_DARK   1

    /// Square grid of tri-state modules, row-major
    class Matrix
    {
    public:
        Matrix() : _size(0) { }

        explicit Matrix(int size) : _size(size), _cells((size_t)size * size, MODULE_UNSET) { }

        /// Resize and mark every module unset
        void Reset(int size)
        {
            _size = size;
            _cells.assign((size_t)size * size, MODULE_UNSET);
        }

        inline int size() const
        {
            return _size;
        }

        inline bool Contains(int x, int y) const
        {
            return x >= 0 && x < _size && y >= 0 && y < _size;
        }

        /// \param x - column
        /// \param y - row
        inline int8_t at(int x, int y) const
        {
            assert(Contains(x, y));
            return _cells[(size_t)y * _size + x];
        }

        inline void set(int x, int y, int8_t value)
        {
            assert(Contains(x, y));
            _cells[(size_t)y * _size + x] = value;
        }

        inline bool IsDark(int x, int y) const
        {
            return at(x, y) == MODULE_DARK;
        }

        /// True once no module is left unset
        bool IsComplete() const
        {
            for(size_t i = 0; i < _cells.size(); i++)
            {
                if(_cells[i] == MODULE_UNSET) return false;
            }
            return true;
        }

        int DarkCount() const
        {
            int count = 0;
            for(size_t i = 0; i < _cells.size(); i++)
            {
                if(_cells[i] == MODULE_DARK) count++;
            }
            return count;
        }

        /// 7x7 finder with its light separator, clipped to the grid
        /// \param base_x, base_y - top-left corner of the 9x9 footprint (may be -1)
        void DrawFinderPattern(int base_x, int base_y)
        {
            for(int dy = 0; dy < 9; dy++)
            {
                for(int dx = 0; dx < 9; dx++)
                {
                    int x = base_x + dx;
                    int y = base_y + dy;
                    if(!Contains(x, y)) continue;

                    /* Chebyshev distance from the center: 0-1 core, 2 ring gap, 3 ring, 4 separator */
                    int dist = ChebyshevDistance(dx, dy, 4);
                    set(x, y, (dist == 2 || dist == 4) ? MODULE_LIGHT : MODULE_DARK);
                }
            }
        }

        /// 5x5 alignment pattern, skipped when any module of its footprint is already drawn
        /// \return false if skipped
        bool DrawAlignmentPattern(int base_x, int base_y)
        {
            for(int y = base_y; y < base_y + 5; y++)
            {
                for(int x = base_x; x < base_x + 5; x++)
                {
                    if(Contains(x, y) && at(x, y) != MODULE_UNSET) return false;
                }
            }

            for(int dy = 0; dy < 5; dy++)
            {
                for(int dx = 0; dx < 5; dx++)
                {
                    int x = base_x + dx;
                    int y = base_y + dy;
                    if(!Contains(x, y)) continue;
                    set(x, y, ChebyshevDistance(dx, dy, 2) == 1 ? MODULE_LIGHT : MODULE_DARK);
                }
            }
            return true;
        }

        /// Alternating run starting dark
        void DrawTimingPattern(int x, int y, int length, bool vertical)
        {
            for(int i = 0; i < length; i++)
            {
                int tx = vertical ? x : x + i;
                int ty = vertical ? y + i : y;
                if(Contains(tx, ty)) set(tx, ty, (i % 2 == 0) ? MODULE_DARK : MODULE_LIGHT);
            }
        }

        /// Both 15-module copies of the format information, bit 0 first
        void DrawFormatInfo(uint16_t bits)
        {
            static const uint8_t FIRST_COPY[15][2] =
            {
                { 8, 0 }, { 8, 1 }, { 8, 2 }, { 8, 3 }, { 8, 4 }, { 8, 5 }, { 8, 7 }, { 8, 8 },
                { 7, 8 }, { 5, 8 }, { 4, 8 }, { 3, 8 }, { 2, 8 }, { 1, 8 }, { 0, 8 }
            };

            for(int i = 0; i < 15; i++)
            {
                int8_t bit = (int8_t)((bits >> i) & 1);
                set(FIRST_COPY[i][0], FIRST_COPY[i][1], bit);

                if(i < 8) set(_size - 1 - i, 8, bit);
                else      set(8, _size - 15 + i, bit);
            }
        }

        /// Two transposed 3x6 blocks of version information
        void DrawVersionInfo(uint32_t bits)
        {
            for(int i = 0; i < 18; i++)
            {
                int8_t bit = (int8_t)((bits >> i) & 1);
                int a = _size - 11 + i % 3;
                int b = i / 3;
                set(a, b, bit);
                set(b, a, bit);
            }
        }

    private:
        static int ChebyshevDistance(int dx, int dy, int center)
        {
            int ax = dx > center ? dx - center : center - dx;
            int ay = dy > center ? dy - center : center - dy;
            return ax > ay ? ax : ay;
        }

        int                 _size;
        std::vector<int8_t> _cells;
    };

    /// One module coordinate of the data placement walk
    struct Cell
    {
        int x;
        int y;
    };

    /// Data placement order: column pairs right to left, alternately upward and downward,
    /// skipping the vertical timing column
    inline std::vector<Cell> ZigzagPath(int size)
    {
        std::vector<Cell> path;
        path.reserve((size_t)size * size);

        bool upward = true;
        for(int column = size - 1; column > 0; column -= 2)
        {
            if(column == 6) column--;
            for(int i = 0; i < size; i++)
            {
                int row = upward ? size - 1 - i : i;
                Cell right = { column, row };
                Cell left = { column - 1, row };
                path.push_back(right);
                path.push_back(left);
            }
            upward = !upward;
        }
        return path;
    }

} // namespace QR

#endif // MATRIX_H
