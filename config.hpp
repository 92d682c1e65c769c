#ifndef CONFIG_H
#define CONFIG_H

#include <ctype.h>
#include <errno.h>
#include <stdint.h>
#include <stdlib.h>
#include <ostream>
#include <string>
#include <vector>

#include "mask.hpp"
#include "matrix.hpp"
#include "status.hpp"
#include "version.hpp"

namespace QR
{

#define QR_DEFAULT_VERSION 7
#define QR_DEFAULT_ECC     ECC_Q
#define QR_DEFAULT_TEXT    "https://github.com/agtkh/"

    /// Raw bytes of a string, one byte-mode unit per char
    inline std::vector<uint8_t> TextBytes(const std::string& text)
    {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    /// Everything the encoder needs from its caller
    struct EncodeConfig
    {
        EncodeConfig() : version(QR_DEFAULT_VERSION), ecl(QR_DEFAULT_ECC), mask(MASK_AUTO), data(TextBytes(QR_DEFAULT_TEXT)) { }

        int                  version;
        Ecc                  ecl;
        int                  mask;    ///< 0..7 or MASK_AUTO
        std::vector<uint8_t> data;

        /// Range checks shared by every caller
        Status Validate() const
        {
            if(version < QR_MIN_VERSION || version > QR_MAX_VERSION) return STATUS_INVALID_INPUT;
            if((int)ecl < (int)ECC_L || (int)ecl > (int)ECC_H) return STATUS_INVALID_INPUT;
            if(mask != MASK_AUTO && (mask < 0 || mask >= MASK_COUNT)) return STATUS_INVALID_MASK;
            return STATUS_OK;
        }
    };

    /// Whole-string decimal integer, optional leading minus
    inline bool ParseInt(const std::string& text, long* dst)
    {
        if(text.empty()) return false;

        size_t i = (text[0] == '-') ? 1 : 0;
        if(i == text.size()) return false;
        for(; i < text.size(); i++)
        {
            if(!isdigit((unsigned char)text[i])) return false;
        }

        errno = 0;
        long value = strtol(text.c_str(), NULL, 10);
        if(errno == ERANGE) return false;
        *dst = value;
        return true;
    }

    inline Status ParseVersion(const std::string& text, int* dst)
    {
        long value = 0;
        if(!ParseInt(text, &value)) return STATUS_INVALID_INPUT;
        if(value < QR_MIN_VERSION || value > QR_MAX_VERSION) return STATUS_INVALID_INPUT;
        *dst = (int)value;
        return STATUS_OK;
    }

    /// L, M, Q or H, case-insensitive
    inline Status ParseEcl(const std::string& text, Ecc* dst)
    {
        if(text.size() != 1) return STATUS_INVALID_INPUT;
        switch(toupper((unsigned char)text[0]))
        {
            case 'L': *dst = ECC_L; return STATUS_OK;
            case 'M': *dst = ECC_M; return STATUS_OK;
            case 'Q': *dst = ECC_Q; return STATUS_OK;
            case 'H': *dst = ECC_H; return STATUS_OK;
        }
        return STATUS_INVALID_INPUT;
    }

    /// "auto" or an index in [0,7]
    inline Status ParseMask(const std::string& text, int* dst)
    {
        if(text == "auto")
        {
            *dst = MASK_AUTO;
            return STATUS_OK;
        }

        long value = 0;
        if(!ParseInt(text, &value)) return STATUS_INVALID_INPUT;
        if(value < 0 || value >= MASK_COUNT) return STATUS_INVALID_MASK;
        *dst = (int)value;
        return STATUS_OK;
    }

    /// Comma separated decimal byte values, e.g. "104,105"
    inline Status ParseByteList(const std::string& text, std::vector<uint8_t>* dst)
    {
        std::vector<uint8_t> bytes;
        size_t start = 0;
        while(start <= text.size())
        {
            size_t comma = text.find(',', start);
            if(comma == std::string::npos) comma = text.size();

            std::string item = text.substr(start, comma - start);
            while(!item.empty() && isspace((unsigned char)item[0])) item.erase(0, 1);
            while(!item.empty() && isspace((unsigned char)item[item.size() - 1])) item.erase(item.size() - 1);

            long value = 0;
            if(!ParseInt(item, &value) || value < 0 || value > 255) return STATUS_INVALID_INPUT;
            bytes.push_back((uint8_t)value);

            start = comma + 1;
        }

        *dst = bytes;
        return STATUS_OK;
    }

    /// Pick the payload source: byte list first, then text, else the config keeps its default payload
    /// \param bytes - comma separated byte list or NULL when not given
    /// \param text - text payload or NULL when not given
    /// \return STATUS_INVALID_INPUT for a malformed byte list, config untouched
    inline Status ApplyOptions(const std::string* bytes, const std::string* text, EncodeConfig* config)
    {
        if(bytes)
        {
            return ParseByteList(*bytes, &config->data);
        }
        if(text)
        {
            config->data = TextBytes(*text);
        }
        return STATUS_OK;
    }

    /// One text line per module row, then a "# mask N" trailer
    inline void WriteMatrix(std::ostream& out, const Matrix& m, char dark, char light, int mask)
    {
        std::string row((size_t)m.size(), light);
        for(int y = 0; y < m.size(); y++)
        {
            for(int x = 0; x < m.size(); x++)
            {
                row[(size_t)x] = m.IsDark(x, y) ? dark : light;
            }
            out << row << '\n';
        }
        out << "# mask " << mask << '\n';
    }

    /// Log "error: NAME: message"
    /// \return process exit code
    inline int ReportError(std::ostream& err, Status st)
    {
        err << "error: " << StatusName(st) << ": " << StatusMessage(st) << '\n';
        return 1;
    }

} // namespace QR

#endif // CONFIG_H
