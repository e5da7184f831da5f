#include "pch.h"
#include "IO/NameCoder.hpp"
#include "Serialization/CodecErrors.hpp"

namespace Arbor
{
    static bool IsNameStart(char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    static bool IsNameChar(char c)
    {
        return IsNameStart(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
    }

    std::string XmlFriendlyNameCoder::EncodeNode(const std::string& name) const
    {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(name.size() + 8);
        for (size_t i = 0; i < name.size(); ++i)
        {
            const char c = name[i];
            if (c == '_')
            {
                out += "__";
            }
            else if (c == ':')
            {
                out += "_-";
            }
            else if (i == 0 ? IsNameStart(c) : IsNameChar(c))
            {
                out += c;
            }
            else
            {
                const unsigned code = static_cast<unsigned char>(c);
                out += "_.00";
                out += hex[(code >> 4) & 0xF];
                out += hex[code & 0xF];
            }
        }
        return out;
    }

    static int HexValue(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::string XmlFriendlyNameCoder::DecodeNode(const std::string& encoded) const
    {
        std::string out;
        out.reserve(encoded.size());
        for (size_t i = 0; i < encoded.size(); ++i)
        {
            const char c = encoded[i];
            if (c != '_')
            {
                out += c;
                continue;
            }
            if (i + 1 >= encoded.size())
            {
                ConversionError err("Dangling escape in encoded name");
                err.Add("name", encoded);
                throw err;
            }
            const char next = encoded[++i];
            if (next == '_')
            {
                out += '_';
            }
            else if (next == '-')
            {
                out += ':';
            }
            else if (next == '.')
            {
                int code = 0;
                for (size_t k = 1; k <= 4; ++k)
                {
                    int v = (i + k < encoded.size()) ? HexValue(encoded[i + k]) : -1;
                    if (v < 0)
                    {
                        ConversionError err("Malformed hex escape in encoded name");
                        err.Add("name", encoded);
                        throw err;
                    }
                    code = code * 16 + v;
                }
                if (code > 0xFF)
                {
                    ConversionError err("Escaped character out of range in encoded name");
                    err.Add("name", encoded);
                    throw err;
                }
                out += static_cast<char>(code);
                i += 4;
            }
            else
            {
                ConversionError err("Unknown escape in encoded name");
                err.Add("name", encoded);
                throw err;
            }
        }
        return out;
    }
}
