#include "pch.h"

#include "Reflection/Base64.hpp"

namespace Arbor
{
#pragma region Internal Function

    static const char b64_table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    static inline bool is_whitespace(char c) {
        return c == '\r' || c == '\n' || c == ' ' || c == '\t';
    }

    static const std::array<int, 256>& ReverseTable() {
        static const std::array<int, 256> rev = [] {
            std::array<int, 256> table{};
            table.fill(-1);
            for (int i = 0; i < 64; ++i) table[static_cast<unsigned char>(b64_table[i])] = i;
            return table;
        }();
        return rev;
    }

    // '=' may only appear in the last two positions, and "x=y" is invalid
    static bool ValidPadding(const std::string& s) {
        size_t first = s.find('=');
        if (first == std::string::npos) return true;
        if (first < s.size() - 2) return false;
        for (size_t i = first; i < s.size(); ++i) {
            if (s[i] != '=') return false;
        }
        return true;
    }
#pragma endregion

    std::string Base64_Encode(const std::vector<unsigned char>& data)
    {
        if (data.empty()) return "";

        std::string out;
        out.reserve(((data.size() + 2) / 3) * 4);

        size_t i = 0;
        const size_t n = data.size();
        while (i + 2 < n) {
            uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | uint32_t(data[i + 2]);
            out.push_back(b64_table[(triple >> 18) & 0x3F]);
            out.push_back(b64_table[(triple >> 12) & 0x3F]);
            out.push_back(b64_table[(triple >> 6) & 0x3F]);
            out.push_back(b64_table[triple & 0x3F]);
            i += 3;
        }

        size_t rem = n - i;
        if (rem) {
            uint32_t triple = uint32_t(data[i]) << 16;
            if (rem == 2) triple |= uint32_t(data[i + 1]) << 8;

            out.push_back(b64_table[(triple >> 18) & 0x3F]);
            out.push_back(b64_table[(triple >> 12) & 0x3F]);
            out.push_back(rem == 2 ? b64_table[(triple >> 6) & 0x3F] : '=');
            out.push_back('=');
        }

        return out;
    }

    bool Base64_Decode(const std::string& input, std::vector<unsigned char>& out)
    {
        out.clear();

        std::string s;
        s.reserve(input.size());
        for (char c : input) {
            if (!is_whitespace(c)) s.push_back(c);
        }
        if (s.empty()) return true;

        if (s.size() % 4 != 0) {
            ARBOR_LOG_ERROR("Base64 decoding: invalid input length (not a multiple of 4).");
            return false;
        }
        if (!ValidPadding(s)) {
            ARBOR_LOG_ERROR("Base64 decoding: misplaced padding.");
            return false;
        }

        const std::array<int, 256>& rev = ReverseTable();
        out.reserve((s.size() / 4) * 3);

        for (size_t i = 0; i < s.size(); i += 4)
        {
            int v[4];
            for (size_t k = 0; k < 4; ++k) {
                char c = s[i + k];
                v[k] = (c == '=') ? 0 : rev[static_cast<unsigned char>(c)];
                if (v[k] < 0 || (c == '=' && k < 2)) {
                    ARBOR_LOG_ERROR("Base64 decoding: invalid character encountered.");
                    out.clear();
                    return false;
                }
            }

            uint32_t triple = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) | (uint32_t(v[2]) << 6) | uint32_t(v[3]);

            out.push_back(static_cast<unsigned char>((triple >> 16) & 0xFF));
            if (s[i + 2] != '=') out.push_back(static_cast<unsigned char>((triple >> 8) & 0xFF));
            if (s[i + 3] != '=') out.push_back(static_cast<unsigned char>(triple & 0xFF));
        }

        return true;
    }
}
