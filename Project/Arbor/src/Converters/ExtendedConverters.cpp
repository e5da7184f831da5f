#include "pch.h"
#include "Converters/ExtendedConverters.hpp"
#include "Reflection/Base64.hpp"

#include <cstdio>

namespace Arbor
{
    namespace
    {
        [[noreturn]] void ThrowMalformedDate(const std::string& text, const char* reason)
        {
            ConversionError err(std::string("Malformed ISO-8601 date: ") + reason);
            err.Add("value", text);
            throw err;
        }

        // Reads exactly `digits` decimal digits at pos
        bool ReadDigits(const std::string& s, size_t& pos, size_t digits, int& out)
        {
            if (pos + digits > s.size()) return false;
            int value = 0;
            for (size_t i = 0; i < digits; ++i)
            {
                const char c = s[pos + i];
                if (c < '0' || c > '9') return false;
                value = value * 10 + (c - '0');
            }
            out = value;
            pos += digits;
            return true;
        }

        bool Expect(const std::string& s, size_t& pos, char c)
        {
            if (pos >= s.size() || s[pos] != c) return false;
            ++pos;
            return true;
        }
    }

    bool ISO8601DateConverter::CanConvert(const TypeDescriptor* type) const
    {
        return type == TypeResolver<TimePoint>::Get();
    }

    std::string ISO8601DateConverter::ToString(ObjectRef value) const
    {
        return Format(*static_cast<const TimePoint*>(value.address));
    }

    Instance ISO8601DateConverter::FromString(const TypeDescriptor* type, const std::string& text) const
    {
        return Instance(type, std::make_shared<TimePoint>(Parse(text)));
    }

    std::string ISO8601DateConverter::Format(const TimePoint& tp)
    {
        using namespace std::chrono;

        const auto day = floor<days>(tp);
        const year_month_day ymd{ day };
        const auto sinceMidnight = duration_cast<nanoseconds>(tp - day);
        const hh_mm_ss<nanoseconds> time{ sinceMidnight };
        const long long fraction = time.subseconds().count();

        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02lld:%02lld:%02lld",
            static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
            static_cast<long long>(time.hours().count()), static_cast<long long>(time.minutes().count()),
            static_cast<long long>(time.seconds().count()));

        std::string out(buffer);
        if (fraction != 0)
        {
            if (fraction % 1000000 == 0)
                std::snprintf(buffer, sizeof(buffer), ".%03lld", fraction / 1000000);
            else if (fraction % 1000 == 0)
                std::snprintf(buffer, sizeof(buffer), ".%06lld", fraction / 1000);
            else
                std::snprintf(buffer, sizeof(buffer), ".%09lld", fraction);
            out += buffer;
        }
        out += 'Z';
        return out;
    }

    TimePoint ISO8601DateConverter::Parse(const std::string& text)
    {
        using namespace std::chrono;

        size_t pos = 0;
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
        if (!ReadDigits(text, pos, 4, y) || !Expect(text, pos, '-') ||
            !ReadDigits(text, pos, 2, mo) || !Expect(text, pos, '-') ||
            !ReadDigits(text, pos, 2, d))
        {
            ThrowMalformedDate(text, "expected YYYY-MM-DD");
        }
        if (!Expect(text, pos, 'T') ||
            !ReadDigits(text, pos, 2, h) || !Expect(text, pos, ':') ||
            !ReadDigits(text, pos, 2, mi) || !Expect(text, pos, ':') ||
            !ReadDigits(text, pos, 2, s))
        {
            ThrowMalformedDate(text, "expected THH:MM:SS");
        }

        long long fraction = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                if (++digits > 9) ThrowMalformedDate(text, "more than 9 fraction digits");
                fraction = fraction * 10 + (text[pos] - '0');
                ++pos;
            }
            if (digits == 0) ThrowMalformedDate(text, "empty fraction");
            for (; digits < 9; ++digits) fraction *= 10;
        }

        minutes offset{ 0 };
        if (pos < text.size() && text[pos] == 'Z')
        {
            ++pos;
        }
        else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
        {
            const bool negative = text[pos] == '-';
            ++pos;
            int oh = 0, om = 0;
            if (!ReadDigits(text, pos, 2, oh) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, om) || oh > 23 || om > 59)
            {
                ThrowMalformedDate(text, "bad UTC offset");
            }
            offset = hours{ oh } + minutes{ om };
            if (negative) offset = -offset;
        }
        else
        {
            ThrowMalformedDate(text, "missing time zone designator");
        }
        if (pos != text.size())
        {
            ThrowMalformedDate(text, "trailing characters");
        }

        const year_month_day ymd{ year{ y }, month{ static_cast<unsigned>(mo) }, day{ static_cast<unsigned>(d) } };
        if (!ymd.ok() || h > 23 || mi > 59 || s > 59)
        {
            ThrowMalformedDate(text, "field out of range");
        }

        const auto local = sys_days{ ymd } + hours{ h } + minutes{ mi } + seconds{ s } + nanoseconds{ fraction };
        return time_point_cast<system_clock::duration>(local - offset);
    }

    bool EncodedByteArrayConverter::CanConvert(const TypeDescriptor* type) const
    {
        return type == TypeResolver<ByteArray>::Get();
    }

    std::string EncodedByteArrayConverter::ToString(ObjectRef value) const
    {
        return Base64_Encode(*static_cast<const ByteArray*>(value.address));
    }

    Instance EncodedByteArrayConverter::FromString(const TypeDescriptor* type, const std::string& text) const
    {
        auto bytes = std::make_shared<ByteArray>();
        if (!Base64_Decode(text, *bytes))
        {
            ConversionError err("Malformed Base64 data");
            err.Add("value", text.size() > 64 ? text.substr(0, 64) + "..." : text);
            throw err;
        }
        return Instance(type, std::move(bytes));
    }
}
