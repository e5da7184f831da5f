#pragma once
#include "Converters/Converter.hpp"

namespace Arbor
{
    // std::chrono::system_clock::time_point as ISO-8601 UTC text.
    // Output: YYYY-MM-DDTHH:MM:SS[.fff|.ffffff|.fffffffff]Z
    // Input additionally accepts 1-9 fraction digits and a +HH:MM / -HH:MM offset.
    class ARBOR_API ISO8601DateConverter : public SingleValueConverter
    {
    public:
        bool CanConvert(const TypeDescriptor* type) const override;
        std::string ToString(ObjectRef value) const override;
        Instance FromString(const TypeDescriptor* type, const std::string& text) const override;

        static std::string Format(const TimePoint& tp);
        static TimePoint Parse(const std::string& text);
    };

    // ByteArray as Base64 text
    class ARBOR_API EncodedByteArrayConverter : public SingleValueConverter
    {
    public:
        bool CanConvert(const TypeDescriptor* type) const override;
        std::string ToString(ObjectRef value) const override;
        Instance FromString(const TypeDescriptor* type, const std::string& text) const override;
    };
}
