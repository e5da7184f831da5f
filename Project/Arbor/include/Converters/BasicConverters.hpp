#pragma once
#include <charconv>
#include "Converters/Converter.hpp"

namespace Arbor
{
    // Integer and floating point kinds. Floating point output is the shortest text that
    // reads back to the same value.
    template <typename T>
    class NumberConverter : public SingleValueConverter
    {
        static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>,
            "NumberConverter handles numeric kinds only");

    public:
        bool CanConvert(const TypeDescriptor* type) const override
        {
            return type == TypeResolver<T>::Get();
        }

        std::string ToString(ObjectRef value) const override
        {
            char buffer[64];
            auto result = std::to_chars(buffer, buffer + sizeof(buffer), *static_cast<const T*>(value.address));
            return std::string(buffer, result.ptr);
        }

        Instance FromString(const TypeDescriptor* type, const std::string& text) const override
        {
            T parsed{};
            const char* end = text.data() + text.size();
            auto result = std::from_chars(text.data(), end, parsed);
            if (result.ec != std::errc() || result.ptr != end)
            {
                ConversionError err(result.ec == std::errc::result_out_of_range ? "Number out of range" : "Malformed number");
                err.Add("value", text);
                throw err;
            }
            return Instance(type, std::make_shared<T>(parsed));
        }
    };

    class ARBOR_API BooleanConverter : public SingleValueConverter
    {
    public:
        bool CanConvert(const TypeDescriptor* type) const override;
        std::string ToString(ObjectRef value) const override;
        // Accepts "true" and "false"
        Instance FromString(const TypeDescriptor* type, const std::string& text) const override;
    };

    // A single character; the NUL character is written as empty text
    class ARBOR_API CharConverter : public SingleValueConverter
    {
    public:
        bool CanConvert(const TypeDescriptor* type) const override;
        std::string ToString(ObjectRef value) const override;
        Instance FromString(const TypeDescriptor* type, const std::string& text) const override;
    };

    class ARBOR_API StringConverter : public SingleValueConverter
    {
    public:
        bool CanConvert(const TypeDescriptor* type) const override;
        std::string ToString(ObjectRef value) const override;
        Instance FromString(const TypeDescriptor* type, const std::string& text) const override;
    };
}
