#include "pch.h"
#include "Converters/BasicConverters.hpp"

namespace Arbor
{
    bool BooleanConverter::CanConvert(const TypeDescriptor* type) const
    {
        return type == TypeResolver<bool>::Get();
    }

    std::string BooleanConverter::ToString(ObjectRef value) const
    {
        return *static_cast<const bool*>(value.address) ? "true" : "false";
    }

    Instance BooleanConverter::FromString(const TypeDescriptor* type, const std::string& text) const
    {
        if (text == "true") return Instance(type, std::make_shared<bool>(true));
        if (text == "false") return Instance(type, std::make_shared<bool>(false));

        ConversionError err("Malformed boolean");
        err.Add("value", text);
        throw err;
    }

    bool CharConverter::CanConvert(const TypeDescriptor* type) const
    {
        return type == TypeResolver<char>::Get();
    }

    std::string CharConverter::ToString(ObjectRef value) const
    {
        const char c = *static_cast<const char*>(value.address);
        return c == '\0' ? std::string() : std::string(1, c);
    }

    Instance CharConverter::FromString(const TypeDescriptor* type, const std::string& text) const
    {
        if (text.size() > 1)
        {
            ConversionError err("Expected a single character");
            err.Add("value", text);
            throw err;
        }
        return Instance(type, std::make_shared<char>(text.empty() ? '\0' : text[0]));
    }

    bool StringConverter::CanConvert(const TypeDescriptor* type) const
    {
        return type == TypeResolver<std::string>::Get();
    }

    std::string StringConverter::ToString(ObjectRef value) const
    {
        return *static_cast<const std::string*>(value.address);
    }

    Instance StringConverter::FromString(const TypeDescriptor* type, const std::string& text) const
    {
        return Instance(type, std::make_shared<std::string>(text));
    }
}
