#include "pch.h"
#include "Converters/ConverterRegistry.hpp"

namespace Arbor
{
    ConverterRegistry& ConverterRegistry::Register(std::shared_ptr<Converter> converter, ConverterPriority priority)
    {
        if (!converter)
        {
            throw ConversionError("Cannot register a null converter");
        }
        // After every entry of equal or higher priority: registration order within a priority
        auto pos = std::find_if(m_entries.begin(), m_entries.end(),
            [priority](const Entry& e) { return static_cast<int>(e.priority) < static_cast<int>(priority); });
        m_entries.insert(pos, Entry{ std::move(converter), priority });
        return *this;
    }

    const Converter* ConverterRegistry::FindOrNull(const TypeDescriptor* type) const
    {
        if (!type) return nullptr;
        for (const Entry& entry : m_entries)
        {
            if (entry.converter->CanConvert(type)) return entry.converter.get();
        }
        return nullptr;
    }

    const Converter& ConverterRegistry::Lookup(const TypeDescriptor* type) const
    {
        const Converter* converter = FindOrNull(type);
        if (!converter)
        {
            throw NoConverterFoundError(type ? type->ToString() : std::string("null"));
        }
        return *converter;
    }
}
