#pragma once
#include "Converters/Converter.hpp"

namespace Arbor
{
    enum class ConverterPriority : int
    {
        VeryLow = -20,
        Low = -10,
        Normal = 0,
        High = 10,
        VeryHigh = 20
    };

    // Converters ordered by priority (highest first), then by registration order.
    // Lookup returns the first converter that accepts the type.
    class ARBOR_API ConverterRegistry
    {
    public:
        ConverterRegistry() = default;
        ConverterRegistry(const ConverterRegistry&) = delete;
        ConverterRegistry& operator=(const ConverterRegistry&) = delete;

        ConverterRegistry& Register(std::shared_ptr<Converter> converter, ConverterPriority priority = ConverterPriority::Normal);

        template <typename C, typename... Args>
        ConverterRegistry& Register(ConverterPriority priority = ConverterPriority::Normal, Args&&... args)
        {
            return Register(std::make_shared<C>(std::forward<Args>(args)...), priority);
        }

        // Throws NoConverterFoundError
        const Converter& Lookup(const TypeDescriptor* type) const;
        const Converter* FindOrNull(const TypeDescriptor* type) const;

        size_t Size() const { return m_entries.size(); }

    private:
        struct Entry
        {
            std::shared_ptr<Converter> converter;
            ConverterPriority priority;
        };

        std::vector<Entry> m_entries;
    };
}
