#pragma once
#include "Converters/Converter.hpp"

namespace Arbor
{
    // std::vector<T>: one "item" child per element
    class ARBOR_API CollectionConverter : public Converter
    {
    public:
        static constexpr const char* ITEM = "item";

        bool CanConvert(const TypeDescriptor* type) const override;
        ConverterKind Kind() const override { return ConverterKind::Composite; }
        void Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const override;
        Instance Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const override;
    };

    // std::map / std::unordered_map: one "entry" child per pair, holding "key" and "value".
    // A repeated key keeps the last value read.
    class ARBOR_API MapConverter : public Converter
    {
    public:
        static constexpr const char* ENTRY = "entry";
        static constexpr const char* KEY = "key";
        static constexpr const char* VALUE = "value";

        bool CanConvert(const TypeDescriptor* type) const override;
        ConverterKind Kind() const override { return ConverterKind::Composite; }
        void Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const override;
        Instance Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const override;
    };
}
