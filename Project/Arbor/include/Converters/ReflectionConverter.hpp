#pragma once
#include "Converters/Converter.hpp"

namespace Arbor
{
    // Generic converter for reflected structs: one child node per persistent field, named after
    // the field. A field hidden by a same-named field of a subclass carries a "defined-in"
    // attribute naming its declaring type.
    class ARBOR_API ReflectionConverter : public Converter
    {
    public:
        bool CanConvert(const TypeDescriptor* type) const override;
        ConverterKind Kind() const override { return ConverterKind::Reflective; }
        void Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const override;
        Instance Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const override;
    };

    // Structs registered with ARBOR_REGISTER_SELF_DESCRIBING. The value writes its own
    // subtree; on decode the engine builds a blank instance and hands it the reader.
    class ARBOR_API SelfDescribingConverter : public Converter
    {
    public:
        bool CanConvert(const TypeDescriptor* type) const override;
        ConverterKind Kind() const override { return ConverterKind::SelfDescribing; }
        void Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const override;

        // Builds through context.Builder() and lets the value consume the current node
        Instance Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const override;

        // Lets `blank` (an object of `type`) consume the current node. Throws ConversionError
        // when the reader is not left at the depth it started at.
        void Consume(const TypeDescriptor* type, void* blank, HierarchicalStreamReader& reader, const std::string& fieldName) const;
    };
}
