#pragma once
#include "Reflection/ReflectionBase.hpp"
#include "Reflection/TypeRegistry.hpp"
#include "Reflection/FieldIntrospector.hpp"
#include "Reflection/InstanceBuilder.hpp"
#include "IO/HierarchicalStream.hpp"
#include "Settings/CodecSettings.hpp"

namespace Arbor
{
    // Node attribute names written by the engine
    namespace Attributes
    {
        inline constexpr const char* Class = "class";
        inline constexpr const char* Null = "null";
        inline constexpr const char* DefinedIn = "defined-in";
    }

    enum class ConverterKind
    {
        Leaf,           //!< scalar text codec
        Composite,      //!< collections and maps, recursive
        Reflective,     //!< generic objects through the FieldIntrospector
        SelfDescribing  //!< the value reads and writes its own subtree
    };

    // Services the engine offers a converter while marshalling
    class ARBOR_API MarshallingContext
    {
    public:
        virtual ~MarshallingContext() = default;

        // Writes `value` into the node the caller has just started: null marker or type
        // annotation first, then the content produced by the value's converter.
        virtual void ConvertAnother(ObjectRef value, const TypeDescriptor* expectedType) = 0;

        // Nodes started on the writer and not yet ended
        virtual size_t OpenNodes() const = 0;

        virtual const TypeRegistry& Types() const = 0;
        virtual const FieldIntrospector& Introspector() const = 0;
        virtual const CodecSettings& Settings() const = 0;
    };

    // Services the engine offers a converter while unmarshalling
    class ARBOR_API UnmarshallingContext
    {
    public:
        virtual ~UnmarshallingContext() = default;

        // Decodes the current node. The result has exactly `expectedType`, except that
        // reference wrappers may hold a descendant of their item type.
        virtual Instance ConvertAnother(const TypeDescriptor* expectedType, const std::string& fieldName = {}) = 0;

        // Concrete type of the node being decoded by the current converter
        virtual const TypeDescriptor* RequiredType() const = 0;

        virtual const TypeRegistry& Types() const = 0;
        virtual const FieldIntrospector& Introspector() const = 0;
        virtual const InstanceBuilder& Builder() const = 0;
        virtual const CodecSettings& Settings() const = 0;
        virtual std::string CurrentPath() const = 0;
    };

    class ARBOR_API Converter
    {
    public:
        virtual ~Converter() = default;

        virtual bool CanConvert(const TypeDescriptor* type) const = 0;
        virtual ConverterKind Kind() const = 0;

        // Writes the content of `value` (never null) into the current node
        virtual void Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const = 0;
        // Reads the current node into a new instance of context.RequiredType()
        virtual Instance Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const = 0;
    };

    // Leaf converter whose whole content is the node's text
    class ARBOR_API SingleValueConverter : public Converter
    {
    public:
        ConverterKind Kind() const override { return ConverterKind::Leaf; }

        virtual std::string ToString(ObjectRef value) const = 0;
        // Throws ConversionError on malformed text
        virtual Instance FromString(const TypeDescriptor* type, const std::string& text) const = 0;

        void Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const override;
        Instance Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const override;
    };
}
