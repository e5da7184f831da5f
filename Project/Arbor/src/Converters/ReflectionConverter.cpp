#include "pch.h"
#include "Converters/ReflectionConverter.hpp"

namespace Arbor
{
    namespace
    {
        bool IsNullValue(const TypeDescriptor* type, const void* address)
        {
            const auto* wrapper = dynamic_cast<const TypeDescriptor_Wrapper*>(type);
            return wrapper && wrapper->unwrap(address).address == nullptr;
        }
    }

    bool ReflectionConverter::CanConvert(const TypeDescriptor* type) const
    {
        return type && type->GetKind() == TypeKind::Struct;
    }

    void ReflectionConverter::Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const
    {
        const FieldIntrospector& introspector = context.Introspector();
        const bool omitNulls = context.Settings().omitNullFields;

        introspector.Visit(value, [&](const std::string& name, const TypeDescriptor* declaredType,
            const TypeDescriptor* declaringType, const void* fieldValue) {
            if (omitNulls && IsNullValue(declaredType, fieldValue)) return;

            writer.StartNode(name);
            // The decoder picks the most-derived declaration unless told otherwise
            const FieldDescriptor* visible = introspector.FieldOrNull(value.type, name, nullptr);
            if (visible && visible->GetDeclaringType() != declaringType)
            {
                writer.AddAttribute(Attributes::DefinedIn, context.Types().NameOf(declaringType));
            }
            context.ConvertAnother(ObjectRef{ declaredType, fieldValue }, declaredType);
            writer.EndNode();
        });
    }

    Instance ReflectionConverter::Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const
    {
        const TypeDescriptor* type = context.RequiredType();
        const FieldIntrospector& introspector = context.Introspector();

        Instance result = context.Builder().NewInstance(type);
        std::set<const FieldDescriptor*> seen;

        while (reader.HasMoreChildren())
        {
            reader.MoveDown();
            const std::string name = reader.GetNodeName();

            const TypeDescriptor* declaringType = nullptr;
            if (auto definedIn = reader.GetAttribute(Attributes::DefinedIn))
            {
                declaringType = context.Types().ResolveOrThrow(*definedIn);
            }

            const FieldDescriptor* field = introspector.FieldOrNull(type, name, declaringType);
            if (!field)
            {
                if (context.Settings().ignoreUnknownElements)
                {
                    ARBOR_LOG_WARN("Ignoring unknown element '" + name + "' at " + context.CurrentPath());
                    reader.MoveUp();
                    continue;
                }
                ConversionError err("Unknown field element");
                err.Add("type", type->ToString());
                err.Add("field", name);
                throw err;
            }
            if (!seen.insert(field).second)
            {
                ConversionError err("Duplicate field element");
                err.Add("type", type->ToString());
                err.Add("field", name);
                throw err;
            }

            Instance value = context.ConvertAnother(field->GetType(), name);
            introspector.WriteField(result.Get(), type, name, value, field->GetDeclaringType());
            reader.MoveUp();
        }
        return result;
    }

    bool SelfDescribingConverter::CanConvert(const TypeDescriptor* type) const
    {
        const auto* s = dynamic_cast<const TypeDescriptor_Struct*>(type);
        return s && s->IsSelfDescribing();
    }

    void SelfDescribingConverter::Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const
    {
        const size_t depth = context.OpenNodes();
        static_cast<const TypeDescriptor_Struct*>(value.type)->WriteSelf(value.address, writer);
        if (context.OpenNodes() != depth)
        {
            ConversionError err("Self-describing value left the writer unbalanced");
            err.Add("type", value.type->ToString());
            err.Add("expected-depth", std::to_string(depth));
            err.Add("actual-depth", std::to_string(context.OpenNodes()));
            throw err;
        }
    }

    Instance SelfDescribingConverter::Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const
    {
        const TypeDescriptor* type = context.RequiredType();
        Instance blank = context.Builder().NewInstance(type);
        Consume(type, blank.Get(), reader, {});
        return blank;
    }

    void SelfDescribingConverter::Consume(const TypeDescriptor* type, void* blank, HierarchicalStreamReader& reader, const std::string& fieldName) const
    {
        const size_t depth = reader.Depth();
        static_cast<const TypeDescriptor_Struct*>(type)->ReadSelf(blank, reader, fieldName);
        if (reader.Depth() != depth)
        {
            ConversionError err("Self-describing value left the reader unbalanced");
            err.Add("type", type->ToString());
            err.Add("expected-depth", std::to_string(depth));
            err.Add("actual-depth", std::to_string(reader.Depth()));
            throw err;
        }
    }
}
