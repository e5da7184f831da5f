#include "pch.h"
#include "Converters/CollectionConverters.hpp"

namespace Arbor
{
    bool CollectionConverter::CanConvert(const TypeDescriptor* type) const
    {
        return dynamic_cast<const TypeDescriptor_StdVector*>(type) != nullptr;
    }

    void CollectionConverter::Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const
    {
        const auto* vec = static_cast<const TypeDescriptor_StdVector*>(value.type);
        const TypeDescriptor* itemType = vec->GetItemType();
        const size_t count = vec->get_size(value.address);
        for (size_t i = 0; i < count; ++i)
        {
            writer.StartNode(ITEM);
            context.ConvertAnother(ObjectRef{ itemType, vec->get_item(value.address, i) }, itemType);
            writer.EndNode();
        }
    }

    Instance CollectionConverter::Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const
    {
        const TypeDescriptor* type = context.RequiredType();
        const auto* vec = static_cast<const TypeDescriptor_StdVector*>(type);
        const TypeDescriptor* itemType = vec->GetItemType();

        Instance result = context.Builder().NewInstance(type);
        while (reader.HasMoreChildren())
        {
            reader.MoveDown();
            Instance item = context.ConvertAnother(itemType);
            vec->append_item(result.Get(), item.Get());
            reader.MoveUp();
        }
        return result;
    }

    bool MapConverter::CanConvert(const TypeDescriptor* type) const
    {
        return dynamic_cast<const TypeDescriptor_StdMap*>(type) != nullptr;
    }

    void MapConverter::Marshal(ObjectRef value, HierarchicalStreamWriter& writer, MarshallingContext& context) const
    {
        const auto* map = static_cast<const TypeDescriptor_StdMap*>(value.type);
        const TypeDescriptor* keyType = map->GetKeyType();
        const TypeDescriptor* valueType = map->GetValueType();
        map->for_each(value.address, [&](const void* key, const void* mapped) {
            writer.StartNode(ENTRY);
            writer.StartNode(KEY);
            context.ConvertAnother(ObjectRef{ keyType, key }, keyType);
            writer.EndNode();
            writer.StartNode(VALUE);
            context.ConvertAnother(ObjectRef{ valueType, mapped }, valueType);
            writer.EndNode();
            writer.EndNode();
        });
    }

    Instance MapConverter::Unmarshal(HierarchicalStreamReader& reader, UnmarshallingContext& context) const
    {
        const TypeDescriptor* type = context.RequiredType();
        const auto* map = static_cast<const TypeDescriptor_StdMap*>(type);
        const TypeDescriptor* keyType = map->GetKeyType();
        const TypeDescriptor* valueType = map->GetValueType();

        Instance result = context.Builder().NewInstance(type);
        while (reader.HasMoreChildren())
        {
            reader.MoveDown();
            Instance key;
            Instance value;
            while (reader.HasMoreChildren())
            {
                reader.MoveDown();
                const std::string name = reader.GetNodeName();
                if (name == KEY && key.IsNull())
                {
                    key = context.ConvertAnother(keyType, KEY);
                }
                else if (name == VALUE && value.IsNull())
                {
                    value = context.ConvertAnother(valueType, VALUE);
                }
                else
                {
                    ConversionError err("Unexpected element in map entry");
                    err.Add("element", name);
                    throw err;
                }
                reader.MoveUp();
            }
            if (key.IsNull() || value.IsNull())
            {
                ConversionError err("Map entry needs both a key and a value");
                err.Add("map-type", type->ToString());
                throw err;
            }
            map->insert(result.Get(), key.Get(), value.Get());
            reader.MoveUp();
        }
        return result;
    }
}
