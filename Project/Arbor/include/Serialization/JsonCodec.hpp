#pragma once
#include "Serialization/CodecEngine.hpp"
#include "IO/Json/JsonTreeCodec.hpp"

namespace Arbor
{
    // JSON text through the node tree mapping of JsonTreeCodec
    ARBOR_API std::string ToJsonText(const CodecEngine& engine, ObjectRef root, bool pretty);
    ARBOR_API Instance FromJsonText(const CodecEngine& engine, const std::string& json, const TypeDescriptor* expectedType);

    // Pretty or compact according to the engine's settings
    template <typename T>
    std::string ToJson(const CodecEngine& engine, const T& value)
    {
        return ToJsonText(engine, ObjectRef::Of(value), engine.Config().settings.prettyJson);
    }

    template <typename T>
    T FromJson(const CodecEngine& engine, const std::string& json)
    {
        Instance result = FromJsonText(engine, json, TypeResolver<T>::Get());
        return std::move(result.As<T>());
    }
}
