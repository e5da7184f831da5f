#pragma once
#include "Converters/ConverterRegistry.hpp"
#include "Reflection/FieldIntrospector.hpp"
#include "Reflection/InstanceBuilder.hpp"
#include "Reflection/TypeRegistry.hpp"
#include "Security/TypePermissionGate.hpp"
#include "Settings/CodecSettings.hpp"

namespace Arbor
{
    // Everything a CodecEngine works with. Assemble it once, then treat it as read-only.
    // The builder refers to `types`; replace both together.
    struct ARBOR_API CodecConfig
    {
        CodecSettings settings;
        std::shared_ptr<TypeRegistry> types;
        std::shared_ptr<ConverterRegistry> converters;
        std::shared_ptr<TypePermissionGate> permissions;
        std::shared_ptr<FieldIntrospector> introspector;
        std::shared_ptr<InstanceBuilder> builder;

        // Standard types registered, built-in converters, a gate allowing primitives and
        // standard library types only.
        static CodecConfig CreateDefault(const CodecSettings& settings = CodecSettings{});

        // Leaf and composite converters at Low priority, the reflective fallback at VeryLow
        static void RegisterDefaultConverters(ConverterRegistry& registry);
    };
}
