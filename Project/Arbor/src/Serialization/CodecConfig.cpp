#include "pch.h"
#include "Serialization/CodecConfig.hpp"

#include "Converters/BasicConverters.hpp"
#include "Converters/CollectionConverters.hpp"
#include "Converters/ExtendedConverters.hpp"
#include "Converters/ReflectionConverter.hpp"

namespace Arbor
{
    CodecConfig CodecConfig::CreateDefault(const CodecSettings& settings)
    {
        CodecConfig config;
        config.settings = settings;
        config.settings.Clamp();

        config.types = std::make_shared<TypeRegistry>();
        config.types->RegisterStandardTypes();

        config.converters = std::make_shared<ConverterRegistry>();
        RegisterDefaultConverters(*config.converters);

        config.permissions = std::make_shared<TypePermissionGate>();
        config.permissions->Add<PrimitiveTypePermission>();
        config.permissions->Add<StandardLibraryTypePermission>();

        config.introspector = std::make_shared<FieldIntrospector>();
        config.introspector->SetAllowFinalFieldWrites(config.settings.allowFinalFieldWrites);

        config.builder = std::make_shared<InstanceBuilder>(*config.types);
        return config;
    }

    void CodecConfig::RegisterDefaultConverters(ConverterRegistry& registry)
    {
        const ConverterPriority low = ConverterPriority::Low;

        registry.Register<BooleanConverter>(low);
        registry.Register<CharConverter>(low);
        registry.Register<NumberConverter<signed char>>(low);
        registry.Register<NumberConverter<unsigned char>>(low);
        registry.Register<NumberConverter<short>>(low);
        registry.Register<NumberConverter<unsigned short>>(low);
        registry.Register<NumberConverter<int>>(low);
        registry.Register<NumberConverter<unsigned int>>(low);
        registry.Register<NumberConverter<long>>(low);
        registry.Register<NumberConverter<unsigned long>>(low);
        registry.Register<NumberConverter<long long>>(low);
        registry.Register<NumberConverter<unsigned long long>>(low);
        registry.Register<NumberConverter<float>>(low);
        registry.Register<NumberConverter<double>>(low);
        registry.Register<StringConverter>(low);
        registry.Register<ISO8601DateConverter>(low);
        // Ahead of the generic collection converter
        registry.Register<EncodedByteArrayConverter>(low);
        registry.Register<CollectionConverter>(low);
        registry.Register<MapConverter>(low);
        registry.Register<SelfDescribingConverter>(low);

        registry.Register<ReflectionConverter>(ConverterPriority::VeryLow);
    }
}
