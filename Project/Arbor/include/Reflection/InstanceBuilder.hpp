#pragma once
#include "Reflection/ReflectionBase.hpp"
#include "Reflection/TypeRegistry.hpp"

namespace Arbor
{
    // Produces blank instances for the decoder.
    // Strategy 1: the registered no-argument constructor.
    // Strategy 2: types registered with ARBOR_REGISTER_STRUCTURAL are materialized from a cached
    // payload that names the type and carries a zeroed object image; no constructor runs.
    class ARBOR_API InstanceBuilder
    {
    public:
        explicit InstanceBuilder(const TypeRegistry& types);
        virtual ~InstanceBuilder() = default;

        InstanceBuilder(const InstanceBuilder&) = delete;
        InstanceBuilder& operator=(const InstanceBuilder&) = delete;

        // Throws CannotConstructError (with the cause nested) when no strategy applies or the
        // allocation fails. Exceptions thrown by the type's own constructor propagate as they are.
        virtual Instance NewInstance(const TypeDescriptor* type) const;

        size_t CachedPayloadCount() const;

    protected:
        struct StructuralPayload
        {
            std::string typeName;
            std::vector<unsigned char> image;
        };

        std::shared_ptr<const StructuralPayload> PayloadFor(const TypeDescriptor* type) const;
        Instance Materialize(const StructuralPayload& payload, const TypeDescriptor* type) const;

    private:
        const TypeRegistry& m_types;

        mutable std::mutex m_payloadMutex;
        mutable std::unordered_map<const TypeDescriptor*, std::shared_ptr<const StructuralPayload>> m_payloads;
    };
}
