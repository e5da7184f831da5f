#include "pch.h"
#include "Reflection/InstanceBuilder.hpp"

#include <new>

namespace Arbor
{
    InstanceBuilder::InstanceBuilder(const TypeRegistry& types)
        : m_types(types)
    {
    }

    Instance InstanceBuilder::NewInstance(const TypeDescriptor* type) const
    {
        if (!type)
        {
            throw CannotConstructError("Cannot construct a null type", "null");
        }

        if (type->HasDefaultConstructor())
        {
            std::shared_ptr<void> object;
            try
            {
                object = type->Construct();
            }
            catch (const std::bad_alloc&)
            {
                std::throw_with_nested(CannotConstructError("Allocation failed while constructing type", type->ToString()));
            }
            return Instance(type, std::move(object));
        }

        if (type->IsStructurallyConstructible())
        {
            ARBOR_LOG_DEBUG("No default constructor for " + type->ToString() + ", materializing from structural payload");
            std::shared_ptr<const StructuralPayload> payload = PayloadFor(type);
            return Materialize(*payload, type);
        }

        CannotConstructError err("Cannot construct type: no default constructor and not structurally constructible", type->ToString());
        throw err;
    }

    size_t InstanceBuilder::CachedPayloadCount() const
    {
        std::lock_guard<std::mutex> lock(m_payloadMutex);
        return m_payloads.size();
    }

    std::shared_ptr<const InstanceBuilder::StructuralPayload> InstanceBuilder::PayloadFor(const TypeDescriptor* type) const
    {
        std::lock_guard<std::mutex> lock(m_payloadMutex);
        auto it = m_payloads.find(type);
        if (it != m_payloads.end()) return it->second;

        auto payload = std::make_shared<StructuralPayload>();
        payload->typeName = type->ToString();
        payload->image.assign(type->GetSize(), 0);
        m_payloads.emplace(type, payload);
        return payload;
    }

    Instance InstanceBuilder::Materialize(const StructuralPayload& payload, const TypeDescriptor* type) const
    {
        const TypeDescriptor* named = m_types.Resolve(payload.typeName);
        if (named != type)
        {
            CannotConstructError err("Structural payload does not name the requested type", type->ToString());
            err.Add("payload-type", payload.typeName);
            throw err;
        }

        const size_t alignment = type->GetAlignment();
        void* storage = nullptr;
        try
        {
            storage = ::operator new(payload.image.size(), std::align_val_t(alignment));
        }
        catch (const std::bad_alloc&)
        {
            std::throw_with_nested(CannotConstructError("Allocation failed while materializing type", type->ToString()));
        }

        // Trivially copyable: copying the image in starts the object's lifetime
        std::memcpy(storage, payload.image.data(), payload.image.size());
        std::shared_ptr<void> object(storage, [alignment](void* p) { ::operator delete(p, std::align_val_t(alignment)); });
        return Instance(type, std::move(object));
    }
}
