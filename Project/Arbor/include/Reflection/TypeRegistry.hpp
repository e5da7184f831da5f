#pragma once
#include <string>
#include <unordered_map>
#include <typeindex>
#include <mutex>
#include "Reflection/ReflectionBase.hpp" // for TypeDescriptor & TypeResolver

namespace Arbor
{
    // Resolves qualified names, aliases and runtime type identities to descriptors.
    // Configured once while the engine is assembled; lookups are safe from concurrent call trees.
    class ARBOR_API TypeRegistry
    {
    public:
        TypeRegistry() = default;
        TypeRegistry(const TypeRegistry&) = delete;
        TypeRegistry& operator=(const TypeRegistry&) = delete;

        // Register T under its qualified name and, optionally, a short alias used for node names.
        template <typename T>
        TypeRegistry& Register(const std::string& alias = {})
        {
            return RegisterDescriptor(TypeResolver<T>::Get(), alias);
        }

        // Throws CannotResolveTypeError when the qualified name or the alias is already bound
        // to a different descriptor.
        TypeRegistry& RegisterDescriptor(const TypeDescriptor* type, const std::string& alias = {});

        // Fundamental kinds, std::string, time points and byte arrays
        void RegisterStandardTypes();

        bool Has(const std::string& name) const;

        // nullptr when the name is unknown
        const TypeDescriptor* Resolve(const std::string& name) const;
        // Throws CannotResolveTypeError when the name is unknown
        const TypeDescriptor* ResolveOrThrow(const std::string& name) const;

        const TypeDescriptor* FindByTypeInfo(const std::type_info& info) const;

        // Alias when one was registered, otherwise the qualified name.
        std::string NameOf(const TypeDescriptor* type) const;

        size_t Size() const;

    private:
        // Throws CannotResolveTypeError when name already belongs to another descriptor.
        // Caller holds m_mutex.
        void CheckUnbound(const std::string& name, const TypeDescriptor* type) const;

        mutable std::mutex m_mutex;
        std::unordered_map<std::string, const TypeDescriptor*> m_byName;
        std::unordered_map<std::type_index, const TypeDescriptor*> m_byType;
        std::unordered_map<const TypeDescriptor*, std::string> m_aliases;
    };
}
