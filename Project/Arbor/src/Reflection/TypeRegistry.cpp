#include "pch.h"
#include "Reflection/TypeRegistry.hpp"

namespace Arbor
{
    TypeRegistry& TypeRegistry::RegisterDescriptor(const TypeDescriptor* type, const std::string& alias)
    {
        if (!type)
        {
            throw CannotResolveTypeError("null type descriptor");
        }

        const std::string name = type->ToString();
        std::lock_guard<std::mutex> lk(m_mutex);
        // Both names are checked before anything is bound
        CheckUnbound(name, type);
        if (!alias.empty())
        {
            CheckUnbound(alias, type);
        }

        m_byName[name] = type;
        m_byType.insert_or_assign(std::type_index(type->GetTypeInfo()), type);
        if (!alias.empty())
        {
            m_byName[alias] = type;
            m_aliases[type] = alias;
        }
        ARBOR_LOG_TRACE("Registered type " + type->ToString() + (alias.empty() ? std::string() : " as " + alias));
        return *this;
    }

    void TypeRegistry::CheckUnbound(const std::string& name, const TypeDescriptor* type) const
    {
        auto it = m_byName.find(name);
        if (it != m_byName.end() && it->second != type)
        {
            CannotResolveTypeError err(type->ToString());
            err.Add("name", name);
            err.Add("bound-type", it->second->ToString());
            throw err;
        }
    }

    void TypeRegistry::RegisterStandardTypes()
    {
        Register<bool>();
        Register<char>();
        Register<signed char>();
        Register<unsigned char>();
        Register<short>();
        Register<unsigned short>();
        Register<int>();
        Register<unsigned int>();
        Register<long>();
        Register<unsigned long>();
        Register<long long>();
        Register<unsigned long long>();
        Register<float>();
        Register<double>();
        Register<std::string>("string");
        Register<TimePoint>("time-point");
        Register<ByteArray>("byte-array");
    }

    bool TypeRegistry::Has(const std::string& name) const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_byName.find(name) != m_byName.end();
    }

    const TypeDescriptor* TypeRegistry::Resolve(const std::string& name) const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_byName.find(name);
        return it == m_byName.end() ? nullptr : it->second;
    }

    const TypeDescriptor* TypeRegistry::ResolveOrThrow(const std::string& name) const
    {
        const TypeDescriptor* type = Resolve(name);
        if (!type)
        {
            throw CannotResolveTypeError(name);
        }
        return type;
    }

    const TypeDescriptor* TypeRegistry::FindByTypeInfo(const std::type_info& info) const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_byType.find(std::type_index(info));
        return it == m_byType.end() ? nullptr : it->second;
    }

    std::string TypeRegistry::NameOf(const TypeDescriptor* type) const
    {
        if (!type) return {};
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_aliases.find(type);
        return it == m_aliases.end() ? type->ToString() : it->second;
    }

    size_t TypeRegistry::Size() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_byType.size();
    }
}
