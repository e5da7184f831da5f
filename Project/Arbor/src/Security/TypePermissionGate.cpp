#include "pch.h"
#include "Security/TypePermissionGate.hpp"

namespace Arbor
{
    TypePermissionGate& TypePermissionGate::Add(std::shared_ptr<TypePermission> permission)
    {
        if (permission) m_permissions.push_back(std::move(permission));
        return *this;
    }

    TypePermissionGate& TypePermissionGate::AllowTypes(const std::vector<std::string>& names)
    {
        return Add(std::make_shared<ExplicitTypePermission>(names));
    }

    TypePermissionGate& TypePermissionGate::AllowTypesByWildcard(const std::vector<std::string>& patterns)
    {
        return Add(std::make_shared<WildcardTypePermission>(patterns));
    }

    TypePermissionGate& TypePermissionGate::AllowTypesByRegExp(const std::vector<std::string>& patterns)
    {
        return Add(std::make_shared<RegExpTypePermission>(patterns));
    }

    void TypePermissionGate::Clear()
    {
        m_permissions.clear();
    }

    bool TypePermissionGate::Allows(const TypeDescriptor* type) const
    {
        if (!type) return false;
        for (const auto& permission : m_permissions)
        {
            if (permission->Allows(type)) return true;
        }
        return false;
    }

    void TypePermissionGate::Check(const TypeDescriptor* type) const
    {
        if (Allows(type)) return;

        const std::string name = type ? type->ToString() : std::string("null");
        ARBOR_LOG_WARN("Denied deserialization of type " + name);
        ForbiddenTypeError err(name);
        err.Add("permissions", Describe());
        throw err;
    }

    std::string TypePermissionGate::Describe() const
    {
        if (m_permissions.empty()) return "none";
        std::string out;
        for (size_t i = 0; i < m_permissions.size(); ++i)
        {
            if (i) out += " | ";
            out += m_permissions[i]->Describe();
        }
        return out;
    }
}
