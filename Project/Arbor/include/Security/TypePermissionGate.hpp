#pragma once
#include "Security/TypePermission.hpp"

namespace Arbor
{
    // Disjunction of permissions. A type no permission allows is denied.
    class ARBOR_API TypePermissionGate
    {
    public:
        TypePermissionGate() = default;

        TypePermissionGate& Add(std::shared_ptr<TypePermission> permission);

        template <typename P, typename... Args>
        TypePermissionGate& Add(Args&&... args)
        {
            return Add(std::make_shared<P>(std::forward<Args>(args)...));
        }

        // Convenience wrappers over the permission catalogue
        TypePermissionGate& AllowTypes(const std::vector<std::string>& names);
        TypePermissionGate& AllowTypesByWildcard(const std::vector<std::string>& patterns);
        TypePermissionGate& AllowTypesByRegExp(const std::vector<std::string>& patterns);
        template <typename T>
        TypePermissionGate& AllowTypeHierarchy() { return Add(TypeHierarchyPermission::Of<T>()); }

        void Clear();

        bool Allows(const TypeDescriptor* type) const;
        // Throws ForbiddenTypeError unless some permission allows the type
        void Check(const TypeDescriptor* type) const;

        size_t Size() const { return m_permissions.size(); }
        std::string Describe() const;

    private:
        std::vector<std::shared_ptr<TypePermission>> m_permissions;
    };
}
