#pragma once
#include <regex>
#include "Reflection/ReflectionBase.hpp"

namespace Arbor
{
    // Predicate deciding whether a type may be instantiated by the decoder
    class ARBOR_API TypePermission
    {
    public:
        virtual ~TypePermission() = default;
        virtual bool Allows(const TypeDescriptor* type) const = 0;
        virtual std::string Describe() const = 0;
    };

    // Every primitive kind and its boxed counterpart, except void
    class ARBOR_API PrimitiveTypePermission : public TypePermission
    {
    public:
        bool Allows(const TypeDescriptor* type) const override;
        std::string Describe() const override { return "primitive"; }
    };

    class ARBOR_API AnyTypePermission : public TypePermission
    {
    public:
        bool Allows(const TypeDescriptor* type) const override { return type != nullptr; }
        std::string Describe() const override { return "any"; }
    };

    class ARBOR_API NoTypePermission : public TypePermission
    {
    public:
        bool Allows(const TypeDescriptor*) const override { return false; }
        std::string Describe() const override { return "none"; }
    };

    // Exact qualified names
    class ARBOR_API ExplicitTypePermission : public TypePermission
    {
    public:
        explicit ExplicitTypePermission(std::vector<std::string> names);

        template <typename... Ts>
        static std::shared_ptr<ExplicitTypePermission> Of()
        {
            return std::make_shared<ExplicitTypePermission>(std::vector<std::string>{ TypeResolver<Ts>::Get()->ToString()... });
        }

        bool Allows(const TypeDescriptor* type) const override;
        std::string Describe() const override;

    private:
        std::unordered_set<std::string> m_names;
    };

    // Regular expressions over qualified names (full match)
    class ARBOR_API RegExpTypePermission : public TypePermission
    {
    public:
        explicit RegExpTypePermission(const std::vector<std::string>& patterns);

        bool Allows(const TypeDescriptor* type) const override;
        std::string Describe() const override;

    protected:
        RegExpTypePermission() = default;
        void AddPattern(const std::string& source, const std::string& regex);

    private:
        std::vector<std::regex> m_patterns;
        std::vector<std::string> m_sources;
    };

    // Glob patterns over qualified names with "::" as separator:
    // '?' one character, '*' any run within one scope, '**' any run across scopes.
    class ARBOR_API WildcardTypePermission : public RegExpTypePermission
    {
    public:
        explicit WildcardTypePermission(const std::vector<std::string>& patterns);

        static std::string ToRegex(const std::string& wildcard);
    };

    // A type and all of its descendants
    class ARBOR_API TypeHierarchyPermission : public TypePermission
    {
    public:
        explicit TypeHierarchyPermission(const TypeDescriptor* base);

        template <typename T>
        static std::shared_ptr<TypeHierarchyPermission> Of() { return std::make_shared<TypeHierarchyPermission>(TypeResolver<T>::Get()); }

        bool Allows(const TypeDescriptor* type) const override;
        std::string Describe() const override;

    private:
        const TypeDescriptor* m_base;
    };

    // std::string, containers, optional/shared_ptr wrappers, time points and byte arrays
    class ARBOR_API StandardLibraryTypePermission : public TypePermission
    {
    public:
        bool Allows(const TypeDescriptor* type) const override;
        std::string Describe() const override { return "standard-library"; }
    };
}
