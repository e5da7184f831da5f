#include "pch.h"
#include "Security/TypePermission.hpp"

namespace Arbor
{
    bool PrimitiveTypePermission::Allows(const TypeDescriptor* type) const
    {
        if (!type || type->IsVoid()) return false;
        return type->IsPrimitive() || type->IsBoxed();
    }

    ExplicitTypePermission::ExplicitTypePermission(std::vector<std::string> names)
        : m_names(names.begin(), names.end())
    {
    }

    bool ExplicitTypePermission::Allows(const TypeDescriptor* type) const
    {
        return type && m_names.count(type->ToString()) > 0;
    }

    std::string ExplicitTypePermission::Describe() const
    {
        std::string out = "explicit[";
        std::vector<std::string> sorted(m_names.begin(), m_names.end());
        std::sort(sorted.begin(), sorted.end());
        for (size_t i = 0; i < sorted.size(); ++i)
        {
            if (i) out += ", ";
            out += sorted[i];
        }
        return out + "]";
    }

    RegExpTypePermission::RegExpTypePermission(const std::vector<std::string>& patterns)
    {
        for (const std::string& p : patterns) AddPattern(p, p);
    }

    void RegExpTypePermission::AddPattern(const std::string& source, const std::string& regex)
    {
        try
        {
            m_patterns.emplace_back(regex, std::regex::ECMAScript);
        }
        catch (const std::regex_error& e)
        {
            ConversionError err(std::string("Invalid type pattern: ") + e.what());
            err.Add("pattern", source);
            throw err;
        }
        m_sources.push_back(source);
    }

    bool RegExpTypePermission::Allows(const TypeDescriptor* type) const
    {
        if (!type) return false;
        const std::string name = type->ToString();
        for (const std::regex& re : m_patterns)
        {
            if (std::regex_match(name, re)) return true;
        }
        return false;
    }

    std::string RegExpTypePermission::Describe() const
    {
        std::string out = "pattern[";
        for (size_t i = 0; i < m_sources.size(); ++i)
        {
            if (i) out += ", ";
            out += m_sources[i];
        }
        return out + "]";
    }

    WildcardTypePermission::WildcardTypePermission(const std::vector<std::string>& patterns)
    {
        for (const std::string& p : patterns) AddPattern(p, ToRegex(p));
    }

    std::string WildcardTypePermission::ToRegex(const std::string& wildcard)
    {
        std::string out;
        out.reserve(wildcard.size() * 2);
        for (size_t i = 0; i < wildcard.size(); ++i)
        {
            char c = wildcard[i];
            switch (c)
            {
            case '*':
                if (i + 1 < wildcard.size() && wildcard[i + 1] == '*')
                {
                    out += ".*";
                    ++i;
                }
                else
                {
                    out += "(?:(?!::).)*";
                }
                break;
            case '?':
                out += "[^:]";
                break;
            case '\\': case '^': case '$': case '.': case '|': case '+':
            case '(': case ')': case '[': case ']': case '{': case '}':
                out += '\\';
                out += c;
                break;
            default:
                out += c;
                break;
            }
        }
        return out;
    }

    TypeHierarchyPermission::TypeHierarchyPermission(const TypeDescriptor* base)
        : m_base(base)
    {
    }

    bool TypeHierarchyPermission::Allows(const TypeDescriptor* type) const
    {
        return type && m_base && type->IsA(m_base);
    }

    std::string TypeHierarchyPermission::Describe() const
    {
        return "hierarchy[" + (m_base ? m_base->ToString() : std::string("null")) + "]";
    }

    bool StandardLibraryTypePermission::Allows(const TypeDescriptor* type) const
    {
        if (!type) return false;
        switch (type->GetKind())
        {
        case TypeKind::String:
        case TypeKind::Sequence:
        case TypeKind::Map:
        case TypeKind::Optional:
        case TypeKind::Reference:
            return true;
        default:
            return type == TypeResolver<TimePoint>::Get();
        }
    }
}
