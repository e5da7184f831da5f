#include "pch.h"
#include "Serialization/CodecErrors.hpp"

namespace Arbor
{
    CodecError::CodecError(const std::string& message)
        : std::runtime_error(message)
        , m_message(message)
    {
        Render();
    }

    CodecError& CodecError::Add(const std::string& key, const std::string& value)
    {
        for (auto& entry : m_context)
        {
            if (entry.first == key)
            {
                entry.second = value;
                Render();
                return *this;
            }
        }
        m_context.emplace_back(key, value);
        Render();
        return *this;
    }

    const std::string* CodecError::Get(const std::string& key) const
    {
        for (const auto& entry : m_context)
        {
            if (entry.first == key) return &entry.second;
        }
        return nullptr;
    }

    void CodecError::Render()
    {
        std::ostringstream ss;
        ss << m_message;
        if (!m_context.empty())
        {
            ss << "\n---- Debugging information ----";
            for (const auto& entry : m_context)
            {
                ss << "\n" << std::left << std::setw(20) << entry.first << ": " << entry.second;
            }
            ss << "\n-------------------------------";
        }
        m_full = ss.str();
    }

    NoConverterFoundError::NoConverterFoundError(const std::string& typeName)
        : CodecError("No converter available for type")
    {
        Add("type", typeName);
    }

    ForbiddenTypeError::ForbiddenTypeError(const std::string& typeName)
        : CodecError("Type is not permitted for deserialization")
    {
        Add("type", typeName);
    }

    CannotConstructError::CannotConstructError(const std::string& message, const std::string& typeName)
        : CodecError(message)
    {
        Add("construction-type", typeName);
    }

    ObjectAccessError::ObjectAccessError(const std::string& message, const std::string& typeName, const std::string& fieldName)
        : CodecError(message)
    {
        Add("type", typeName);
        if (!fieldName.empty()) Add("field", fieldName);
    }

    CannotResolveTypeError::CannotResolveTypeError(const std::string& typeName)
        : CodecError("Cannot resolve type")
    {
        Add("type", typeName);
    }

    ConversionError::ConversionError(const std::string& message)
        : CodecError(message)
    {
    }
}
