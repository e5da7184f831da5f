#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Logging.hpp"

namespace Arbor
{
    // Base of every engine failure. Carries ordered key/value context that is rendered into what().
    class ARBOR_API CodecError : public std::runtime_error
    {
    public:
        explicit CodecError(const std::string& message);

        // Adds a context entry. An existing key is replaced rather than duplicated.
        CodecError& Add(const std::string& key, const std::string& value);
        const std::string* Get(const std::string& key) const;

        const std::string& ShortMessage() const { return m_message; }
        const std::vector<std::pair<std::string, std::string>>& Context() const { return m_context; }

        const char* what() const noexcept override { return m_full.c_str(); }

    private:
        void Render();

        std::string m_message;
        std::string m_full;
        std::vector<std::pair<std::string, std::string>> m_context;
    };

    // No registered converter accepts the type
    class ARBOR_API NoConverterFoundError : public CodecError
    {
    public:
        explicit NoConverterFoundError(const std::string& typeName);
    };

    // The permission gate denied a decode target
    class ARBOR_API ForbiddenTypeError : public CodecError
    {
    public:
        explicit ForbiddenTypeError(const std::string& typeName);
    };

    // Every construction strategy failed, or the engine failed while instantiating
    class ARBOR_API CannotConstructError : public CodecError
    {
    public:
        CannotConstructError(const std::string& message, const std::string& typeName);
    };

    // Field resolution or access override failed
    class ARBOR_API ObjectAccessError : public CodecError
    {
    public:
        ObjectAccessError(const std::string& message, const std::string& typeName, const std::string& fieldName = {});
    };

    // A type name or runtime type is unknown to the registry
    class ARBOR_API CannotResolveTypeError : public CodecError
    {
    public:
        explicit CannotResolveTypeError(const std::string& typeName);
    };

    // Malformed or inconsistent input
    class ARBOR_API ConversionError : public CodecError
    {
    public:
        explicit ConversionError(const std::string& message);
    };
}
