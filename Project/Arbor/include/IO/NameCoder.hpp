#pragma once
#include <string>
#include "Logging.hpp"

namespace Arbor
{
    // Maps type and field names onto names a node-tree format accepts, and back
    class ARBOR_API NameCoder
    {
    public:
        virtual ~NameCoder() = default;
        virtual std::string EncodeNode(const std::string& name) const = 0;
        virtual std::string DecodeNode(const std::string& encoded) const = 0;
        virtual std::string EncodeAttribute(const std::string& name) const { return EncodeNode(name); }
        virtual std::string DecodeAttribute(const std::string& encoded) const { return DecodeNode(encoded); }
    };

    class ARBOR_API NoNameCoder : public NameCoder
    {
    public:
        std::string EncodeNode(const std::string& name) const override { return name; }
        std::string DecodeNode(const std::string& encoded) const override { return encoded; }
    };

    // XML-safe names: '_' becomes "__", ':' becomes "_-", any other character that is not
    // allowed at its position becomes "_." followed by four hex digits.
    class ARBOR_API XmlFriendlyNameCoder : public NameCoder
    {
    public:
        std::string EncodeNode(const std::string& name) const override;
        // Throws ConversionError on a malformed escape
        std::string DecodeNode(const std::string& encoded) const override;
    };
}
