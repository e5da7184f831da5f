#pragma once
#include <optional>
#include <memory>
#include <string>
#include <vector>

#include "IO/NameCoder.hpp"

namespace Arbor
{
    // Node-tree writer. Every StartNode is balanced by one EndNode.
    class ARBOR_API HierarchicalStreamWriter
    {
    public:
        virtual ~HierarchicalStreamWriter() = default;

        virtual void StartNode(const std::string& name) = 0;
        virtual void AddAttribute(const std::string& name, const std::string& value) = 0;
        virtual void SetValue(const std::string& text) = 0;
        virtual void EndNode() = 0;
        virtual void Flush() {}

        // Innermost writer behind any decorators
        virtual HierarchicalStreamWriter& Underlying() { return *this; }
    };

    // Node-tree cursor. Starts positioned on the root node at depth 0.
    class ARBOR_API HierarchicalStreamReader
    {
    public:
        virtual ~HierarchicalStreamReader() = default;

        virtual bool HasMoreChildren() const = 0;
        virtual void MoveDown() = 0;
        virtual void MoveUp() = 0;
        virtual std::string GetNodeName() const = 0;
        virtual std::string GetValue() const = 0;
        virtual std::optional<std::string> GetAttribute(const std::string& name) const = 0;
        virtual std::vector<std::string> GetAttributeNames() const = 0;
        virtual size_t Depth() const = 0;

        virtual HierarchicalStreamReader& Underlying() { return *this; }
    };

    // Writer that escapes node and attribute names through a NameCoder
    class ARBOR_API AbstractWriter : public HierarchicalStreamWriter
    {
    public:
        explicit AbstractWriter(std::shared_ptr<const NameCoder> coder = nullptr)
            : m_coder(coder ? std::move(coder) : std::make_shared<XmlFriendlyNameCoder>()) {}

        std::string EncodeNode(const std::string& name) const { return m_coder->EncodeNode(name); }
        std::string EncodeAttribute(const std::string& name) const { return m_coder->EncodeAttribute(name); }
        const NameCoder& GetNameCoder() const { return *m_coder; }

    private:
        std::shared_ptr<const NameCoder> m_coder;
    };

    class ARBOR_API AbstractReader : public HierarchicalStreamReader
    {
    public:
        explicit AbstractReader(std::shared_ptr<const NameCoder> coder = nullptr)
            : m_coder(coder ? std::move(coder) : std::make_shared<XmlFriendlyNameCoder>()) {}

        std::string DecodeNode(const std::string& name) const { return m_coder->DecodeNode(name); }
        std::string EncodeAttribute(const std::string& name) const { return m_coder->EncodeAttribute(name); }
        std::string DecodeAttribute(const std::string& name) const { return m_coder->DecodeAttribute(name); }

    private:
        std::shared_ptr<const NameCoder> m_coder;
    };

    // Forwarding decorators
    class ARBOR_API WriterWrapper : public HierarchicalStreamWriter
    {
    public:
        explicit WriterWrapper(HierarchicalStreamWriter& wrapped) : m_wrapped(wrapped) {}

        void StartNode(const std::string& name) override { m_wrapped.StartNode(name); }
        void AddAttribute(const std::string& name, const std::string& value) override { m_wrapped.AddAttribute(name, value); }
        void SetValue(const std::string& text) override { m_wrapped.SetValue(text); }
        void EndNode() override { m_wrapped.EndNode(); }
        void Flush() override { m_wrapped.Flush(); }
        HierarchicalStreamWriter& Underlying() override { return m_wrapped.Underlying(); }

    protected:
        HierarchicalStreamWriter& m_wrapped;
    };

    class ARBOR_API ReaderWrapper : public HierarchicalStreamReader
    {
    public:
        explicit ReaderWrapper(HierarchicalStreamReader& wrapped) : m_wrapped(wrapped) {}

        bool HasMoreChildren() const override { return m_wrapped.HasMoreChildren(); }
        void MoveDown() override { m_wrapped.MoveDown(); }
        void MoveUp() override { m_wrapped.MoveUp(); }
        std::string GetNodeName() const override { return m_wrapped.GetNodeName(); }
        std::string GetValue() const override { return m_wrapped.GetValue(); }
        std::optional<std::string> GetAttribute(const std::string& name) const override { return m_wrapped.GetAttribute(name); }
        std::vector<std::string> GetAttributeNames() const override { return m_wrapped.GetAttributeNames(); }
        size_t Depth() const override { return m_wrapped.Depth(); }
        HierarchicalStreamReader& Underlying() override { return m_wrapped.Underlying(); }

    protected:
        HierarchicalStreamReader& m_wrapped;
    };
}
