#include "pch.h"
#include "IO/TreeWriter.hpp"
#include "Serialization/CodecErrors.hpp"

namespace Arbor
{
    TreeWriter::TreeWriter(std::shared_ptr<const NameCoder> coder)
        : AbstractWriter(std::move(coder))
    {
    }

    TreeNode& TreeWriter::Current()
    {
        if (m_nodes.empty())
        {
            throw ConversionError("No open node to write to");
        }
        return *m_nodes.top();
    }

    void TreeWriter::StartNode(const std::string& name)
    {
        const std::string encoded = EncodeNode(name);
        if (m_nodes.empty())
        {
            if (m_hasRoot)
            {
                ConversionError err("Document already has a root node");
                err.Add("node", encoded);
                throw err;
            }
            m_root = TreeNode(encoded);
            m_hasRoot = true;
            m_nodes.push(&m_root);
            return;
        }
        // Only completed siblings move when the parent's child list grows
        m_nodes.push(&m_nodes.top()->AddChild(encoded));
    }

    void TreeWriter::AddAttribute(const std::string& name, const std::string& value)
    {
        Current().SetAttribute(EncodeAttribute(name), value);
    }

    void TreeWriter::SetValue(const std::string& text)
    {
        Current().value = text;
    }

    void TreeWriter::EndNode()
    {
        if (m_nodes.empty())
        {
            throw ConversionError("EndNode without matching StartNode");
        }
        m_nodes.pop();
    }

    TreeNode TreeWriter::TakeRoot()
    {
        if (!m_nodes.empty())
        {
            ConversionError err("Document still has open nodes");
            err.Add("open-nodes", std::to_string(m_nodes.size()));
            throw err;
        }
        m_hasRoot = false;
        return std::move(m_root);
    }
}
