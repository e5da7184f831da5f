#include "pch.h"
#include "IO/TreeReader.hpp"
#include "Serialization/CodecErrors.hpp"

namespace Arbor
{
    TreeReader::TreeReader(const TreeNode& root, std::shared_ptr<const NameCoder> coder)
        : AbstractReader(std::move(coder))
    {
        m_nodes.push_back(NodeInfo{ &root, 0 });
    }

    bool TreeReader::HasMoreChildren() const
    {
        const NodeInfo& top = m_nodes.back();
        return top.nextChild < top.node->children.size();
    }

    void TreeReader::MoveDown()
    {
        NodeInfo& top = m_nodes.back();
        if (top.nextChild >= top.node->children.size())
        {
            ConversionError err("No more children to move down into");
            err.Add("node", top.node->name);
            throw err;
        }
        const TreeNode* child = &top.node->children[top.nextChild++];
        m_nodes.push_back(NodeInfo{ child, 0 });
    }

    void TreeReader::MoveUp()
    {
        if (m_nodes.size() <= 1)
        {
            throw ConversionError("Cannot move up from the root node");
        }
        m_nodes.pop_back();
    }

    std::string TreeReader::GetNodeName() const
    {
        return DecodeNode(m_nodes.back().node->name);
    }

    std::string TreeReader::GetValue() const
    {
        return m_nodes.back().node->value;
    }

    std::optional<std::string> TreeReader::GetAttribute(const std::string& name) const
    {
        const std::string* value = m_nodes.back().node->Attribute(EncodeAttribute(name));
        if (!value) return std::nullopt;
        return *value;
    }

    std::vector<std::string> TreeReader::GetAttributeNames() const
    {
        std::vector<std::string> names;
        for (const auto& attr : m_nodes.back().node->attributes)
        {
            names.push_back(DecodeAttribute(attr.first));
        }
        return names;
    }
}
