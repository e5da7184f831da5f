#include "pch.h"
#include "IO/TreeNode.hpp"

namespace Arbor
{
    const std::string* TreeNode::Attribute(const std::string& key) const
    {
        for (const auto& attr : attributes)
        {
            if (attr.first == key) return &attr.second;
        }
        return nullptr;
    }

    void TreeNode::SetAttribute(const std::string& key, const std::string& val)
    {
        for (auto& attr : attributes)
        {
            if (attr.first == key)
            {
                attr.second = val;
                return;
            }
        }
        attributes.emplace_back(key, val);
    }

    TreeNode& TreeNode::AddChild(const std::string& childName)
    {
        children.emplace_back(childName);
        return children.back();
    }

    const TreeNode* TreeNode::Child(const std::string& childName) const
    {
        for (const TreeNode& child : children)
        {
            if (child.name == childName) return &child;
        }
        return nullptr;
    }

    size_t TreeNode::CountNodes() const
    {
        size_t count = 1;
        for (const TreeNode& child : children) count += child.CountNodes();
        return count;
    }

    static void AppendEscaped(std::string& out, const std::string& text, bool attribute)
    {
        for (char c : text)
        {
            switch (c)
            {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': if (attribute) { out += "&quot;"; } else { out += c; } break;
            case '\r': out += "&#xd;"; break;
            default: out += c; break;
            }
        }
    }

    static void AppendXml(std::string& out, const TreeNode& node, bool pretty, int indent)
    {
        if (pretty) out.append(static_cast<size_t>(indent) * 2, ' ');
        out += '<';
        out += node.name;
        for (const auto& attr : node.attributes)
        {
            out += ' ';
            out += attr.first;
            out += "=\"";
            AppendEscaped(out, attr.second, true);
            out += '"';
        }

        if (node.children.empty() && node.value.empty())
        {
            out += "/>";
            if (pretty) out += '\n';
            return;
        }

        out += '>';
        AppendEscaped(out, node.value, false);
        if (!node.children.empty())
        {
            if (pretty) out += '\n';
            for (const TreeNode& child : node.children) AppendXml(out, child, pretty, indent + 1);
            if (pretty) out.append(static_cast<size_t>(indent) * 2, ' ');
        }
        out += "</";
        out += node.name;
        out += '>';
        if (pretty) out += '\n';
    }

    std::string TreeNode::ToXml(bool pretty) const
    {
        std::string out;
        AppendXml(out, *this, pretty, 0);
        return out;
    }

    bool TreeNode::operator==(const TreeNode& other) const
    {
        return name == other.name && attributes == other.attributes && value == other.value && children == other.children;
    }
}
