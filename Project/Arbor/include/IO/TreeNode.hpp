#pragma once
#include <string>
#include <utility>
#include <vector>

#include "Logging.hpp"

namespace Arbor
{
    // In-memory node of a document tree. Names are stored as written (already escaped).
    struct ARBOR_API TreeNode
    {
        std::string name;
        std::vector<std::pair<std::string, std::string>> attributes;
        std::string value;
        std::vector<TreeNode> children;

        TreeNode() = default;
        explicit TreeNode(std::string name_) : name(std::move(name_)) {}

        const std::string* Attribute(const std::string& key) const;
        // Replaces an existing attribute of the same name
        void SetAttribute(const std::string& key, const std::string& val);

        TreeNode& AddChild(const std::string& childName);
        const TreeNode* Child(const std::string& childName) const;

        size_t CountNodes() const;

        // Diagnostic rendering; not read back
        std::string ToXml(bool pretty = true) const;

        bool operator==(const TreeNode& other) const;
        bool operator!=(const TreeNode& other) const { return !(*this == other); }
    };
}
