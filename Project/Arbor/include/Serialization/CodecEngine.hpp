#pragma once
#include "Serialization/CodecConfig.hpp"
#include "IO/HierarchicalStream.hpp"
#include "IO/TreeNode.hpp"

namespace Arbor
{
    // Converts object graphs to node trees and back.
    // Every call builds its own path tracker and depth counter; a single engine serves
    // concurrent calls as long as its configuration is left alone.
    class ARBOR_API CodecEngine
    {
    public:
        // Throws CodecError when a configuration member is missing
        explicit CodecEngine(CodecConfig config);

        const CodecConfig& Config() const { return m_config; }

        // Writes `root` as one complete node. Errors carry the node path in their "path" entry.
        void Marshal(ObjectRef root, HierarchicalStreamWriter& writer) const;
        // Decodes the node the reader is positioned on into an object of `expectedType`
        // (or, for reference wrappers, of a permitted descendant of their item type).
        Instance Unmarshal(HierarchicalStreamReader& reader, const TypeDescriptor* expectedType) const;

        TreeNode ToTreeNode(ObjectRef root) const;
        Instance FromTreeNode(const TreeNode& tree, const TypeDescriptor* expectedType) const;

        template <typename T>
        TreeNode ToTree(const T& value) const
        {
            return ToTreeNode(ObjectRef::Of(value));
        }

        template <typename T>
        T FromTree(const TreeNode& tree) const
        {
            Instance result = FromTreeNode(tree, TypeResolver<T>::Get());
            return std::move(result.As<T>());
        }

    private:
        CodecConfig m_config;
    };
}
