#pragma once
#include <stack>
#include "IO/HierarchicalStream.hpp"
#include "IO/TreeNode.hpp"

namespace Arbor
{
    // Builds a TreeNode document. The first StartNode creates the root.
    class ARBOR_API TreeWriter : public AbstractWriter
    {
    public:
        explicit TreeWriter(std::shared_ptr<const NameCoder> coder = nullptr);

        void StartNode(const std::string& name) override;
        void AddAttribute(const std::string& name, const std::string& value) override;
        void SetValue(const std::string& text) override;
        void EndNode() override;

        bool HasRoot() const { return m_hasRoot; }
        size_t OpenNodes() const { return m_nodes.size(); }
        const TreeNode& Root() const { return m_root; }
        // Throws ConversionError while nodes are still open
        TreeNode TakeRoot();

    private:
        TreeNode& Current();

        TreeNode m_root;
        bool m_hasRoot = false;
        std::stack<TreeNode*> m_nodes; //!< Open nodes, innermost on top
    };
}
