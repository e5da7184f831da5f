#pragma once
#include <vector>
#include "IO/HierarchicalStream.hpp"
#include "IO/TreeNode.hpp"

namespace Arbor
{
    // Cursor over a TreeNode document. The document must outlive the reader.
    class ARBOR_API TreeReader : public AbstractReader
    {
    public:
        explicit TreeReader(const TreeNode& root, std::shared_ptr<const NameCoder> coder = nullptr);

        bool HasMoreChildren() const override;
        void MoveDown() override;
        void MoveUp() override;
        std::string GetNodeName() const override;
        std::string GetValue() const override;
        std::optional<std::string> GetAttribute(const std::string& name) const override;
        std::vector<std::string> GetAttributeNames() const override;
        size_t Depth() const override { return m_nodes.size() - 1; }

    private:
        struct NodeInfo
        {
            const TreeNode* node;
            size_t nextChild = 0; //!< Index of the next child MoveDown visits
        };

        std::vector<NodeInfo> m_nodes;
    };
}
