#include "pch.h"
#include "Serialization/JsonCodec.hpp"

namespace Arbor
{
    std::string ToJsonText(const CodecEngine& engine, ObjectRef root, bool pretty)
    {
        return JsonTreeCodec::Write(engine.ToTreeNode(root), pretty);
    }

    Instance FromJsonText(const CodecEngine& engine, const std::string& json, const TypeDescriptor* expectedType)
    {
        // A map entry spends two nodes on one level of values
        const size_t maxNodes = 2 * static_cast<size_t>(engine.Config().settings.maxDepth);
        const TreeNode tree = JsonTreeCodec::Read(json, maxNodes);
        return engine.FromTreeNode(tree, expectedType);
    }
}
