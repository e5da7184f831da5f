#pragma once
#include <string>
#include "IO/TreeNode.hpp"

namespace Arbor
{
    // Lossless TreeNode <-> JSON text mapping:
    //   {"name": "...", "attributes": {"k": "v"}, "value": "...", "children": [ ... ]}
    // Empty attributes, value and children are omitted on output and optional on input.
    class ARBOR_API JsonTreeCodec
    {
    public:
        static constexpr size_t DEFAULT_MAX_DEPTH = 2048;

        static std::string Write(const TreeNode& root, bool pretty = true);
        // Throws ConversionError on malformed JSON, an unexpected shape, or nodes nested
        // more than maxDepth levels deep (the root is level 1)
        static TreeNode Read(const std::string& json, size_t maxDepth = DEFAULT_MAX_DEPTH);
    };
}
