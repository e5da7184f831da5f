#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "Logging.hpp"

namespace Arbor
{
    // Stack of the nodes currently entered by a reader or writer, used for diagnostics.
    // Each frame remembers how many same-named siblings preceded it.
    class ARBOR_API PathTracker
    {
    public:
        PathTracker() = default;

        void PushElement(const std::string& name);
        // Throws ConversionError when nothing is entered
        void PopElement();

        size_t Depth() const { return m_frames.size(); }

        // Name of the element `i` levels above the current one, with its sibling index
        // when it is not the first of its name (e.g. "item[2]").
        std::string PeekElement(size_t i = 0) const;
        // Plain names, outermost first
        std::vector<std::string> Elements() const;
        // "/root/child/item[2]"; "/" when nothing is entered
        std::string GetPath() const;

    private:
        struct Frame
        {
            std::string name;
            size_t index = 1;
            std::unordered_map<std::string, size_t> childCounts;
        };

        static std::string Format(const Frame& frame);

        std::vector<Frame> m_frames;
        std::unordered_map<std::string, size_t> m_rootCounts;
    };
}
