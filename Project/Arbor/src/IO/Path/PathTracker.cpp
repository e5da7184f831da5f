#include "pch.h"
#include "IO/Path/PathTracker.hpp"
#include "Serialization/CodecErrors.hpp"

namespace Arbor
{
    void PathTracker::PushElement(const std::string& name)
    {
        auto& counts = m_frames.empty() ? m_rootCounts : m_frames.back().childCounts;
        Frame frame;
        frame.name = name;
        frame.index = ++counts[name];
        m_frames.push_back(std::move(frame));
    }

    void PathTracker::PopElement()
    {
        if (m_frames.empty())
        {
            throw ConversionError("Path tracker popped more elements than were pushed");
        }
        m_frames.pop_back();
    }

    std::string PathTracker::Format(const Frame& frame)
    {
        if (frame.index <= 1) return frame.name;
        return frame.name + "[" + std::to_string(frame.index) + "]";
    }

    std::string PathTracker::PeekElement(size_t i) const
    {
        if (i >= m_frames.size()) return {};
        return Format(m_frames[m_frames.size() - 1 - i]);
    }

    std::vector<std::string> PathTracker::Elements() const
    {
        std::vector<std::string> names;
        names.reserve(m_frames.size());
        for (const Frame& frame : m_frames) names.push_back(frame.name);
        return names;
    }

    std::string PathTracker::GetPath() const
    {
        if (m_frames.empty()) return "/";
        std::string path;
        for (const Frame& frame : m_frames)
        {
            path += '/';
            path += Format(frame);
        }
        return path;
    }
}
