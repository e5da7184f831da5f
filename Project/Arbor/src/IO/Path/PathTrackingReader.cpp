#include "pch.h"
#include "IO/Path/PathTrackingReader.hpp"

namespace Arbor
{
    PathTrackingReader::PathTrackingReader(HierarchicalStreamReader& reader, PathTracker& tracker)
        : ReaderWrapper(reader)
        , m_tracker(tracker)
    {
        m_tracker.PushElement(reader.GetNodeName());
    }

    void PathTrackingReader::MoveDown()
    {
        m_wrapped.MoveDown();
        m_tracker.PushElement(m_wrapped.GetNodeName());
    }

    void PathTrackingReader::MoveUp()
    {
        m_wrapped.MoveUp();
        m_tracker.PopElement();
    }
}
