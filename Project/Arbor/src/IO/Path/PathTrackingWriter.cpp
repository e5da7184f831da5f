#include "pch.h"
#include "IO/Path/PathTrackingWriter.hpp"

namespace Arbor
{
    PathTrackingWriter::PathTrackingWriter(HierarchicalStreamWriter& writer, PathTracker& tracker)
        : WriterWrapper(writer)
        , m_tracker(tracker)
        , m_encoder(dynamic_cast<const AbstractWriter*>(&writer.Underlying()))
    {
    }

    void PathTrackingWriter::StartNode(const std::string& name)
    {
        m_tracker.PushElement(m_encoder ? m_encoder->EncodeNode(name) : name);
        m_wrapped.StartNode(name);
    }

    void PathTrackingWriter::EndNode()
    {
        m_wrapped.EndNode();
        m_tracker.PopElement();
    }
}
