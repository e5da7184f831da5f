#pragma once
#include "IO/HierarchicalStream.hpp"
#include "IO/Path/PathTracker.hpp"

namespace Arbor
{
    // Mirrors StartNode/EndNode into a PathTracker. Names are tracked as the underlying
    // writer emits them, so a name-escaping writer yields escaped path elements.
    class ARBOR_API PathTrackingWriter : public WriterWrapper
    {
    public:
        PathTrackingWriter(HierarchicalStreamWriter& writer, PathTracker& tracker);

        void StartNode(const std::string& name) override;
        void EndNode() override;

    private:
        PathTracker& m_tracker;
        const AbstractWriter* m_encoder; //!< null when the underlying writer does not escape names
    };
}
