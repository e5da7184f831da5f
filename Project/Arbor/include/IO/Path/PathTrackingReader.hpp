#pragma once
#include "IO/HierarchicalStream.hpp"
#include "IO/Path/PathTracker.hpp"

namespace Arbor
{
    // Mirrors MoveDown/MoveUp into a PathTracker. The node the reader is positioned on at
    // construction is pushed immediately.
    class ARBOR_API PathTrackingReader : public ReaderWrapper
    {
    public:
        PathTrackingReader(HierarchicalStreamReader& reader, PathTracker& tracker);

        void MoveDown() override;
        void MoveUp() override;

    private:
        PathTracker& m_tracker;
    };
}
