#include "pch.h"
#include "Settings/CodecSettings.hpp"

namespace Arbor
{
    void CodecSettings::Clamp() {
        maxDepth = std::clamp(maxDepth, MIN_DEPTH, MAX_DEPTH);
    }

    ArborLogging::LoggingOptions CodecSettings::ToLoggingOptions() const {
        ArborLogging::LoggingOptions options;
        options.level = logLevel;
        return options;
    }
}
