#pragma once

#include <string>
#include "Logging.hpp"

namespace Arbor
{
    // CodecSettings - engine configuration, fixed when the CodecConfig is assembled
    struct CodecSettings {
        static constexpr int MIN_DEPTH = 1;
        // The deepest accepted input must fit a default 8 MB thread stack
        static constexpr int MAX_DEPTH = 1000;

        // Nesting limit for marshal and unmarshal (1 - 1000)
        int maxDepth = 512;

        // Skip child elements that name no field instead of failing
        bool ignoreUnknownElements = false;

        // Let the decoder overwrite fields registered as final
        bool allowFinalFieldWrites = true;

        // Leave empty references/optionals out of the output instead of writing a null marker
        bool omitNullFields = true;

        bool prettyJson = true;

        ArborLogging::LogLevel logLevel = ArborLogging::LogLevel::Info;

        // Clamp ranged members into their valid range
        void Clamp();

        // Options for ArborLogging::Initialize. The engine never changes the process log level.
        ArborLogging::LoggingOptions ToLoggingOptions() const;
    };
}
