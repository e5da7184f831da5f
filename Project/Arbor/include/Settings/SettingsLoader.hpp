#pragma once

#include <string>
#include "Settings/CodecSettings.hpp"

namespace Arbor
{
    // SettingsLoader - reads and writes CodecSettings as a JSON object.
    // Missing or ill-typed members keep the value already in `settings`; ranges are clamped.
    class ARBOR_API SettingsLoader {
    public:
        // Returns false (leaving `settings` untouched) when the file is absent or not valid JSON
        static bool Load(const std::string& filePath, CodecSettings& settings);
        static bool LoadFromString(const std::string& json, CodecSettings& settings);

        // Creates the parent directory when needed
        static bool Save(const std::string& filePath, const CodecSettings& settings);
        static std::string SaveToString(const CodecSettings& settings);
    };
}
