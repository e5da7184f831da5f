#include "pch.h"
#include "Settings/SettingsLoader.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

#include <fstream>
#include <filesystem>

namespace Arbor
{
    bool SettingsLoader::Load(const std::string& filePath, CodecSettings& settings) {
        namespace fs = std::filesystem;

        // Check if file exists (avoid exception overhead)
        std::error_code ec;
        if (!fs::exists(filePath, ec)) {
            ARBOR_LOG_INFO("[Settings] No settings file at " + filePath + ", using defaults");
            return false;
        }

        std::ifstream inFile(filePath, std::ios::binary);
        if (!inFile.is_open()) {
            ARBOR_LOG_ERROR("[Settings] Failed to open file: " + filePath);
            return false;
        }

        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        inFile.close();

        if (!LoadFromString(jsonContent, settings)) {
            ARBOR_LOG_ERROR("[Settings] JSON parse error in: " + filePath);
            return false;
        }

        ARBOR_LOG_INFO("[Settings] Loaded settings from: " + filePath);
        return true;
    }

    bool SettingsLoader::LoadFromString(const std::string& json, CodecSettings& settings) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());

        if (doc.HasParseError() || !doc.IsObject()) {
            return false;
        }

        CodecSettings loaded = settings;

        if (doc.HasMember("maxDepth") && doc["maxDepth"].IsInt()) {
            loaded.maxDepth = doc["maxDepth"].GetInt();
        }
        if (doc.HasMember("ignoreUnknownElements") && doc["ignoreUnknownElements"].IsBool()) {
            loaded.ignoreUnknownElements = doc["ignoreUnknownElements"].GetBool();
        }
        if (doc.HasMember("allowFinalFieldWrites") && doc["allowFinalFieldWrites"].IsBool()) {
            loaded.allowFinalFieldWrites = doc["allowFinalFieldWrites"].GetBool();
        }
        if (doc.HasMember("omitNullFields") && doc["omitNullFields"].IsBool()) {
            loaded.omitNullFields = doc["omitNullFields"].GetBool();
        }
        if (doc.HasMember("prettyJson") && doc["prettyJson"].IsBool()) {
            loaded.prettyJson = doc["prettyJson"].GetBool();
        }
        if (doc.HasMember("logLevel") && doc["logLevel"].IsString()) {
            loaded.logLevel = ArborLogging::LogLevelFromString(doc["logLevel"].GetString(), loaded.logLevel);
        }

        loaded.Clamp();
        settings = loaded;
        return true;
    }

    bool SettingsLoader::Save(const std::string& filePath, const CodecSettings& settings) {
        namespace fs = std::filesystem;

        fs::path fullPath(filePath);
        fs::path parentDir = fullPath.parent_path();
        if (!parentDir.empty() && !fs::exists(parentDir)) {
            try {
                fs::create_directories(parentDir);
            } catch (const fs::filesystem_error& e) {
                ARBOR_LOG_ERROR("[Settings] Failed to create directory: " + parentDir.string() + " (" + e.what() + ")");
                return false;
            }
        }

        std::ofstream outFile(filePath, std::ios::binary | std::ios::trunc);
        if (!outFile.is_open()) {
            ARBOR_LOG_ERROR("[Settings] Failed to open file for writing: " + filePath);
            return false;
        }

        outFile << SaveToString(settings);
        outFile.close();

        ARBOR_LOG_INFO("[Settings] Saved settings to: " + filePath);
        return true;
    }

    std::string SettingsLoader::SaveToString(const CodecSettings& settings) {
        rapidjson::Document doc;
        doc.SetObject();
        rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

        doc.AddMember("maxDepth", settings.maxDepth, alloc);
        doc.AddMember("ignoreUnknownElements", settings.ignoreUnknownElements, alloc);
        doc.AddMember("allowFinalFieldWrites", settings.allowFinalFieldWrites, alloc);
        doc.AddMember("omitNullFields", settings.omitNullFields, alloc);
        doc.AddMember("prettyJson", settings.prettyJson, alloc);
        doc.AddMember("logLevel", rapidjson::Value(ArborLogging::ToString(settings.logLevel), alloc), alloc);

        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
        return std::string(buffer.GetString(), buffer.GetSize());
    }
}
