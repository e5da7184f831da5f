#include "pch.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "Serialization/JsonCodec.hpp"
#include "Settings/SettingsLoader.hpp"
#include "TestTypes.hpp"

using namespace Arbor;
using namespace ArborTest;

namespace
{
    // `levels` nodes, each the only child of the one before
    std::string NestedJson(int levels, const std::string& rootName, const std::string& childName)
    {
        std::string json = "{\"name\":\"" + rootName + "\"";
        for (int i = 1; i < levels; ++i) json += ",\"children\":[{\"name\":\"" + childName + "\"";
        json += "}";
        for (int i = 1; i < levels; ++i) json += "]}";
        return json;
    }
}

TEST(JsonTreeCodecTest, CompactShape)
{
    TreeNode root("point");
    root.SetAttribute("class", "vec");
    root.AddChild("x").value = "1";
    root.AddChild("empty");

    EXPECT_EQ(JsonTreeCodec::Write(root, false),
        "{\"name\":\"point\",\"attributes\":{\"class\":\"vec\"},\"children\":"
        "[{\"name\":\"x\",\"value\":\"1\"},{\"name\":\"empty\"}]}");
}

TEST(JsonTreeCodecTest, ReadsWhatItWrites)
{
    TreeNode root("root");
    root.SetAttribute("null", "true");
    root.SetAttribute("defined-in", "base");
    TreeNode& child = root.AddChild("child");
    child.value = "quote \" and \\ and \n";
    child.AddChild("leaf").value = "v";

    EXPECT_EQ(JsonTreeCodec::Read(JsonTreeCodec::Write(root, true)), root);
    EXPECT_EQ(JsonTreeCodec::Read(JsonTreeCodec::Write(root, false)), root);
}

TEST(JsonTreeCodecTest, RejectsMalformedInput)
{
    try
    {
        JsonTreeCodec::Read("{\"name\": ");
        FAIL() << "expected ConversionError";
    }
    catch (const ConversionError& e)
    {
        EXPECT_NE(e.Get("offset"), nullptr);
    }
    EXPECT_THROW(JsonTreeCodec::Read("[]"), ConversionError);
    EXPECT_THROW(JsonTreeCodec::Read("{\"value\": \"x\"}"), ConversionError);
    EXPECT_THROW(JsonTreeCodec::Read("{\"name\": 3}"), ConversionError);
    EXPECT_THROW(JsonTreeCodec::Read("{\"name\": \"a\", \"children\": {}}"), ConversionError);
}

TEST(JsonTreeCodecTest, NestingLimit)
{
    EXPECT_EQ(JsonTreeCodec::Read(NestedJson(3, "a", "a"), 3).CountNodes(), 3u);
    try
    {
        JsonTreeCodec::Read(NestedJson(4, "a", "a"), 3);
        FAIL() << "expected ConversionError";
    }
    catch (const ConversionError& e)
    {
        ASSERT_NE(e.Get("max-depth"), nullptr);
        EXPECT_EQ(*e.Get("max-depth"), "3");
    }
}

TEST(JsonTreeCodecTest, VeryDeepDocumentIsRejected)
{
    EXPECT_THROW(JsonTreeCodec::Read(NestedJson(100000, "a", "a")), ConversionError);
}

TEST(JsonCodecTest, VeryDeepChainIsRejected)
{
    CodecEngine engine(MakeTestConfig());
    EXPECT_THROW(FromJson<Link>(engine, NestedJson(100000, "link", "next")), ConversionError);

    Link shallow = FromJson<Link>(engine, NestedJson(5, "link", "next"));
    int length = 0;
    for (const Link* l = &shallow; l; l = l->next.get()) ++length;
    EXPECT_EQ(length, 5);
}

TEST(JsonCodecTest, ObjectGraphRoundTrip)
{
    CodecEngine engine(MakeTestConfig());
    Drawing drawing;
    auto circle = std::make_shared<Circle>();
    circle->label = "c";
    circle->radius = 1.25;
    drawing.shapes.push_back(circle);

    const std::string json = ToJson(engine, drawing);
    EXPECT_NE(json.find("\"class\": \"circle\""), std::string::npos);

    Drawing copy = FromJson<Drawing>(engine, json);
    ASSERT_EQ(copy.shapes.size(), 1u);
    auto decoded = std::dynamic_pointer_cast<Circle>(copy.shapes[0]);
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(decoded->radius, 1.25);
}

TEST(JsonCodecTest, CompactOutputFollowsSettings)
{
    CodecSettings settings;
    settings.prettyJson = false;
    CodecEngine engine(MakeTestConfig(settings));
    Point p{ 1, 2 };
    EXPECT_EQ(ToJson(engine, p),
        "{\"name\":\"point\",\"children\":[{\"name\":\"x\",\"value\":\"1\"},{\"name\":\"y\",\"value\":\"2\"}]}");
}

TEST(JsonCodecTest, DecodeErrorsCarryPath)
{
    CodecEngine engine(MakeTestConfig());
    const std::string json = "{\"name\":\"point\",\"children\":[{\"name\":\"y\",\"value\":\"1.5\"}]}";
    try
    {
        FromJson<Point>(engine, json);
        FAIL() << "expected ConversionError";
    }
    catch (const ConversionError& e)
    {
        ASSERT_NE(e.Get("path"), nullptr);
        EXPECT_EQ(*e.Get("path"), "/point/y");
    }
}

TEST(SettingsLoaderTest, DefaultsSurviveEmptyObject)
{
    CodecSettings settings;
    ASSERT_TRUE(SettingsLoader::LoadFromString("{}", settings));
    EXPECT_EQ(settings.maxDepth, 512);
    EXPECT_FALSE(settings.ignoreUnknownElements);
    EXPECT_TRUE(settings.allowFinalFieldWrites);
    EXPECT_TRUE(settings.omitNullFields);
    EXPECT_TRUE(settings.prettyJson);
    EXPECT_EQ(settings.logLevel, ArborLogging::LogLevel::Info);
}

TEST(SettingsLoaderTest, ReadsAndClamps)
{
    CodecSettings settings;
    ASSERT_TRUE(SettingsLoader::LoadFromString(
        "{\"maxDepth\": 5000000, \"ignoreUnknownElements\": true, \"omitNullFields\": \"no\", \"logLevel\": \"debug\"}", settings));
    EXPECT_EQ(settings.maxDepth, CodecSettings::MAX_DEPTH);
    EXPECT_TRUE(settings.ignoreUnknownElements);
    // Ill-typed member keeps its value
    EXPECT_TRUE(settings.omitNullFields);
    EXPECT_EQ(settings.logLevel, ArborLogging::LogLevel::Debug);
}

TEST(SettingsLoaderTest, MalformedTextLeavesSettingsUntouched)
{
    CodecSettings settings;
    settings.maxDepth = 42;
    EXPECT_FALSE(SettingsLoader::LoadFromString("{\"maxDepth\": 7", settings));
    EXPECT_FALSE(SettingsLoader::LoadFromString("[1, 2]", settings));
    EXPECT_EQ(settings.maxDepth, 42);
}

TEST(SettingsLoaderTest, FileRoundTrip)
{
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "arbor_settings_test";
    const fs::path file = dir / "nested" / "codec.json";
    fs::remove_all(dir);

    CodecSettings missing;
    EXPECT_FALSE(SettingsLoader::Load(file.string(), missing));

    CodecSettings settings;
    settings.maxDepth = 64;
    settings.prettyJson = false;
    settings.logLevel = ArborLogging::LogLevel::Error;
    ASSERT_TRUE(SettingsLoader::Save(file.string(), settings));

    CodecSettings loaded;
    ASSERT_TRUE(SettingsLoader::Load(file.string(), loaded));
    EXPECT_EQ(loaded.maxDepth, 64);
    EXPECT_FALSE(loaded.prettyJson);
    EXPECT_EQ(loaded.logLevel, ArborLogging::LogLevel::Error);

    fs::remove_all(dir);
}
