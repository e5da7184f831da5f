#include "pch.h"
#include "IO/Json/JsonTreeCodec.hpp"
#include "Serialization/CodecErrors.hpp"

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace Arbor
{
    namespace
    {
        template <typename Writer>
        void WriteNode(Writer& writer, const TreeNode& node)
        {
            writer.StartObject();
            writer.Key("name");
            writer.String(node.name.c_str(), static_cast<rapidjson::SizeType>(node.name.size()));

            if (!node.attributes.empty())
            {
                writer.Key("attributes");
                writer.StartObject();
                for (const auto& attr : node.attributes)
                {
                    writer.Key(attr.first.c_str(), static_cast<rapidjson::SizeType>(attr.first.size()));
                    writer.String(attr.second.c_str(), static_cast<rapidjson::SizeType>(attr.second.size()));
                }
                writer.EndObject();
            }

            if (!node.value.empty())
            {
                writer.Key("value");
                writer.String(node.value.c_str(), static_cast<rapidjson::SizeType>(node.value.size()));
            }

            if (!node.children.empty())
            {
                writer.Key("children");
                writer.StartArray();
                for (const TreeNode& child : node.children) WriteNode(writer, child);
                writer.EndArray();
            }
            writer.EndObject();
        }

        std::string AsString(const rapidjson::Value& v, const char* what)
        {
            if (!v.IsString())
            {
                ConversionError err("JSON member is not a string");
                err.Add("member", what);
                throw err;
            }
            return std::string(v.GetString(), v.GetStringLength());
        }

        void ReadNode(const rapidjson::Value& v, TreeNode& node, size_t depth, size_t maxDepth)
        {
            if (depth > maxDepth)
            {
                ConversionError err("Maximum nesting depth exceeded");
                err.Add("max-depth", std::to_string(maxDepth));
                throw err;
            }
            if (!v.IsObject() || !v.HasMember("name"))
            {
                throw ConversionError("JSON node must be an object with a name");
            }
            node.name = AsString(v["name"], "name");

            if (v.HasMember("attributes"))
            {
                const rapidjson::Value& attrs = v["attributes"];
                if (!attrs.IsObject()) throw ConversionError("JSON node attributes must be an object");
                for (auto it = attrs.MemberBegin(); it != attrs.MemberEnd(); ++it)
                {
                    node.SetAttribute(std::string(it->name.GetString(), it->name.GetStringLength()), AsString(it->value, "attributes"));
                }
            }

            if (v.HasMember("value"))
            {
                node.value = AsString(v["value"], "value");
            }

            if (v.HasMember("children"))
            {
                const rapidjson::Value& children = v["children"];
                if (!children.IsArray()) throw ConversionError("JSON node children must be an array");
                node.children.reserve(children.Size());
                for (const auto& child : children.GetArray())
                {
                    ReadNode(child, node.children.emplace_back(), depth + 1, maxDepth);
                }
            }
        }
    }

    std::string JsonTreeCodec::Write(const TreeNode& root, bool pretty)
    {
        rapidjson::StringBuffer buffer;
        if (pretty)
        {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            WriteNode(writer, root);
        }
        else
        {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            WriteNode(writer, root);
        }
        return std::string(buffer.GetString(), buffer.GetSize());
    }

    TreeNode JsonTreeCodec::Read(const std::string& json, size_t maxDepth)
    {
        // The iterative parser keeps nesting off the call stack
        rapidjson::Document doc;
        doc.Parse<rapidjson::kParseIterativeFlag>(json.c_str(), json.size());
        if (doc.HasParseError())
        {
            ConversionError err(std::string("Malformed JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()));
            err.Add("offset", std::to_string(doc.GetErrorOffset()));
            throw err;
        }

        TreeNode root;
        ReadNode(doc, root, 1, maxDepth);
        return root;
    }
}
