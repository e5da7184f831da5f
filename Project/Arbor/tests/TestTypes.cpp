#include "pch.h"
#include "TestTypes.hpp"

#include <cstdio>

#pragma region Registration
ARBOR_REGISTER_START(ArborTest::Point)
ARBOR_REGISTER_FIELD(x)
ARBOR_REGISTER_FIELD(y)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Address)
ARBOR_REGISTER_FIELD(street)
ARBOR_REGISTER_FIELD(city)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Person)
ARBOR_REGISTER_FIELD(name)
ARBOR_REGISTER_FIELD(age)
ARBOR_REGISTER_FIELD(score)
ARBOR_REGISTER_FIELD(active)
ARBOR_REGISTER_FIELD(initial)
ARBOR_REGISTER_FIELD(tags)
ARBOR_REGISTER_FIELD(counts)
ARBOR_REGISTER_FIELD(luckyNumber)
ARBOR_REGISTER_FIELD(address)
ARBOR_REGISTER_FIELD(born)
ARBOR_REGISTER_FIELD(avatar)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Shape)
ARBOR_REGISTER_FIELD(label)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Circle)
ARBOR_REGISTER_SUPER(ArborTest::Shape)
ARBOR_REGISTER_FIELD(radius)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Square)
ARBOR_REGISTER_SUPER(ArborTest::Shape)
ARBOR_REGISTER_FIELD(side)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Drawing)
ARBOR_REGISTER_FIELD(shapes)
ARBOR_REGISTER_FIELD(focus)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::BaseRecord)
ARBOR_REGISTER_FIELD(id)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::DerivedRecord)
ARBOR_REGISTER_SUPER(ArborTest::BaseRecord)
ARBOR_REGISTER_FIELD(id)
ARBOR_REGISTER_FIELD(note)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Token)
ARBOR_REGISTER_DEFAULT_CONSTRUCTOR
ARBOR_REGISTER_FIELD(m_value)
ARBOR_REGISTER_FINAL_FIELD(m_issuer)
ARBOR_REGISTER_TRANSIENT_FIELD(m_uses)
ARBOR_REGISTER_STATIC_FIELD(s_issued)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Vec3)
ARBOR_REGISTER_STRUCTURAL
ARBOR_REGISTER_FIELD(x)
ARBOR_REGISTER_FIELD(y)
ARBOR_REGISTER_FIELD(z)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Handle)
ARBOR_REGISTER_FIELD(value)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Fragile)
ARBOR_REGISTER_FIELD(value)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Color)
ARBOR_REGISTER_SELF_DESCRIBING
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Polyline)
ARBOR_REGISTER_SELF_DESCRIBING
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Unbalanced)
ARBOR_REGISTER_SELF_DESCRIBING
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Palette)
ARBOR_REGISTER_FIELD(name)
ARBOR_REGISTER_FIELD(primary)
ARBOR_REGISTER_FIELD(swatches)
ARBOR_REGISTER_FIELD(outline)
ARBOR_REGISTER_END

ARBOR_REGISTER_START(ArborTest::Link)
ARBOR_REGISTER_FIELD(value)
ARBOR_REGISTER_FIELD(next)
ARBOR_REGISTER_END
#pragma endregion

namespace ArborTest
{
    int Token::s_issued = 0;

    Token Token::Issue(const std::string& value, const std::string& issuer)
    {
        Token token;
        token.m_value = value;
        token.m_issuer = issuer;
        ++s_issued;
        return token;
    }

    Fragile::Fragile()
    {
        throw std::runtime_error("Fragile refuses to be built");
    }

    void Color::ReadFrom(Arbor::HierarchicalStreamReader& reader, const std::string& fieldName)
    {
        const std::string text = reader.GetValue();
        unsigned rr = 0, gg = 0, bb = 0;
        if (text.size() != 7 || text[0] != '#' || std::sscanf(text.c_str() + 1, "%2x%2x%2x", &rr, &gg, &bb) != 3)
        {
            Arbor::ConversionError err("Malformed color");
            err.Add("value", text);
            throw err;
        }
        r = static_cast<unsigned char>(rr);
        g = static_cast<unsigned char>(gg);
        b = static_cast<unsigned char>(bb);
        lastField = fieldName;
    }

    void Color::WriteTo(Arbor::HierarchicalStreamWriter& writer) const
    {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", r, g, b);
        writer.SetValue(buffer);
    }

    void Polyline::ReadFrom(Arbor::HierarchicalStreamReader& reader, const std::string&)
    {
        points.clear();
        while (reader.HasMoreChildren())
        {
            reader.MoveDown();
            Point p;
            if (std::sscanf(reader.GetValue().c_str(), "%d,%d", &p.x, &p.y) != 2)
            {
                throw Arbor::ConversionError("Malformed vertex");
            }
            points.push_back(p);
            reader.MoveUp();
        }
    }

    void Polyline::WriteTo(Arbor::HierarchicalStreamWriter& writer) const
    {
        for (const Point& p : points)
        {
            writer.StartNode("v");
            writer.SetValue(std::to_string(p.x) + "," + std::to_string(p.y));
            writer.EndNode();
        }
    }

    void Unbalanced::ReadFrom(Arbor::HierarchicalStreamReader& reader, const std::string&)
    {
        if (reader.HasMoreChildren()) reader.MoveDown();
    }

    void Unbalanced::WriteTo(Arbor::HierarchicalStreamWriter& writer) const
    {
        writer.StartNode("payload");
        writer.SetValue(std::to_string(value));
        if (!leaveOpen) writer.EndNode();
    }

    std::shared_ptr<Link> MakeChain(int length)
    {
        std::shared_ptr<Link> head;
        for (int i = length; i > 0; --i)
        {
            auto link = std::make_shared<Link>();
            link->value = i;
            link->next = head;
            head = link;
        }
        return head;
    }

    void RegisterTestTypes(Arbor::CodecConfig& config)
    {
        Arbor::TypeRegistry& types = *config.types;
        types.Register<Point>("point");
        types.Register<Address>("address");
        types.Register<Person>("person");
        types.Register<Shape>("shape");
        types.Register<Circle>("circle");
        types.Register<Square>("square");
        types.Register<Drawing>("drawing");
        types.Register<BaseRecord>("base-record");
        types.Register<DerivedRecord>("derived-record");
        types.Register<Token>("token");
        types.Register<Vec3>("vec3");
        types.Register<Handle>("handle");
        types.Register<Fragile>("fragile");
        types.Register<Color>("color");
        types.Register<Polyline>("polyline");
        types.Register<Unbalanced>("unbalanced");
        types.Register<Palette>("palette");
        types.Register<Link>("link");

        config.permissions->AllowTypesByWildcard({ "ArborTest::*" });
    }

    Arbor::CodecConfig MakeTestConfig(const Arbor::CodecSettings& settings)
    {
        Arbor::CodecConfig config = Arbor::CodecConfig::CreateDefault(settings);
        RegisterTestTypes(config);
        return config;
    }
}
