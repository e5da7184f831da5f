#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Reflection/ReflectionBase.hpp"
#include "IO/HierarchicalStream.hpp"
#include "Serialization/CodecConfig.hpp"

namespace ArborTest
{
    struct Point
    {
        ARBOR_REFLECTED
        int x = 0;
        int y = 0;

        bool operator==(const Point& other) const = default;
    };

    struct Address
    {
        ARBOR_REFLECTED
        std::string street;
        std::string city;
    };

    struct Person
    {
        ARBOR_REFLECTED
        std::string name;
        int age = 0;
        double score = 0.0;
        bool active = false;
        char initial = '\0';
        std::vector<std::string> tags;
        std::map<std::string, int> counts;
        std::optional<int> luckyNumber;
        std::shared_ptr<Address> address;
        Arbor::TimePoint born{};
        Arbor::ByteArray avatar;
    };

    // Polymorphic hierarchy
    struct Shape
    {
        ARBOR_REFLECTED
        virtual ~Shape() = default;
        std::string label;
    };

    struct Circle : Shape
    {
        ARBOR_REFLECTED
        double radius = 0.0;
    };

    struct Square : Shape
    {
        ARBOR_REFLECTED
        double side = 0.0;
    };

    struct Drawing
    {
        ARBOR_REFLECTED
        std::vector<std::shared_ptr<Shape>> shapes;
        std::shared_ptr<Shape> focus;
    };

    // Same field name declared at two levels
    struct BaseRecord
    {
        ARBOR_REFLECTED
        int id = 0;
    };

    struct DerivedRecord : BaseRecord
    {
        ARBOR_REFLECTED
        int id = 0;
        std::string note;
    };

    // Private constructor, final and transient members
    class Token
    {
    public:
        ARBOR_REFLECTED
        static Token Issue(const std::string& value, const std::string& issuer);

        const std::string& Value() const { return m_value; }
        const std::string& Issuer() const { return m_issuer; }
        int Uses() const { return m_uses; }

        static int s_issued;

    private:
        Token() = default;

        std::string m_value;
        std::string m_issuer;
        int m_uses = 0;
    };

    // Trivially copyable, no default constructor; opted into structural construction
    struct Vec3
    {
        ARBOR_REFLECTED
        Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}
        float x;
        float y;
        float z;
    };

    // No default constructor and no structural opt-in
    struct Handle
    {
        ARBOR_REFLECTED
        explicit Handle(int value_) : value(value_) {}
        int value;
    };

    // Constructor always throws
    struct Fragile
    {
        ARBOR_REFLECTED
        Fragile();
        int value = 0;
    };

    // Writes itself as "#rrggbb"
    struct Color
    {
        ARBOR_REFLECTED
        unsigned char r = 0;
        unsigned char g = 0;
        unsigned char b = 0;
        std::string lastField; //!< field name seen by the last ReadFrom

        void ReadFrom(Arbor::HierarchicalStreamReader& reader, const std::string& fieldName);
        void WriteTo(Arbor::HierarchicalStreamWriter& writer) const;
    };

    // Writes one child per vertex
    struct Polyline
    {
        ARBOR_REFLECTED
        std::vector<Point> points;

        void ReadFrom(Arbor::HierarchicalStreamReader& reader, const std::string& fieldName);
        void WriteTo(Arbor::HierarchicalStreamWriter& writer) const;
    };

    // Moves down into its first child and never comes back up. With leaveOpen set,
    // writing leaves its payload node open.
    struct Unbalanced
    {
        ARBOR_REFLECTED
        int value = 0;
        bool leaveOpen = false;

        void ReadFrom(Arbor::HierarchicalStreamReader& reader, const std::string& fieldName);
        void WriteTo(Arbor::HierarchicalStreamWriter& writer) const;
    };

    struct Palette
    {
        ARBOR_REFLECTED
        std::string name;
        Color primary;
        std::vector<Color> swatches;
        Polyline outline;
    };

    // Singly linked chain, used for depth limits
    struct Link
    {
        ARBOR_REFLECTED
        int value = 0;
        std::shared_ptr<Link> next;
    };

    std::shared_ptr<Link> MakeChain(int length);

    // Registers every test type (with short aliases) into `config`, and lets the decoder
    // instantiate anything under the ArborTest namespace.
    void RegisterTestTypes(Arbor::CodecConfig& config);

    Arbor::CodecConfig MakeTestConfig(const Arbor::CodecSettings& settings = Arbor::CodecSettings{});
}
