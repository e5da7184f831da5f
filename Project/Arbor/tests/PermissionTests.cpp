#include "pch.h"
#include <gtest/gtest.h>
#include <atomic>

#include "Security/TypePermissionGate.hpp"
#include "Serialization/CodecEngine.hpp"
#include "TestTypes.hpp"

using namespace Arbor;
using namespace ArborTest;

namespace
{
    template <typename T>
    void ExpectPrimitiveAllowed(const PrimitiveTypePermission& permission)
    {
        EXPECT_TRUE(permission.Allows(TypeResolver<T>::Get())) << TypeResolver<T>::Get()->ToString();
        EXPECT_TRUE(permission.Allows(TypeResolver<std::optional<T>>::Get())) << "boxed " << TypeResolver<T>::Get()->ToString();
    }

    // Counts every construction request that reaches it
    class CountingBuilder : public InstanceBuilder
    {
    public:
        using InstanceBuilder::InstanceBuilder;

        Instance NewInstance(const TypeDescriptor* type) const override
        {
            ++calls;
            return InstanceBuilder::NewInstance(type);
        }

        mutable std::atomic<int> calls{ 0 };
    };
}

TEST(TypePermissionTest, PrimitiveAllowsEveryKindButVoid)
{
    PrimitiveTypePermission permission;
    ExpectPrimitiveAllowed<bool>(permission);
    ExpectPrimitiveAllowed<char>(permission);
    ExpectPrimitiveAllowed<signed char>(permission);
    ExpectPrimitiveAllowed<unsigned char>(permission);
    ExpectPrimitiveAllowed<short>(permission);
    ExpectPrimitiveAllowed<unsigned short>(permission);
    ExpectPrimitiveAllowed<int>(permission);
    ExpectPrimitiveAllowed<unsigned int>(permission);
    ExpectPrimitiveAllowed<long>(permission);
    ExpectPrimitiveAllowed<unsigned long>(permission);
    ExpectPrimitiveAllowed<long long>(permission);
    ExpectPrimitiveAllowed<unsigned long long>(permission);
    ExpectPrimitiveAllowed<float>(permission);
    ExpectPrimitiveAllowed<double>(permission);

    EXPECT_FALSE(permission.Allows(TypeResolver<void>::Get()));
    EXPECT_FALSE(permission.Allows(TypeResolver<std::nullptr_t>::Get()));
    EXPECT_FALSE(permission.Allows(TypeResolver<std::string>::Get()));
    EXPECT_FALSE(permission.Allows(TypeResolver<Point>::Get()));
    EXPECT_FALSE(permission.Allows(nullptr));
}

TEST(TypePermissionTest, AnyAndNone)
{
    EXPECT_TRUE(AnyTypePermission().Allows(TypeResolver<Point>::Get()));
    EXPECT_FALSE(AnyTypePermission().Allows(nullptr));
    EXPECT_FALSE(NoTypePermission().Allows(TypeResolver<int>::Get()));
}

TEST(TypePermissionTest, ExplicitNames)
{
    auto permission = ExplicitTypePermission::Of<Point, Address>();
    EXPECT_TRUE(permission->Allows(TypeResolver<Point>::Get()));
    EXPECT_TRUE(permission->Allows(TypeResolver<Address>::Get()));
    EXPECT_FALSE(permission->Allows(TypeResolver<Person>::Get()));
    EXPECT_EQ(permission->Describe(), "explicit[ArborTest::Address, ArborTest::Point]");
}

TEST(TypePermissionTest, WildcardScopes)
{
    EXPECT_EQ(WildcardTypePermission::ToRegex("a.b?"), "a\\.b[^:]");

    WildcardTypePermission single({ "ArborTest::*" });
    EXPECT_TRUE(single.Allows(TypeResolver<Point>::Get()));
    EXPECT_FALSE(single.Allows(TypeResolver<int>::Get()));

    WildcardTypePermission deep({ "std::**" });
    EXPECT_TRUE(deep.Allows(TypeResolver<std::vector<Point>>::Get()));
    EXPECT_TRUE(deep.Allows(TypeResolver<std::string>::Get()));

    // '*' stays within one scope
    WildcardTypePermission shallow({ "std::*" });
    EXPECT_TRUE(shallow.Allows(TypeResolver<std::string>::Get()));
    EXPECT_FALSE(shallow.Allows(TypeResolver<TimePoint>::Get()));

    WildcardTypePermission oneChar({ "ArborTest::Vec?" });
    EXPECT_TRUE(oneChar.Allows(TypeResolver<Vec3>::Get()));
    EXPECT_FALSE(oneChar.Allows(TypeResolver<Point>::Get()));
}

TEST(TypePermissionTest, RegExpFullMatch)
{
    RegExpTypePermission permission({ "ArborTest::(Circle|Square)" });
    EXPECT_TRUE(permission.Allows(TypeResolver<Circle>::Get()));
    EXPECT_TRUE(permission.Allows(TypeResolver<Square>::Get()));
    EXPECT_FALSE(permission.Allows(TypeResolver<Shape>::Get()));

    EXPECT_THROW(RegExpTypePermission({ "(" }), ConversionError);
}

TEST(TypePermissionTest, HierarchyIncludesDescendants)
{
    auto permission = TypeHierarchyPermission::Of<Shape>();
    EXPECT_TRUE(permission->Allows(TypeResolver<Shape>::Get()));
    EXPECT_TRUE(permission->Allows(TypeResolver<Circle>::Get()));
    EXPECT_FALSE(permission->Allows(TypeResolver<Point>::Get()));
}

TEST(TypePermissionTest, StandardLibrary)
{
    StandardLibraryTypePermission permission;
    EXPECT_TRUE(permission.Allows(TypeResolver<std::string>::Get()));
    EXPECT_TRUE(permission.Allows(TypeResolver<std::vector<int>>::Get()));
    EXPECT_TRUE((permission.Allows(TypeResolver<std::map<std::string, int>>::Get())));
    EXPECT_TRUE(permission.Allows(TypeResolver<std::shared_ptr<Point>>::Get()));
    EXPECT_TRUE(permission.Allows(TypeResolver<TimePoint>::Get()));
    EXPECT_FALSE(permission.Allows(TypeResolver<Point>::Get()));
    EXPECT_FALSE(permission.Allows(TypeResolver<int>::Get()));
}

TEST(TypePermissionGateTest, EmptyGateDeniesEverything)
{
    TypePermissionGate gate;
    EXPECT_FALSE(gate.Allows(TypeResolver<int>::Get()));
    EXPECT_THROW(gate.Check(TypeResolver<int>::Get()), ForbiddenTypeError);
    EXPECT_EQ(gate.Describe(), "none");
}

TEST(TypePermissionGateTest, AnyPermissionSuffices)
{
    TypePermissionGate gate;
    gate.Add<PrimitiveTypePermission>().AllowTypes({ "ArborTest::Point" });
    EXPECT_EQ(gate.Size(), 2u);
    EXPECT_NO_THROW(gate.Check(TypeResolver<int>::Get()));
    EXPECT_NO_THROW(gate.Check(TypeResolver<Point>::Get()));

    try
    {
        gate.Check(TypeResolver<Address>::Get());
        FAIL() << "expected ForbiddenTypeError";
    }
    catch (const ForbiddenTypeError& e)
    {
        ASSERT_NE(e.Get("type"), nullptr);
        EXPECT_EQ(*e.Get("type"), "ArborTest::Address");
        ASSERT_NE(e.Get("permissions"), nullptr);
        EXPECT_EQ(*e.Get("permissions"), "primitive | explicit[ArborTest::Point]");
    }

    gate.Clear();
    EXPECT_FALSE(gate.Allows(TypeResolver<int>::Get()));
}

TEST(TypePermissionGateTest, DeniedTypeIsNeverConstructed)
{
    CodecConfig config = CodecConfig::CreateDefault();
    config.types->Register<Point>("point");
    auto builder = std::make_shared<CountingBuilder>(*config.types);
    config.builder = builder;
    CodecEngine engine(config);

    TreeNode tree("point");
    tree.AddChild("x").value = "1";
    tree.AddChild("y").value = "2";

    EXPECT_THROW(engine.FromTree<Point>(tree), ForbiddenTypeError);
    EXPECT_EQ(builder->calls.load(), 0);
}

TEST(TypePermissionGateTest, NestedDeniedTypeStopsBeforeConstruction)
{
    CodecConfig config = CodecConfig::CreateDefault();
    config.types->Register<Point>("point");
    auto builder = std::make_shared<CountingBuilder>(*config.types);
    config.builder = builder;
    CodecEngine engine(config);

    // The sequence itself is allowed; its items are not
    TreeNode tree("points");
    TreeNode& item = tree.AddChild("item");
    item.SetAttribute("class", "point");
    item.AddChild("x").value = "1";

    EXPECT_THROW(engine.FromTree<std::vector<std::shared_ptr<Point>>>(tree), ForbiddenTypeError);
    EXPECT_EQ(builder->calls.load(), 1);
}

TEST(TypePermissionGateTest, NullValuesSkipTheGate)
{
    CodecConfig config = CodecConfig::CreateDefault();
    config.permissions->Clear();
    CodecEngine engine(config);

    TreeNode tree("value");
    tree.SetAttribute("null", "true");
    std::shared_ptr<Point> result = engine.FromTree<std::shared_ptr<Point>>(tree);
    EXPECT_EQ(result, nullptr);
}
