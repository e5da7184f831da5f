#include "pch.h"
#include <gtest/gtest.h>

#include "Reflection/FieldIntrospector.hpp"
#include "Reflection/TypeRegistry.hpp"
#include "TestTypes.hpp"

using namespace Arbor;
using namespace ArborTest;

namespace
{
    std::vector<std::string> NamesOf(const std::vector<const FieldDescriptor*>& fields)
    {
        std::vector<std::string> names;
        for (const FieldDescriptor* f : fields) names.push_back(f->name);
        return names;
    }
}

TEST(TypeDescriptorTest, DescribesPrimitivesAndWrappers)
{
    const TypeDescriptor* i = TypeResolver<int>::Get();
    EXPECT_STREQ(i->GetName(), "int");
    EXPECT_TRUE(i->IsPrimitive());
    EXPECT_FALSE(i->IsBoxed());
    EXPECT_EQ(i->GetSize(), sizeof(int));

    const TypeDescriptor* boxed = TypeResolver<std::optional<int>>::Get();
    EXPECT_EQ(boxed->ToString(), "std::optional<int>");
    EXPECT_TRUE(boxed->IsBoxed());
    EXPECT_EQ(boxed->GetPrimitiveKind(), PrimitiveKind::Int);

    const TypeDescriptor* v = TypeResolver<void>::Get();
    EXPECT_TRUE(v->IsVoid());
    EXPECT_TRUE(TypeResolver<std::nullptr_t>::Get()->IsVoid());
    EXPECT_TRUE(TypeResolver<std::nullptr_t>::Get()->IsBoxed());

    EXPECT_EQ(TypeResolver<std::vector<Point>>::Get()->ToString(), "std::vector<ArborTest::Point>");
    EXPECT_EQ((TypeResolver<std::map<std::string, int>>::Get()->ToString()), "std::map<std::string, int>");
    EXPECT_EQ(TypeResolver<std::shared_ptr<Shape>>::Get()->GetKind(), TypeKind::Reference);
}

TEST(TypeDescriptorTest, StructHierarchy)
{
    const TypeDescriptor* shape = TypeResolver<Shape>::Get();
    const TypeDescriptor* circle = TypeResolver<Circle>::Get();

    EXPECT_STREQ(circle->GetName(), "ArborTest::Circle");
    EXPECT_EQ(circle->GetSuperType(), shape);
    EXPECT_TRUE(circle->IsA(shape));
    EXPECT_FALSE(shape->IsA(circle));
    EXPECT_FALSE(circle->IsA(TypeResolver<Square>::Get()));

    Circle c;
    void* asShape = circle->UpcastTo(shape, &c);
    EXPECT_EQ(asShape, static_cast<void*>(static_cast<Shape*>(&c)));
    EXPECT_EQ(circle->UpcastTo(TypeResolver<Point>::Get(), &c), nullptr);

    const Shape& viewed = c;
    DynamicRef dyn = shape->DynamicTypeOf(&viewed);
    EXPECT_EQ(*dyn.type, typeid(Circle));
    EXPECT_EQ(dyn.address, static_cast<const void*>(&c));
}

TEST(TypeDescriptorTest, ConstructionHooks)
{
    EXPECT_TRUE(TypeResolver<Point>::Get()->HasDefaultConstructor());
    // Private constructor reached through the registration
    EXPECT_TRUE(TypeResolver<Token>::Get()->HasDefaultConstructor());
    EXPECT_FALSE(TypeResolver<Vec3>::Get()->HasDefaultConstructor());
    EXPECT_TRUE(TypeResolver<Vec3>::Get()->IsStructurallyConstructible());
    EXPECT_FALSE(TypeResolver<Handle>::Get()->HasDefaultConstructor());
    EXPECT_FALSE(TypeResolver<Handle>::Get()->IsStructurallyConstructible());
}

TEST(InstanceTest, AsRequiresExactType)
{
    Instance value = Instance::Make<int>(42);
    EXPECT_EQ(value.As<int>(), 42);
    EXPECT_THROW(value.As<long>(), ConversionError);

    Instance empty;
    EXPECT_TRUE(empty.IsNull());
    EXPECT_THROW(empty.As<int>(), ConversionError);
}

TEST(TypeRegistryTest, ResolvesNamesAndAliases)
{
    TypeRegistry types;
    types.RegisterStandardTypes();
    types.Register<Point>("point");

    EXPECT_EQ(types.Resolve("int"), TypeResolver<int>::Get());
    EXPECT_EQ(types.Resolve("string"), TypeResolver<std::string>::Get());
    EXPECT_EQ(types.Resolve("point"), TypeResolver<Point>::Get());
    EXPECT_EQ(types.Resolve("ArborTest::Point"), TypeResolver<Point>::Get());
    EXPECT_EQ(types.Resolve("ArborTest::Circle"), nullptr);
    EXPECT_THROW(types.ResolveOrThrow("ArborTest::Circle"), CannotResolveTypeError);

    EXPECT_EQ(types.FindByTypeInfo(typeid(Point)), TypeResolver<Point>::Get());
    EXPECT_EQ(types.NameOf(TypeResolver<Point>::Get()), "point");
    EXPECT_EQ(types.NameOf(TypeResolver<Circle>::Get()), "ArborTest::Circle");
}

TEST(TypeRegistryTest, AliasConflictIsRejected)
{
    TypeRegistry types;
    types.Register<Point>("p");
    EXPECT_NO_THROW(types.Register<Point>("p"));
    EXPECT_THROW(types.Register<Address>("p"), CannotResolveTypeError);
}

TEST(TypeRegistryTest, QualifiedNameCannotBeRebound)
{
    TypeRegistry types;
    types.Register<Point>();

    TypeDescriptor impostor("ArborTest::Point", sizeof(Point), TypeKind::Struct);
    EXPECT_THROW(types.RegisterDescriptor(&impostor), CannotResolveTypeError);
    EXPECT_EQ(types.Resolve("ArborTest::Point"), TypeResolver<Point>::Get());
    EXPECT_EQ(types.FindByTypeInfo(typeid(void)), nullptr);
}

TEST(TypeRegistryTest, AliasCannotShadowAnotherQualifiedName)
{
    TypeRegistry types;
    types.Register<Point>("ArborTest::Address");
    try
    {
        types.Register<Address>();
        FAIL() << "expected CannotResolveTypeError";
    }
    catch (const CannotResolveTypeError& e)
    {
        ASSERT_NE(e.Get("bound-type"), nullptr);
        EXPECT_EQ(*e.Get("bound-type"), "ArborTest::Point");
    }

    // The failed registration left nothing behind
    EXPECT_EQ(types.FindByTypeInfo(typeid(Address)), nullptr);
    EXPECT_EQ(types.Resolve(types.NameOf(TypeResolver<Point>::Get())), TypeResolver<Point>::Get());

    EXPECT_THROW(types.Register<Address>("ArborTest::Point"), CannotResolveTypeError);
    EXPECT_EQ(types.Resolve("ArborTest::Point"), TypeResolver<Point>::Get());
}

TEST(FieldIntrospectorTest, RootFirstDeclarationOrder)
{
    FieldIntrospector introspector;
    EXPECT_EQ(NamesOf(introspector.FieldsFor(TypeResolver<Circle>::Get())),
        (std::vector<std::string>{ "label", "radius" }));
    EXPECT_EQ(NamesOf(introspector.FieldsFor(TypeResolver<DerivedRecord>::Get())),
        (std::vector<std::string>{ "id", "id", "note" }));
}

TEST(FieldIntrospectorTest, OrderIsStableAcrossCalls)
{
    FieldIntrospector introspector;
    const auto& first = introspector.FieldsFor(TypeResolver<Person>::Get());
    const auto& second = introspector.FieldsFor(TypeResolver<Person>::Get());
    EXPECT_EQ(&first, &second);

    FieldIntrospector other;
    EXPECT_EQ(NamesOf(first), NamesOf(other.FieldsFor(TypeResolver<Person>::Get())));
    EXPECT_EQ(first.size(), 11u);
}

TEST(FieldIntrospectorTest, SkipsTransientAndStaticFields)
{
    FieldIntrospector introspector;
    EXPECT_EQ(NamesOf(introspector.FieldsFor(TypeResolver<Token>::Get())),
        (std::vector<std::string>{ "m_value", "m_issuer" }));
    EXPECT_TRUE(introspector.FieldsFor(TypeResolver<int>::Get()).empty());
}

TEST(FieldIntrospectorTest, VisitReportsDeclaringTypes)
{
    FieldIntrospector introspector;
    DerivedRecord record;
    record.BaseRecord::id = 1;
    record.id = 2;
    record.note = "n";

    std::vector<std::pair<std::string, const TypeDescriptor*>> seen;
    std::vector<int> ids;
    introspector.Visit(ObjectRef::Of(record), [&](const std::string& name, const TypeDescriptor* declared,
        const TypeDescriptor* declaring, const void* value) {
        seen.emplace_back(name, declaring);
        if (name == "id")
        {
            EXPECT_EQ(declared, TypeResolver<int>::Get());
            ids.push_back(*static_cast<const int*>(value));
        }
    });

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].second, TypeResolver<BaseRecord>::Get());
    EXPECT_EQ(seen[1].second, TypeResolver<DerivedRecord>::Get());
    EXPECT_EQ(ids, (std::vector<int>{ 1, 2 }));
}

TEST(FieldIntrospectorTest, ShadowedFieldLookup)
{
    FieldIntrospector introspector;
    const TypeDescriptor* derived = TypeResolver<DerivedRecord>::Get();
    const TypeDescriptor* base = TypeResolver<BaseRecord>::Get();

    const FieldDescriptor* visible = introspector.FieldOrNull(derived, "id", nullptr);
    ASSERT_NE(visible, nullptr);
    EXPECT_EQ(visible->GetDeclaringType(), derived);
    EXPECT_TRUE(introspector.IsShadowed(derived, *visible));

    const FieldDescriptor* hidden = introspector.FieldOrNull(derived, "id", base);
    ASSERT_NE(hidden, nullptr);
    EXPECT_EQ(hidden->GetDeclaringType(), base);

    EXPECT_EQ(introspector.FieldOrNull(derived, "missing", nullptr), nullptr);
    EXPECT_THROW(introspector.GetFieldType(derived, "missing", nullptr), ObjectAccessError);
}

TEST(FieldIntrospectorTest, WriteFieldTargetsDeclaration)
{
    FieldIntrospector introspector;
    const TypeDescriptor* derived = TypeResolver<DerivedRecord>::Get();
    DerivedRecord record;

    introspector.WriteField(&record, derived, "id", Instance::Make<int>(7), TypeResolver<BaseRecord>::Get());
    introspector.WriteField(&record, derived, "id", Instance::Make<int>(9), nullptr);
    EXPECT_EQ(record.BaseRecord::id, 7);
    EXPECT_EQ(record.id, 9);
}

TEST(FieldIntrospectorTest, WriteFieldErrors)
{
    FieldIntrospector introspector;
    const TypeDescriptor* point = TypeResolver<Point>::Get();
    Point p;

    EXPECT_THROW(introspector.WriteField(&p, point, "z", Instance::Make<int>(1), nullptr), ObjectAccessError);
    EXPECT_THROW(introspector.WriteField(&p, point, "x", Instance::Make<long>(1), nullptr), ObjectAccessError);
    EXPECT_THROW(introspector.WriteField(&p, point, "x", Instance(), nullptr), ObjectAccessError);

    try
    {
        introspector.WriteField(&p, point, "x", Instance::Make<std::string>("1"), nullptr);
        FAIL() << "expected ObjectAccessError";
    }
    catch (const ObjectAccessError& e)
    {
        ASSERT_NE(e.Get("field"), nullptr);
        EXPECT_EQ(*e.Get("field"), "x");
        ASSERT_NE(e.Get("value-type"), nullptr);
        EXPECT_EQ(*e.Get("value-type"), "std::string");
    }
}

TEST(FieldIntrospectorTest, FinalFieldWritesFollowSetting)
{
    FieldIntrospector introspector;
    const TypeDescriptor* type = TypeResolver<Token>::Get();
    Token token = Token::Issue("abc", "alice");

    introspector.WriteField(&token, type, "m_issuer", Instance::Make<std::string>("bob"), nullptr);
    EXPECT_EQ(token.Issuer(), "bob");

    introspector.SetAllowFinalFieldWrites(false);
    EXPECT_THROW(introspector.WriteField(&token, type, "m_issuer", Instance::Make<std::string>("carol"), nullptr), ObjectAccessError);
    EXPECT_EQ(token.Issuer(), "bob");
    // Non-final fields stay writable
    introspector.WriteField(&token, type, "m_value", Instance::Make<std::string>("xyz"), nullptr);
    EXPECT_EQ(token.Value(), "xyz");
}

TEST(FieldKeySorterTest, SortableOrder)
{
    auto sorter = std::make_shared<SortableFieldKeySorter>();
    sorter->RegisterFieldOrder<Point>({ "y", "x" });
    FieldIntrospector introspector(sorter);

    EXPECT_EQ(NamesOf(introspector.FieldsFor(TypeResolver<Point>::Get())), (std::vector<std::string>{ "y", "x" }));
    // Types without an explicit order keep the default
    EXPECT_EQ(NamesOf(introspector.FieldsFor(TypeResolver<Address>::Get())), (std::vector<std::string>{ "street", "city" }));
}

TEST(FieldKeySorterTest, IncompleteOrderIsRejected)
{
    auto sorter = std::make_shared<SortableFieldKeySorter>();
    sorter->RegisterFieldOrder<Point>({ "x" });
    sorter->RegisterFieldOrder<Address>({ "street", "zip" });
    FieldIntrospector introspector(sorter);

    EXPECT_THROW(introspector.FieldsFor(TypeResolver<Point>::Get()), ObjectAccessError);
    EXPECT_THROW(introspector.FieldsFor(TypeResolver<Address>::Get()), ObjectAccessError);
}
