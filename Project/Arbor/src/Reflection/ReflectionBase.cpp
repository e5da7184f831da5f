#include "pch.h"
#include "Reflection/ReflectionBase.hpp"

namespace Arbor
{
    Instance::Instance(const TypeDescriptor* type, std::shared_ptr<void> object)
        : m_type(type)
        , m_object(std::move(object))
    {
    }

#pragma region TypeDescriptor
    // -------------------------------
    // TypeDescriptor :: Impl (definition lives here)
    struct TypeDescriptor::Impl
    {
        std::string name;
        size_t size = 0;
        size_t alignment = 1;
        Impl() = default;
        Impl(const std::string& n, size_t s) : name(n), size(s) {}
    };

    TypeDescriptor::TypeDescriptor(const std::string& name_, size_t size_, TypeKind kind_)
        : pImpl(new Impl(name_, size_))
        , kind(kind_)
    {
    }

    TypeDescriptor::~TypeDescriptor()
    {
        delete pImpl;
        pImpl = nullptr;
    }

    const char* TypeDescriptor::GetName() const
    {
        return (pImpl && !pImpl->name.empty()) ? pImpl->name.c_str() : nullptr;
    }

    void TypeDescriptor::SetName(const char* name)
    {
        if (!pImpl) pImpl = new Impl;
        pImpl->name = (name ? name : "");
    }

    size_t TypeDescriptor::GetSize() const
    {
        return pImpl ? pImpl->size : 0;
    }

    void TypeDescriptor::SetSize(size_t s)
    {
        if (!pImpl) pImpl = new Impl;
        pImpl->size = s;
    }

    size_t TypeDescriptor::GetAlignment() const
    {
        return pImpl ? pImpl->alignment : 1;
    }

    void TypeDescriptor::SetAlignment(size_t a)
    {
        if (!pImpl) pImpl = new Impl;
        pImpl->alignment = a;
    }

    bool TypeDescriptor::IsA(const TypeDescriptor* other) const
    {
        for (const TypeDescriptor* t = this; t; t = t->GetSuperType())
        {
            if (t == other) return true;
        }
        return false;
    }

    void* TypeDescriptor::UpcastTo(const TypeDescriptor* target, void* obj) const
    {
        const TypeDescriptor* t = this;
        while (t && obj)
        {
            if (t == target) return obj;
            obj = t->UpcastToSuper(obj);
            t = t->GetSuperType();
        }
        return nullptr;
    }
#pragma endregion

#pragma region Struct
    const TypeDescriptor* FieldDescriptor::GetDeclaringType() const
    {
        return declaring_type;
    }

    TypeDescriptor_Struct::TypeDescriptor_Struct(void (*init)(TypeDescriptor_Struct*))
        : TypeDescriptor("", 0, TypeKind::Struct)
    {
        // call init to allow macros to describe the type and add fields
        if (init) init(this);
    }

    void TypeDescriptor_Struct::AddField(const char* name_, FieldDescriptor::ResolverFn resolver_, void* (*get_ptr)(void*), unsigned modifiers_)
    {
        FieldDescriptor field{};
        field.name = name_;
        field.resolver = resolver_;
        field.declaring_type = this;
        field.modifiers = modifiers_;
        field.declaration_index = fields.size();
        field.get_ptr = get_ptr;
        fields.push_back(field);
    }

    const TypeDescriptor* TypeDescriptor_Struct::GetSuperType() const
    {
        return super_resolver ? super_resolver() : nullptr;
    }

    void* TypeDescriptor_Struct::UpcastToSuper(void* obj) const
    {
        return (upcast && obj) ? upcast(obj) : nullptr;
    }

    DynamicRef TypeDescriptor_Struct::DynamicTypeOf(const void* obj) const
    {
        if (dynamic_type && obj) return dynamic_type(obj);
        return DynamicRef{ type_info, obj };
    }
#pragma endregion

#pragma region Primitives
    // -------------------------------
    // Scalar descriptors (macro-driven)
#define PRIMITIVE_DESCRIPTOR(TYPE, KIND, PRIMITIVE, BOXED) \
    template <> \
    TypeDescriptor* GetPrimitiveDescriptor<TYPE>() \
    { \
        static TypeDescriptor_Primitive type_desc{ #TYPE, TypeKind::KIND, PrimitiveKind::PRIMITIVE, BOXED, (TYPE*)nullptr }; \
        return &type_desc; \
    }

    PRIMITIVE_DESCRIPTOR(void, Primitive, Void, false)
    PRIMITIVE_DESCRIPTOR(bool, Primitive, Bool, false)
    PRIMITIVE_DESCRIPTOR(char, Primitive, Char, false)
    PRIMITIVE_DESCRIPTOR(signed char, Primitive, SignedChar, false)
    PRIMITIVE_DESCRIPTOR(unsigned char, Primitive, UnsignedChar, false)
    PRIMITIVE_DESCRIPTOR(short, Primitive, Short, false)
    PRIMITIVE_DESCRIPTOR(unsigned short, Primitive, UnsignedShort, false)
    PRIMITIVE_DESCRIPTOR(int, Primitive, Int, false)
    PRIMITIVE_DESCRIPTOR(unsigned int, Primitive, UnsignedInt, false)
    PRIMITIVE_DESCRIPTOR(long, Primitive, Long, false)
    PRIMITIVE_DESCRIPTOR(unsigned long, Primitive, UnsignedLong, false)
    PRIMITIVE_DESCRIPTOR(long long, Primitive, LongLong, false)
    PRIMITIVE_DESCRIPTOR(unsigned long long, Primitive, UnsignedLongLong, false)
    PRIMITIVE_DESCRIPTOR(float, Primitive, Float, false)
    PRIMITIVE_DESCRIPTOR(double, Primitive, Double, false)
    // std::nullptr_t is the boxed counterpart of void
    PRIMITIVE_DESCRIPTOR(std::nullptr_t, Leaf, Void, true)

#undef PRIMITIVE_DESCRIPTOR

    template <>
    TypeDescriptor* GetPrimitiveDescriptor<std::string>()
    {
        static TypeDescriptor_Primitive type_desc{ "std::string", TypeKind::String, PrimitiveKind::None, false, (std::string*)nullptr };
        return &type_desc;
    }

    template <>
    TypeDescriptor* GetPrimitiveDescriptor<TimePoint>()
    {
        static TypeDescriptor_Primitive type_desc{ "std::chrono::system_clock::time_point", TypeKind::Leaf, PrimitiveKind::None, false, (TimePoint*)nullptr };
        return &type_desc;
    }
#pragma endregion
}
