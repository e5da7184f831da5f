#pragma once
/*
 * Runtime type descriptors for Arbor.
 *
 *  - TypeDescriptor base and concrete descriptors for reflected structs, primitives,
 *    std::string, std::vector, std::map / std::unordered_map, std::optional, std::shared_ptr
 *    and std::chrono::system_clock::time_point.
 *  - TypeResolver<T>::Get() returns the process-wide descriptor of T. Reflected types expose
 *    a static `Reflection` member through ARBOR_REFLECTED; everything else goes through
 *    GetPrimitiveDescriptor<T>() or a container specialization.
 *  - Registration macros (ARBOR_REGISTER_START / ..._FIELD / ..._END) expand inside a static
 *    member function of the reflected type, so the generated accessors and construction hooks
 *    reach non-public members and constructors. The engine uses this to overwrite fields that
 *    application code treats as read-only.
 *
 * Descriptors only describe; encoding lives in the converters.
 */
#include "pch.h"

#include "Logging.hpp"
#include "Serialization/CodecErrors.hpp"

namespace Arbor
{
    class HierarchicalStreamReader;
    class HierarchicalStreamWriter;

    struct TypeDescriptor;
    struct TypeDescriptor_Struct;

    using ByteArray = std::vector<unsigned char>;
    using TimePoint = std::chrono::system_clock::time_point;

    enum class TypeKind
    {
        Primitive,
        String,
        Leaf,
        Struct,
        Sequence,
        Map,
        Optional,
        Reference
    };

    enum class PrimitiveKind
    {
        None,
        Void,
        Bool,
        Char,
        SignedChar,
        UnsignedChar,
        Short,
        UnsignedShort,
        Int,
        UnsignedInt,
        Long,
        UnsignedLong,
        LongLong,
        UnsignedLongLong,
        Float,
        Double
    };

    // Non-owning view of a value being marshalled. A null address stands for a null value.
    struct ObjectRef
    {
        const TypeDescriptor* type = nullptr;
        const void* address = nullptr;

        bool IsNull() const { return address == nullptr; }

        template <typename T>
        static ObjectRef Of(const T& value);
    };

    // Runtime type plus address of the object behind a wrapper (shared_ptr / optional)
    struct DynamicRef
    {
        const std::type_info* type = nullptr;
        const void* address = nullptr;
    };

    // Owning handle to a decoded value
    class ARBOR_API Instance
    {
    public:
        Instance() = default;
        Instance(const TypeDescriptor* type, std::shared_ptr<void> object);

        template <typename T>
        static Instance Make(T value);

        const TypeDescriptor* Type() const { return m_type; }
        void* Get() const { return m_object.get(); }
        bool IsNull() const { return m_object == nullptr; }
        const std::shared_ptr<void>& Share() const { return m_object; }
        ObjectRef Ref() const { return ObjectRef{ m_type, m_object.get() }; }

        // Exact type match required; throws ConversionError otherwise.
        template <typename T>
        T& As() const;

    private:
        const TypeDescriptor* m_type = nullptr;
        std::shared_ptr<void> m_object;
    };

    // ---------- TypeDescriptor (PIMPL) ----------
    struct ARBOR_API TypeDescriptor
    {
        using ConstructFn = std::shared_ptr<void>(*)();
        using MoveAssignFn = void (*)(void* dst, void* src);

        struct Impl;
        Impl* pImpl;

        TypeDescriptor(const std::string& name_, size_t size_, TypeKind kind_);
        virtual ~TypeDescriptor();

        TypeDescriptor(const TypeDescriptor&) = delete;
        TypeDescriptor& operator=(const TypeDescriptor&) = delete;

        const char* GetName() const;
        void SetName(const char* name);
        size_t GetSize() const;
        void SetSize(size_t s);
        size_t GetAlignment() const;
        void SetAlignment(size_t a);
        TypeKind GetKind() const { return kind; }
        const std::type_info& GetTypeInfo() const { return *type_info; }

        PrimitiveKind GetPrimitiveKind() const { return primitive; }
        bool IsPrimitive() const { return kind == TypeKind::Primitive; }
        bool IsBoxed() const { return boxed; }
        bool IsVoid() const { return primitive == PrimitiveKind::Void; }
        bool IsStructurallyConstructible() const { return structurally_constructible; }
        bool HasDefaultConstructor() const { return construct != nullptr; }

        virtual std::string ToString() const { return std::string(GetName() ? GetName() : ""); }

        // Default construction through the registered no-argument constructor.
        std::shared_ptr<void> Construct() const { return construct ? construct() : nullptr; }

        // Moves *src into *dst; both must be objects of exactly this type.
        bool CanMoveAssign() const { return move_assign != nullptr; }
        void MoveAssign(void* dst, void* src) const { move_assign(dst, src); }

        // Ancestry. Only reflected structs have a super type.
        virtual const TypeDescriptor* GetSuperType() const { return nullptr; }
        virtual void* UpcastToSuper(void*) const { return nullptr; }
        bool IsA(const TypeDescriptor* other) const;
        // Converts a pointer to this type into a pointer to `target`; nullptr when unrelated.
        void* UpcastTo(const TypeDescriptor* target, void* obj) const;

        // Most-derived runtime type of obj. Non-polymorphic types report themselves.
        virtual DynamicRef DynamicTypeOf(const void* obj) const { return DynamicRef{ type_info, obj }; }

    protected:
        template <typename T>
        void Bind();

        TypeKind kind;
        PrimitiveKind primitive = PrimitiveKind::None;
        bool boxed = false;
        bool structurally_constructible = false;
        const std::type_info* type_info = &typeid(void);
        ConstructFn construct = nullptr;
        MoveAssignFn move_assign = nullptr;
    };

    template <typename T>
    void TypeDescriptor::Bind()
    {
        type_info = &typeid(T);
        if constexpr (std::is_void_v<T>)
        {
            SetSize(0);
        }
        else
        {
            SetSize(sizeof(T));
            SetAlignment(alignof(T));
            if constexpr (std::is_default_constructible_v<T> && !std::is_abstract_v<T>)
            {
                construct = +[]() -> std::shared_ptr<void> { return std::make_shared<T>(); };
            }
            if constexpr (std::is_move_assignable_v<T> && !std::is_abstract_v<T>)
            {
                move_assign = +[](void* dst, void* src) { *static_cast<T*>(dst) = std::move(*static_cast<T*>(src)); };
            }
        }
    }

    // Forward-declare primitive descriptor getter
    template <typename T>
    ARBOR_API TypeDescriptor* GetPrimitiveDescriptor();

    // DefaultResolver relies on T::Reflection detection
    struct DefaultResolver
    {
        template <typename T> static char func(decltype(&T::Reflection));
        template <typename T> static int func(...);
        template <typename T>
        struct IsReflected { enum { value = (sizeof(func<T>(nullptr)) == sizeof(char)) }; };

        template <typename T, typename std::enable_if<IsReflected<T>::value, int>::type = 0>
        static TypeDescriptor* Get() { return &T::Reflection; }

        template <typename T, typename std::enable_if<!IsReflected<T>::value, int>::type = 0>
        static TypeDescriptor* Get() { return GetPrimitiveDescriptor<T>(); }
    };

    template <typename T>
    struct TypeResolver { static TypeDescriptor* Get() { return DefaultResolver::Get<T>(); } };

    template <typename T>
    ObjectRef ObjectRef::Of(const T& value)
    {
        return ObjectRef{ TypeResolver<std::remove_cv_t<T>>::Get(), &value };
    }

    template <typename T>
    Instance Instance::Make(T value)
    {
        return Instance(TypeResolver<T>::Get(), std::make_shared<T>(std::move(value)));
    }

    template <typename T>
    T& Instance::As() const
    {
        const TypeDescriptor* expected = TypeResolver<T>::Get();
        if (m_type != expected || !m_object)
        {
            ConversionError err("Instance does not hold the requested type");
            err.Add("requested-type", expected->ToString());
            err.Add("actual-type", m_type ? m_type->ToString() : std::string("null"));
            throw err;
        }
        return *static_cast<T*>(m_object.get());
    }

    // -------------------------------------------------------------
    // Scalar descriptors: fundamental kinds, void, std::nullptr_t (the boxed void),
    // std::string and time points.
    struct ARBOR_API TypeDescriptor_Primitive : TypeDescriptor
    {
        template <typename T>
        TypeDescriptor_Primitive(const char* name_, TypeKind kind_, PrimitiveKind primitive_, bool boxed_, T*)
            : TypeDescriptor{ name_, 0, kind_ }
        {
            Bind<T>();
            primitive = primitive_;
            boxed = boxed_;
        }
    };

#define ARBOR_DECLARE_PRIMITIVE(TYPE) \
    template <> ARBOR_API TypeDescriptor* GetPrimitiveDescriptor<TYPE>();

    ARBOR_DECLARE_PRIMITIVE(void)
    ARBOR_DECLARE_PRIMITIVE(bool)
    ARBOR_DECLARE_PRIMITIVE(char)
    ARBOR_DECLARE_PRIMITIVE(signed char)
    ARBOR_DECLARE_PRIMITIVE(unsigned char)
    ARBOR_DECLARE_PRIMITIVE(short)
    ARBOR_DECLARE_PRIMITIVE(unsigned short)
    ARBOR_DECLARE_PRIMITIVE(int)
    ARBOR_DECLARE_PRIMITIVE(unsigned int)
    ARBOR_DECLARE_PRIMITIVE(long)
    ARBOR_DECLARE_PRIMITIVE(unsigned long)
    ARBOR_DECLARE_PRIMITIVE(long long)
    ARBOR_DECLARE_PRIMITIVE(unsigned long long)
    ARBOR_DECLARE_PRIMITIVE(float)
    ARBOR_DECLARE_PRIMITIVE(double)
    ARBOR_DECLARE_PRIMITIVE(std::nullptr_t)
    ARBOR_DECLARE_PRIMITIVE(std::string)
    ARBOR_DECLARE_PRIMITIVE(TimePoint)

#undef ARBOR_DECLARE_PRIMITIVE

    // -------------------------------------------------------------
    // Fields of reflected structs
    enum FieldModifier : unsigned
    {
        None = 0,
        Transient = 1u << 0,
        Static = 1u << 1,
        Final = 1u << 2
    };

    struct ARBOR_API FieldDescriptor
    {
        using ResolverFn = TypeDescriptor * (*)();

        const char* name;
        ResolverFn resolver;
        const TypeDescriptor_Struct* declaring_type;
        unsigned modifiers;
        size_t declaration_index;
        void* (*get_ptr)(void*);

        const TypeDescriptor* GetType() const { return resolver(); }
        const TypeDescriptor* GetDeclaringType() const;
        bool Has(FieldModifier m) const { return (modifiers & m) != 0; }
        bool IsPersistent() const { return !Has(Transient) && !Has(Static); }
    };

    // -------------------------------------------------------------
    // TypeDescriptor for user-defined structs/classes
    struct ARBOR_API TypeDescriptor_Struct : TypeDescriptor
    {
        using SuperResolverFn = TypeDescriptor * (*)();
        using UpcastFn = void* (*)(void*);
        using DynamicTypeFn = DynamicRef(*)(const void*);
        using ReadSelfFn = void (*)(void* obj, HierarchicalStreamReader& reader, const std::string& fieldName);
        using WriteSelfFn = void (*)(const void* obj, HierarchicalStreamWriter& writer);

        // construct by passing an init function (macros will use this)
        TypeDescriptor_Struct(void (*init)(TypeDescriptor_Struct*));
        virtual ~TypeDescriptor_Struct() = default;

        template <typename T>
        void Describe(const char* name_);

        template <typename T, typename Base>
        void SetSuper();

        void AddField(const char* name_, FieldDescriptor::ResolverFn resolver_, void* (*get_ptr)(void*), unsigned modifiers_);
        const std::vector<FieldDescriptor>& GetDeclaredFields() const { return fields; }

        void SetDefaultConstructor(ConstructFn fn) { construct = fn; }
        void SetStructurallyConstructible(bool enabled) { structurally_constructible = enabled; }

        void SetSelfDescribing(ReadSelfFn reader, WriteSelfFn writer) { read_self = reader; write_self = writer; }
        bool IsSelfDescribing() const { return read_self != nullptr && write_self != nullptr; }
        void ReadSelf(void* obj, HierarchicalStreamReader& reader, const std::string& fieldName) const { read_self(obj, reader, fieldName); }
        void WriteSelf(const void* obj, HierarchicalStreamWriter& writer) const { write_self(obj, writer); }

        const TypeDescriptor* GetSuperType() const override;
        void* UpcastToSuper(void* obj) const override;
        DynamicRef DynamicTypeOf(const void* obj) const override;

    private:
        std::vector<FieldDescriptor> fields;
        SuperResolverFn super_resolver = nullptr;
        UpcastFn upcast = nullptr;
        DynamicTypeFn dynamic_type = nullptr;
        ReadSelfFn read_self = nullptr;
        WriteSelfFn write_self = nullptr;
    };

    template <typename T>
    void TypeDescriptor_Struct::Describe(const char* name_)
    {
        SetName(name_);
        Bind<T>();
        if constexpr (std::is_polymorphic_v<T>)
        {
            dynamic_type = +[](const void* obj) -> DynamicRef
            {
                const T* typed = static_cast<const T*>(obj);
                return DynamicRef{ &typeid(*typed), dynamic_cast<const void*>(typed) };
            };
        }
    }

    template <typename T, typename Base>
    void TypeDescriptor_Struct::SetSuper()
    {
        static_assert(std::is_base_of_v<Base, T>, "ARBOR_REGISTER_SUPER: not a base class of the reflected type");
        super_resolver = +[]() -> TypeDescriptor* { return TypeResolver<Base>::Get(); };
        upcast = +[](void* obj) -> void* { return static_cast<Base*>(static_cast<T*>(obj)); };
    }

    // -------------------------------------------------------------
    // std::vector specialization (descriptor)
    struct ARBOR_API TypeDescriptor_StdVector : TypeDescriptor
    {
        using ResolverFn = TypeDescriptor * (*)();

        ResolverFn resolver; // lazily resolves the item descriptor
        size_t(*get_size)(const void*);
        const void* (*get_item)(const void*, size_t);
        void (*append_item)(void*, void*);
        void (*clear)(void*);

        template <typename ItemType>
        TypeDescriptor_StdVector(ItemType*)
            : TypeDescriptor{ "std::vector<>", sizeof(std::vector<ItemType>), TypeKind::Sequence }
            , resolver{ +[]() -> TypeDescriptor* { return TypeResolver<ItemType>::Get(); } }
        {
            static_assert(!std::is_same_v<ItemType, bool>, "std::vector<bool> is not supported");
            Bind<std::vector<ItemType>>();
            get_size = [](const void* vec_ptr) -> size_t {
                const auto& vec = *(const std::vector<ItemType>*) vec_ptr;
                return vec.size();
                };
            get_item = [](const void* vec_ptr, size_t index) -> const void* {
                const auto& vec = *(const std::vector<ItemType>*) vec_ptr;
                return &vec[index];
                };
            append_item = [](void* vec_ptr, void* item_ptr) {
                auto& vec = *(std::vector<ItemType>*) vec_ptr;
                vec.push_back(std::move(*(ItemType*)item_ptr));
                };
            clear = [](void* vec_ptr) {
                ((std::vector<ItemType>*) vec_ptr)->clear();
                };

            SetName((std::string("std::vector<") + resolver()->ToString() + ">").c_str());
        }

        TypeDescriptor* GetItemType() const { return resolver(); }
    };

    template <typename T>
    struct TypeResolver<std::vector<T>>
    {
        static TypeDescriptor* Get()
        {
            static TypeDescriptor_StdVector type_desc{ (T*) nullptr };
            return &type_desc;
        }
    };

    // -------------------------------------------------------------
    // std::map / std::unordered_map specialization
    struct ARBOR_API TypeDescriptor_StdMap : TypeDescriptor
    {
        using ResolverFn = TypeDescriptor * (*)();
        using VisitFn = std::function<void(const void* key, const void* value)>;

        ResolverFn key_resolver;
        ResolverFn value_resolver;
        size_t(*get_size)(const void*);
        void (*for_each)(const void*, const VisitFn&);
        void (*insert)(void*, void*, void*);

        template <typename MapType>
        TypeDescriptor_StdMap(const char* template_name, MapType*)
            : TypeDescriptor{ template_name, sizeof(MapType), TypeKind::Map }
            , key_resolver{ +[]() -> TypeDescriptor* { return TypeResolver<typename MapType::key_type>::Get(); } }
            , value_resolver{ +[]() -> TypeDescriptor* { return TypeResolver<typename MapType::mapped_type>::Get(); } }
        {
            using K = typename MapType::key_type;
            using V = typename MapType::mapped_type;
            Bind<MapType>();
            get_size = [](const void* map_ptr) -> size_t {
                return ((const MapType*) map_ptr)->size();
                };
            for_each = [](const void* map_ptr, const VisitFn& visit) {
                for (const auto& pair : *(const MapType*) map_ptr) visit(&pair.first, &pair.second);
                };
            insert = [](void* map_ptr, void* key_ptr, void* value_ptr) {
                auto& map = *(MapType*) map_ptr;
                map.insert_or_assign(std::move(*(K*) key_ptr), std::move(*(V*) value_ptr));
                };

            SetName((std::string(template_name) + "<" + key_resolver()->ToString() + ", " + value_resolver()->ToString() + ">").c_str());
        }

        TypeDescriptor* GetKeyType() const { return key_resolver(); }
        TypeDescriptor* GetValueType() const { return value_resolver(); }
    };

    template <typename KeyType, typename ValueType>
    struct TypeResolver<std::map<KeyType, ValueType>>
    {
        static TypeDescriptor* Get()
        {
            static TypeDescriptor_StdMap type_desc{ "std::map", (std::map<KeyType, ValueType>*)nullptr };
            return &type_desc;
        }
    };

    template <typename KeyType, typename ValueType>
    struct TypeResolver<std::unordered_map<KeyType, ValueType>>
    {
        static TypeDescriptor* Get()
        {
            static TypeDescriptor_StdMap type_desc{ "std::unordered_map", (std::unordered_map<KeyType, ValueType>*)nullptr };
            return &type_desc;
        }
    };

    // -------------------------------------------------------------
    // Nullable wrappers: std::shared_ptr<T> (polymorphic reference) and std::optional<T>
    // (the boxed counterpart when T is a primitive).
    struct ARBOR_API TypeDescriptor_Wrapper : TypeDescriptor
    {
        using ResolverFn = TypeDescriptor * (*)();

        ResolverFn resolver;
        DynamicRef(*unwrap)(const void*);
        // Builds a wrapper around `item`, an object of the item type (or a descendant) owned by `owner`.
        std::shared_ptr<void>(*wrap)(const std::shared_ptr<void>& owner, void* item);
        std::shared_ptr<void>(*make_null)();

        template <typename ItemType>
        TypeDescriptor_Wrapper(std::shared_ptr<ItemType>*)
            : TypeDescriptor{ "std::shared_ptr<>", sizeof(std::shared_ptr<ItemType>), TypeKind::Reference }
            , resolver{ +[]() -> TypeDescriptor* { return TypeResolver<ItemType>::Get(); } }
        {
            Bind<std::shared_ptr<ItemType>>();
            unwrap = [](const void* obj) -> DynamicRef {
                const auto& sp = *(const std::shared_ptr<ItemType>*) obj;
                if (!sp) return DynamicRef{};
                if constexpr (std::is_polymorphic_v<ItemType>)
                    return DynamicRef{ &typeid(*sp), dynamic_cast<const void*>(sp.get()) };
                else
                    return DynamicRef{ &typeid(ItemType), sp.get() };
                };
            wrap = [](const std::shared_ptr<void>& owner, void* item) -> std::shared_ptr<void> {
                return std::make_shared<std::shared_ptr<ItemType>>(owner, (ItemType*) item);
                };
            make_null = []() -> std::shared_ptr<void> {
                return std::make_shared<std::shared_ptr<ItemType>>();
                };

            SetName((std::string("std::shared_ptr<") + resolver()->ToString() + ">").c_str());
        }

        template <typename ItemType>
        TypeDescriptor_Wrapper(std::optional<ItemType>*)
            : TypeDescriptor{ "std::optional<>", sizeof(std::optional<ItemType>), TypeKind::Optional }
            , resolver{ +[]() -> TypeDescriptor* { return TypeResolver<ItemType>::Get(); } }
        {
            Bind<std::optional<ItemType>>();
            boxed = std::is_arithmetic_v<ItemType>;
            if (boxed) primitive = resolver()->GetPrimitiveKind();
            unwrap = [](const void* obj) -> DynamicRef {
                const auto& opt = *(const std::optional<ItemType>*) obj;
                if (!opt) return DynamicRef{};
                return DynamicRef{ &typeid(ItemType), &*opt };
                };
            wrap = [](const std::shared_ptr<void>&, void* item) -> std::shared_ptr<void> {
                return std::make_shared<std::optional<ItemType>>(std::move(*(ItemType*) item));
                };
            make_null = []() -> std::shared_ptr<void> {
                return std::make_shared<std::optional<ItemType>>();
                };

            SetName((std::string("std::optional<") + resolver()->ToString() + ">").c_str());
        }

        TypeDescriptor* GetItemType() const { return resolver(); }
        // References may hold descendants of the item type; optionals hold exactly the item type.
        bool AcceptsDescendants() const { return GetKind() == TypeKind::Reference; }
    };

    template <typename T>
    struct TypeResolver<std::shared_ptr<T>>
    {
        static TypeDescriptor* Get()
        {
            static TypeDescriptor_Wrapper type_desc{ (std::shared_ptr<T>*) nullptr };
            return &type_desc;
        }
    };

    template <typename T>
    struct TypeResolver<std::optional<T>>
    {
        static TypeDescriptor* Get()
        {
            static TypeDescriptor_Wrapper type_desc{ (std::optional<T>*) nullptr };
            return &type_desc;
        }
    };
}

#pragma region Macros
// Keep macros outside namespace to preserve the registration API shape

#define ARBOR_REFLECTED \
  friend struct Arbor::DefaultResolver; \
  static Arbor::TypeDescriptor_Struct Reflection; \
  static void InitReflection(Arbor::TypeDescriptor_Struct*);

#define ARBOR_REGISTER_START(TYPE) \
  Arbor::TypeDescriptor_Struct TYPE::Reflection{TYPE::InitReflection}; \
  void TYPE::InitReflection(Arbor::TypeDescriptor_Struct* type_desc) \
  { \
    using T = TYPE; \
    type_desc->Describe<T>(#TYPE);

#define ARBOR_REGISTER_SUPER(BASE) \
    type_desc->SetSuper<T, BASE>();

#define ARBOR_REGISTER_FIELD_EX(VARIABLE, MODIFIERS) \
    static_assert(!std::is_const_v<decltype(T::VARIABLE)>, "const members cannot be registered; use ARBOR_REGISTER_FINAL_FIELD"); \
    type_desc->AddField(#VARIABLE, \
      &Arbor::TypeResolver<std::remove_cv_t<decltype(T::VARIABLE)>>::Get, \
      +[](void* obj) -> void* { return &(static_cast<T*>(obj)->VARIABLE); }, \
      MODIFIERS);

#define ARBOR_REGISTER_FIELD(VARIABLE) ARBOR_REGISTER_FIELD_EX(VARIABLE, Arbor::FieldModifier::None)
#define ARBOR_REGISTER_TRANSIENT_FIELD(VARIABLE) ARBOR_REGISTER_FIELD_EX(VARIABLE, Arbor::FieldModifier::Transient)
#define ARBOR_REGISTER_FINAL_FIELD(VARIABLE) ARBOR_REGISTER_FIELD_EX(VARIABLE, Arbor::FieldModifier::Final)

#define ARBOR_REGISTER_STATIC_FIELD(VARIABLE) \
    type_desc->AddField(#VARIABLE, \
      &Arbor::TypeResolver<std::remove_cv_t<decltype(T::VARIABLE)>>::Get, \
      +[](void*) -> void* { return const_cast<void*>(static_cast<const void*>(&T::VARIABLE)); }, \
      Arbor::FieldModifier::Static);

// Registers T's no-argument constructor even when it is not public
#define ARBOR_REGISTER_DEFAULT_CONSTRUCTOR \
    type_desc->SetDefaultConstructor(+[]() -> std::shared_ptr<void> { return std::shared_ptr<T>(new T()); });

// Opt-in: instances may be materialized from a zeroed object image without running a constructor
#define ARBOR_REGISTER_STRUCTURAL \
    static_assert(std::is_trivially_copyable_v<T> && std::is_trivially_destructible_v<T>, \
      "ARBOR_REGISTER_STRUCTURAL requires a trivially copyable, trivially destructible type"); \
    type_desc->SetStructurallyConstructible(true);

// T provides ReadFrom(HierarchicalStreamReader&, const std::string&) and WriteTo(HierarchicalStreamWriter&) const
#define ARBOR_REGISTER_SELF_DESCRIBING \
    type_desc->SetSelfDescribing( \
      +[](void* obj, Arbor::HierarchicalStreamReader& reader, const std::string& fieldName) { static_cast<T*>(obj)->ReadFrom(reader, fieldName); }, \
      +[](const void* obj, Arbor::HierarchicalStreamWriter& writer) { static_cast<const T*>(obj)->WriteTo(writer); });

#define ARBOR_REGISTER_END \
  }
#pragma endregion
