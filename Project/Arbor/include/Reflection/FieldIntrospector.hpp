#pragma once
#include "Reflection/ReflectionBase.hpp"

namespace Arbor
{
    // Orders the persistent fields of one type. Implementations must be deterministic.
    class ARBOR_API FieldKeySorter
    {
    public:
        virtual ~FieldKeySorter() = default;
        virtual std::vector<const FieldDescriptor*> Sort(const TypeDescriptor* type, std::vector<const FieldDescriptor*> fields) const = 0;
    };

    // Keeps the default order: root ancestor first, then declaration order.
    class ARBOR_API ImmutableFieldKeySorter : public FieldKeySorter
    {
    public:
        std::vector<const FieldDescriptor*> Sort(const TypeDescriptor* type, std::vector<const FieldDescriptor*> fields) const override;
    };

    // Explicit per-type field order. Types without a registered order keep the default order.
    class ARBOR_API SortableFieldKeySorter : public FieldKeySorter
    {
    public:
        template <typename T>
        void RegisterFieldOrder(const std::vector<std::string>& names) { RegisterFieldOrder(TypeResolver<T>::Get(), names); }
        void RegisterFieldOrder(const TypeDescriptor* type, const std::vector<std::string>& names);

        // Throws ObjectAccessError when the registered order does not name every field exactly.
        std::vector<const FieldDescriptor*> Sort(const TypeDescriptor* type, std::vector<const FieldDescriptor*> fields) const override;

    private:
        std::unordered_map<const TypeDescriptor*, std::vector<std::string>> m_orders;
    };

    class ARBOR_API FieldIntrospector
    {
    public:
        using Visitor = std::function<void(const std::string& name, const TypeDescriptor* declaredType,
            const TypeDescriptor* declaringType, const void* value)>;

        explicit FieldIntrospector(std::shared_ptr<FieldKeySorter> sorter = nullptr);

        // Persistent fields across the ancestor chain, computed once per type.
        // Non-struct types have no fields.
        const std::vector<const FieldDescriptor*>& FieldsFor(const TypeDescriptor* type) const;

        void Visit(ObjectRef object, const Visitor& visitor) const;

        // Moves `value` into the named field of `object` (an object of exactly `type`).
        // A null declaringType selects the most-derived declaration.
        void WriteField(void* object, const TypeDescriptor* type, const std::string& name,
            const Instance& value, const TypeDescriptor* declaringType) const;

        const FieldDescriptor* FieldOrNull(const TypeDescriptor* type, const std::string& name, const TypeDescriptor* declaringType) const;
        // Throws ObjectAccessError when the field does not exist
        const TypeDescriptor* GetFieldType(const TypeDescriptor* type, const std::string& name, const TypeDescriptor* declaringType) const;
        // True when another persistent field of the same name exists in the chain
        bool IsShadowed(const TypeDescriptor* type, const FieldDescriptor& field) const;

        // Address of `field` inside `object`, an object of `type`
        void* FieldAddress(void* object, const TypeDescriptor* type, const FieldDescriptor& field) const;

        void SetAllowFinalFieldWrites(bool allow) { m_allowFinalFieldWrites = allow; }
        bool GetAllowFinalFieldWrites() const { return m_allowFinalFieldWrites; }

    private:
        std::shared_ptr<FieldKeySorter> m_sorter;
        bool m_allowFinalFieldWrites = true;

        mutable std::mutex m_mutex;
        mutable std::unordered_map<const TypeDescriptor*, std::vector<const FieldDescriptor*>> m_cache;
    };
}
