#include "pch.h"
#include "Reflection/FieldIntrospector.hpp"

namespace Arbor
{
    std::vector<const FieldDescriptor*> ImmutableFieldKeySorter::Sort(const TypeDescriptor*, std::vector<const FieldDescriptor*> fields) const
    {
        return fields;
    }

    void SortableFieldKeySorter::RegisterFieldOrder(const TypeDescriptor* type, const std::vector<std::string>& names)
    {
        m_orders[type] = names;
    }

    std::vector<const FieldDescriptor*> SortableFieldKeySorter::Sort(const TypeDescriptor* type, std::vector<const FieldDescriptor*> fields) const
    {
        auto it = m_orders.find(type);
        if (it == m_orders.end()) return fields;

        std::vector<const FieldDescriptor*> sorted;
        sorted.reserve(fields.size());
        for (const std::string& name : it->second)
        {
            bool found = false;
            for (const FieldDescriptor* field : fields)
            {
                if (name == field->name)
                {
                    sorted.push_back(field);
                    found = true;
                }
            }
            if (!found)
            {
                throw ObjectAccessError("Field order names an unknown field", type->ToString(), name);
            }
        }
        if (sorted.size() != fields.size())
        {
            throw ObjectAccessError("Incomplete list of serialized fields for type", type->ToString());
        }
        return sorted;
    }

    FieldIntrospector::FieldIntrospector(std::shared_ptr<FieldKeySorter> sorter)
        : m_sorter(sorter ? std::move(sorter) : std::make_shared<ImmutableFieldKeySorter>())
    {
    }

    const std::vector<const FieldDescriptor*>& FieldIntrospector::FieldsFor(const TypeDescriptor* type) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto cached = m_cache.find(type);
        if (cached != m_cache.end()) return cached->second;

        std::vector<const TypeDescriptor_Struct*> chain;
        for (const TypeDescriptor* t = type; t; t = t->GetSuperType())
        {
            const auto* s = dynamic_cast<const TypeDescriptor_Struct*>(t);
            if (!s) break;
            chain.push_back(s);
        }

        std::vector<const FieldDescriptor*> fields;
        for (auto it = chain.rbegin(); it != chain.rend(); ++it)
        {
            for (const FieldDescriptor& field : (*it)->GetDeclaredFields())
            {
                if (field.IsPersistent()) fields.push_back(&field);
            }
        }

        fields = m_sorter->Sort(type, std::move(fields));
        return m_cache.emplace(type, std::move(fields)).first->second;
    }

    void* FieldIntrospector::FieldAddress(void* object, const TypeDescriptor* type, const FieldDescriptor& field) const
    {
        void* owner = type->UpcastTo(field.GetDeclaringType(), object);
        if (!owner)
        {
            throw ObjectAccessError("Field does not belong to the object's type", type->ToString(), field.name);
        }
        return field.get_ptr(owner);
    }

    void FieldIntrospector::Visit(ObjectRef object, const Visitor& visitor) const
    {
        if (object.IsNull()) return;
        for (const FieldDescriptor* field : FieldsFor(object.type))
        {
            const void* value = FieldAddress(const_cast<void*>(object.address), object.type, *field);
            visitor(field->name, field->GetType(), field->GetDeclaringType(), value);
        }
    }

    const FieldDescriptor* FieldIntrospector::FieldOrNull(const TypeDescriptor* type, const std::string& name, const TypeDescriptor* declaringType) const
    {
        const auto& fields = FieldsFor(type);
        // Most-derived declaration first
        for (auto it = fields.rbegin(); it != fields.rend(); ++it)
        {
            const FieldDescriptor* field = *it;
            if (name != field->name) continue;
            if (declaringType && field->GetDeclaringType() != declaringType) continue;
            return field;
        }
        return nullptr;
    }

    const TypeDescriptor* FieldIntrospector::GetFieldType(const TypeDescriptor* type, const std::string& name, const TypeDescriptor* declaringType) const
    {
        const FieldDescriptor* field = FieldOrNull(type, name, declaringType);
        if (!field)
        {
            throw ObjectAccessError("No such field", type->ToString(), name);
        }
        return field->GetType();
    }

    bool FieldIntrospector::IsShadowed(const TypeDescriptor* type, const FieldDescriptor& field) const
    {
        size_t count = 0;
        for (const FieldDescriptor* f : FieldsFor(type))
        {
            if (std::strcmp(f->name, field.name) == 0) ++count;
        }
        return count > 1;
    }

    void FieldIntrospector::WriteField(void* object, const TypeDescriptor* type, const std::string& name,
        const Instance& value, const TypeDescriptor* declaringType) const
    {
        const FieldDescriptor* field = FieldOrNull(type, name, declaringType);
        if (!field)
        {
            ObjectAccessError err("No such field", type->ToString(), name);
            if (declaringType) err.Add("declaring-type", declaringType->ToString());
            throw err;
        }
        if (field->Has(FieldModifier::Final) && !m_allowFinalFieldWrites)
        {
            throw ObjectAccessError("Cannot write final field", type->ToString(), name);
        }

        const TypeDescriptor* fieldType = field->GetType();
        if (value.IsNull() || value.Type() != fieldType)
        {
            ObjectAccessError err("Value does not match the field type", type->ToString(), name);
            err.Add("field-type", fieldType->ToString());
            err.Add("value-type", value.IsNull() ? std::string("null") : value.Type()->ToString());
            throw err;
        }
        if (!fieldType->CanMoveAssign())
        {
            ObjectAccessError err("Field type is not assignable", type->ToString(), name);
            err.Add("field-type", fieldType->ToString());
            throw err;
        }

        fieldType->MoveAssign(FieldAddress(object, type, *field), value.Get());
    }
}
