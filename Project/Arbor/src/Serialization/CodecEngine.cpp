#include "pch.h"
#include "Serialization/CodecEngine.hpp"

#include "Converters/ReflectionConverter.hpp"
#include "IO/Path/PathTracker.hpp"
#include "IO/Path/PathTrackingReader.hpp"
#include "IO/Path/PathTrackingWriter.hpp"
#include "IO/TreeReader.hpp"
#include "IO/TreeWriter.hpp"

namespace Arbor
{
    namespace
    {
        class DepthGuard
        {
        public:
            DepthGuard(int& depth, int maxDepth)
                : m_depth(depth)
            {
                if (++m_depth > maxDepth)
                {
                    --m_depth;
                    ConversionError err("Maximum nesting depth exceeded");
                    err.Add("max-depth", std::to_string(maxDepth));
                    throw err;
                }
            }
            ~DepthGuard() { --m_depth; }

            DepthGuard(const DepthGuard&) = delete;
            DepthGuard& operator=(const DepthGuard&) = delete;

        private:
            int& m_depth;
        };

        const TypeDescriptor_Wrapper* AsWrapper(const TypeDescriptor* type)
        {
            return dynamic_cast<const TypeDescriptor_Wrapper*>(type);
        }

        // Descriptor of the runtime type `info`, given the statically known type
        const TypeDescriptor* RuntimeType(const TypeRegistry& types, const std::type_info& info, const TypeDescriptor* declared)
        {
            if (info == declared->GetTypeInfo()) return declared;
            const TypeDescriptor* type = types.FindByTypeInfo(info);
            if (!type)
            {
                CannotResolveTypeError err(info.name());
                err.Add("declared-type", declared->ToString());
                throw err;
            }
            return type;
        }

        // Concrete value behind any wrappers; null address when a wrapper is empty.
        // `declared` receives the innermost statically known type.
        ObjectRef ResolveConcrete(const TypeRegistry& types, ObjectRef value, const TypeDescriptor*& declared)
        {
            declared = value.type;
            while (const TypeDescriptor_Wrapper* wrapper = AsWrapper(value.type))
            {
                if (value.IsNull()) break;
                DynamicRef inner = wrapper->unwrap(value.address);
                declared = wrapper->GetItemType();
                if (!inner.address) return ObjectRef{ declared, nullptr };
                value = ObjectRef{ RuntimeType(types, *inner.type, declared), inner.address };
            }
            if (value.IsNull()) return value;

            DynamicRef dynamic = value.type->DynamicTypeOf(value.address);
            if (*dynamic.type != value.type->GetTypeInfo())
            {
                value = ObjectRef{ RuntimeType(types, *dynamic.type, value.type), dynamic.address };
            }
            return value;
        }

        class MarshalSession : public MarshallingContext
        {
        public:
            MarshalSession(const CodecConfig& config, HierarchicalStreamWriter& writer, const PathTracker& tracker)
                : m_config(config), m_writer(writer), m_tracker(tracker) {}

            void ConvertAnother(ObjectRef value, const TypeDescriptor* expectedType) override
            {
                DepthGuard guard(m_depth, m_config.settings.maxDepth);

                const TypeDescriptor* declared = nullptr;
                ObjectRef concrete = ResolveConcrete(*m_config.types, value, declared);
                if (concrete.IsNull())
                {
                    m_writer.AddAttribute(Attributes::Null, "true");
                    return;
                }

                // Wrappers are transparent: compare against the innermost declared type
                const TypeDescriptor* expected = AsWrapper(expectedType) ? declared : expectedType;
                if (concrete.type != expected)
                {
                    m_writer.AddAttribute(Attributes::Class, m_config.types->NameOf(concrete.type));
                }

                m_config.converters->Lookup(concrete.type).Marshal(concrete, m_writer, *this);
            }

            size_t OpenNodes() const override { return m_tracker.Depth(); }

            const TypeRegistry& Types() const override { return *m_config.types; }
            const FieldIntrospector& Introspector() const override { return *m_config.introspector; }
            const CodecSettings& Settings() const override { return m_config.settings; }

        private:
            const CodecConfig& m_config;
            HierarchicalStreamWriter& m_writer;
            const PathTracker& m_tracker;
            int m_depth = 0;
        };

        class UnmarshalSession : public UnmarshallingContext
        {
        public:
            UnmarshalSession(const CodecConfig& config, HierarchicalStreamReader& reader, const PathTracker& tracker)
                : m_config(config), m_reader(reader), m_tracker(tracker) {}

            Instance ConvertAnother(const TypeDescriptor* expectedType, const std::string& fieldName) override
            {
                return Decode(expectedType, fieldName, nullptr);
            }

            // `hint` stands in for a missing class attribute (the root node name)
            Instance Decode(const TypeDescriptor* expectedType, const std::string& fieldName, const TypeDescriptor* hint)
            {
                DepthGuard guard(m_depth, m_config.settings.maxDepth);

                const TypeDescriptor_Wrapper* wrapper = AsWrapper(expectedType);
                auto nullMarker = m_reader.GetAttribute(Attributes::Null);
                if (nullMarker && *nullMarker == "true")
                {
                    if (!wrapper)
                    {
                        ConversionError err("Null value for a non-nullable type");
                        err.Add("type", expectedType->ToString());
                        throw err;
                    }
                    return Instance(wrapper, wrapper->make_null());
                }

                if (!wrapper)
                {
                    return DecodeConcrete(expectedType, fieldName, hint, false);
                }

                m_config.permissions->Check(wrapper);
                const TypeDescriptor* item = wrapper->GetItemType();
                Instance inner = AsWrapper(item)
                    ? Decode(item, fieldName, hint)
                    : DecodeConcrete(item, fieldName, hint, wrapper->AcceptsDescendants());

                void* itemPtr = inner.Type()->UpcastTo(item, inner.Get());
                if (!itemPtr)
                {
                    ConversionError err("Decoded value cannot be viewed as the wrapped type");
                    err.Add("type", inner.Type()->ToString());
                    err.Add("expected-type", item->ToString());
                    throw err;
                }
                return Instance(wrapper, wrapper->wrap(inner.Share(), itemPtr));
            }

            const TypeDescriptor* RequiredType() const override
            {
                return m_required.empty() ? nullptr : m_required.back();
            }

            const TypeRegistry& Types() const override { return *m_config.types; }
            const FieldIntrospector& Introspector() const override { return *m_config.introspector; }
            const InstanceBuilder& Builder() const override { return *m_config.builder; }
            const CodecSettings& Settings() const override { return m_config.settings; }
            std::string CurrentPath() const override { return m_tracker.GetPath(); }

        private:
            Instance DecodeConcrete(const TypeDescriptor* expected, const std::string& fieldName,
                const TypeDescriptor* hint, bool allowDescendants)
            {
                const TypeDescriptor* concrete = expected;
                if (auto className = m_reader.GetAttribute(Attributes::Class))
                {
                    concrete = m_config.types->ResolveOrThrow(*className);
                }
                else if (hint)
                {
                    concrete = hint;
                }

                if (concrete != expected)
                {
                    if (!concrete->IsA(expected))
                    {
                        ConversionError err("Type is not assignable to the expected type");
                        err.Add("type", concrete->ToString());
                        err.Add("expected-type", expected->ToString());
                        throw err;
                    }
                    if (!allowDescendants)
                    {
                        ConversionError err("A subtype can only be decoded through a std::shared_ptr");
                        err.Add("type", concrete->ToString());
                        err.Add("expected-type", expected->ToString());
                        throw err;
                    }
                }

                // Always before anything is constructed
                m_config.permissions->Check(concrete);

                const Converter& converter = m_config.converters->Lookup(concrete);

                m_required.push_back(concrete);
                Instance result;
                try
                {
                    const auto* selfDescribing = converter.Kind() == ConverterKind::SelfDescribing
                        ? dynamic_cast<const SelfDescribingConverter*>(&converter) : nullptr;
                    if (selfDescribing)
                    {
                        result = m_config.builder->NewInstance(concrete);
                        selfDescribing->Consume(concrete, result.Get(), m_reader, fieldName);
                    }
                    else
                    {
                        result = converter.Unmarshal(m_reader, *this);
                    }
                }
                catch (...)
                {
                    m_required.pop_back();
                    throw;
                }
                m_required.pop_back();

                if (result.IsNull() || result.Type() != concrete)
                {
                    ConversionError err("Converter produced a value of the wrong type");
                    err.Add("type", concrete->ToString());
                    err.Add("produced-type", result.Type() ? result.Type()->ToString() : std::string("null"));
                    throw err;
                }
                return result;
            }

            const CodecConfig& m_config;
            HierarchicalStreamReader& m_reader;
            const PathTracker& m_tracker;
            std::vector<const TypeDescriptor*> m_required;
            int m_depth = 0;
        };

        // Innermost non-wrapper type of `type`
        const TypeDescriptor* Unwrapped(const TypeDescriptor* type)
        {
            while (const TypeDescriptor_Wrapper* wrapper = AsWrapper(type)) type = wrapper->GetItemType();
            return type;
        }
    }

    CodecEngine::CodecEngine(CodecConfig config)
        : m_config(std::move(config))
    {
        if (!m_config.types || !m_config.converters || !m_config.permissions || !m_config.introspector || !m_config.builder)
        {
            throw CodecError("Incomplete codec configuration");
        }
        m_config.settings.Clamp();
    }

    void CodecEngine::Marshal(ObjectRef root, HierarchicalStreamWriter& writer) const
    {
        PathTracker tracker;
        PathTrackingWriter tracking(writer, tracker);
        MarshalSession session(m_config, tracking, tracker);

        try
        {
            const TypeDescriptor* declared = nullptr;
            ObjectRef concrete = ResolveConcrete(*m_config.types, root, declared);
            const TypeDescriptor* nameType = concrete.IsNull() ? declared : concrete.type;

            tracking.StartNode(m_config.types->NameOf(nameType));
            session.ConvertAnother(root, root.type);
            tracking.EndNode();
            tracking.Flush();
        }
        catch (CodecError& e)
        {
            e.Add("path", tracker.GetPath());
            throw;
        }
    }

    Instance CodecEngine::Unmarshal(HierarchicalStreamReader& reader, const TypeDescriptor* expectedType) const
    {
        if (!expectedType)
        {
            throw CannotResolveTypeError("null type descriptor");
        }

        PathTracker tracker;
        try
        {
            PathTrackingReader tracking(reader, tracker);
            UnmarshalSession session(m_config, tracking, tracker);

            // A root name that resolves to a compatible type plays the role of a class attribute
            const TypeDescriptor* hint = m_config.types->Resolve(tracking.GetNodeName());
            if (hint && !hint->IsA(Unwrapped(expectedType))) hint = nullptr;

            ARBOR_LOG_TRACE("Unmarshalling " + expectedType->ToString());
            return session.Decode(expectedType, {}, hint);
        }
        catch (CodecError& e)
        {
            e.Add("path", tracker.GetPath());
            throw;
        }
    }

    TreeNode CodecEngine::ToTreeNode(ObjectRef root) const
    {
        TreeWriter writer;
        Marshal(root, writer);
        return writer.TakeRoot();
    }

    Instance CodecEngine::FromTreeNode(const TreeNode& tree, const TypeDescriptor* expectedType) const
    {
        TreeReader reader(tree);
        return Unmarshal(reader, expectedType);
    }
}
