#include "pch.h"
#include "Serialization/Serializer.hpp"
#include "Serialization/Diagnostics.hpp"
#include "Serialization/RecordJson.hpp"
#include "Reflection/SchemaRegistry.hpp"
#include "Hierarchy/IObjectModel.hpp"
#include "SerialError.hpp"
#include "Logging.hpp"

namespace Serial {

    struct InstanceSerializer::SerializeContext {
        struct Node {
            ObjectHandle object;
            SerializedRecord record;
            std::vector<size_t> children;
        };

        // arena[id - 1]
        std::vector<Node> arena;
        std::unordered_map<ObjectHandle, std::int64_t> ids;
        Diagnostics* diagnostics = nullptr;
    };

    struct InstanceSerializer::DeserializeContext {
        struct Node {
            ObjectHandle object;
            const SerializedRecord* record;
        };

        std::vector<Node> arena;
        std::unordered_map<std::int64_t, size_t> byId;
        Diagnostics* diagnostics = nullptr;
    };

    InstanceSerializer::InstanceSerializer(SchemaRegistry& registry, IObjectModel& model)
        : registry(registry), model(model)
    {
    }

    // ============ SERIALIZE ============

    std::optional<SerializedRecord> InstanceSerializer::SerializeObject(ObjectHandle object, Diagnostics* diagnostics)
    {
        const std::string className = model.GetClassName(object);
        if (!registry.IsInstantiable(className)) {
            Diagnostics::Report(diagnostics, DiagnosticKind::NotInstantiable, className, "", "object and its subtree not serialized");
            return std::nullopt;
        }

        try {
            registry.ResolveDefaults(className, model, diagnostics);
        }
        catch (const HostError& e) {
            Diagnostics::Report(diagnostics, DiagnosticKind::HostFailure, className, "",
                                std::string("defaults could not be resolved: ") + e.what());
            return std::nullopt;
        }

        const ClassSchema* schema = registry.FindClass(className);
        const CodecRegistry& codecs = registry.GetCodecs();

        SerializedRecord record;
        record.type = className;

        for (const auto& [name, spec] : schema->properties) {
            if (spec.isReference) continue;

            Value live;
            try {
                live = model.GetProperty(object, name);
            }
            catch (const HostError& e) {
                Diagnostics::Report(diagnostics, DiagnosticKind::HostFailure, className, name, e.what());
                continue;
            }

            if (live == spec.defaultValue) continue;

            auto encoded = codecs.EncodeValue(spec.typeTag, live, diagnostics, className, name);
            if (encoded) record.properties.emplace(name, std::move(*encoded));
        }

        record.tags = model.GetTags(object);

        for (const auto& [name, value] : model.GetAttributes(object)) {
            EncodedAttribute attr;
            attr.typeTag = TypeOf(value);
            auto encoded = codecs.EncodeValue(attr.typeTag, value, diagnostics, className, name);
            if (!encoded) continue;
            attr.value = std::move(*encoded);
            record.attributes.emplace(name, std::move(attr));
        }

        return record;
    }

    std::optional<size_t> InstanceSerializer::SerializeRecursive(ObjectHandle object, SerializeContext& ctx)
    {
        auto record = SerializeObject(object, ctx.diagnostics);
        if (!record) return std::nullopt;

        const size_t index = ctx.arena.size();
        record->id = static_cast<std::int64_t>(index + 1);
        ctx.ids.emplace(object, record->id);
        ctx.arena.push_back({ object, std::move(*record), {} });

        // Ids continue through each subtree before moving on to the next sibling
        for (ObjectHandle child : model.GetChildren(object)) {
            auto childIndex = SerializeRecursive(child, ctx);
            if (childIndex) ctx.arena[index].children.push_back(*childIndex);
        }
        return index;
    }

    void InstanceSerializer::SerializeReferences(SerializeContext& ctx)
    {
        for (auto& node : ctx.arena) {
            const ClassSchema* schema = registry.FindClass(node.record.type);

            for (const auto& [name, spec] : schema->properties) {
                if (!spec.isReference) continue;

                Value live;
                try {
                    live = model.GetProperty(node.object, name);
                }
                catch (const HostError& e) {
                    Diagnostics::Report(ctx.diagnostics, DiagnosticKind::HostFailure, node.record.type, name, e.what());
                    continue;
                }

                auto ref = std::get_if<ObjectRef>(&live);
                if (!ref || ref->handle == NullObject) continue;

                auto target = ctx.ids.find(ref->handle);
                if (target == ctx.ids.end()) {
                    Diagnostics::Report(ctx.diagnostics, DiagnosticKind::DanglingReference, node.record.type, name,
                                        "target is outside the serialized tree");
                    continue;
                }
                node.record.properties[name] = target->second;
            }
        }
    }

    SerializedRecord InstanceSerializer::Assemble(SerializeContext& ctx, size_t index)
    {
        SerializedRecord record = std::move(ctx.arena[index].record);
        const std::vector<size_t> children = ctx.arena[index].children;

        record.children.reserve(children.size());
        for (size_t child : children) record.children.push_back(Assemble(ctx, child));
        return record;
    }

    std::optional<SerializedRecord> InstanceSerializer::SerializeTree(ObjectHandle root, Diagnostics* diagnostics)
    {
        if (!registry.IsBuilt()) throw SchemaNotBuiltError("SerializeTree called before BuildSchema");
        if (root == NullObject || !model.IsValid(root))
            throw MalformedInputError("SerializeTree: " + std::to_string(root) + " is not a valid object");

        SerializeContext ctx;
        ctx.diagnostics = diagnostics;

        auto rootIndex = SerializeRecursive(root, ctx);
        if (!rootIndex) {
            SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[Serializer] Root object of class ", model.GetClassName(root),
                         " cannot be serialized");
            return std::nullopt;
        }

        SerializeReferences(ctx);

        SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[Serializer] Serialized ", ctx.arena.size(), " objects");
        return Assemble(ctx, *rootIndex);
    }

    std::optional<std::string> InstanceSerializer::SerializeTreeToJson(ObjectHandle root, Diagnostics* diagnostics)
    {
        auto record = SerializeTree(root, diagnostics);
        if (!record) return std::nullopt;
        return RecordToJson(*record, registry.GetSettings().prettyJson);
    }

    // ============ DESERIALIZE ============

    std::optional<ObjectHandle> InstanceSerializer::DeserializeObject(const SerializedRecord& record, Diagnostics* diagnostics)
    {
        if (!registry.IsInstantiable(record.type)) {
            Diagnostics::Report(diagnostics, DiagnosticKind::NotInstantiable, record.type, "",
                                "record dropped with " + std::to_string(CountRecords(record) - 1) + " descendants");
            return std::nullopt;
        }

        ObjectHandle object = NullObject;
        try {
            object = model.Create(record.type);
        }
        catch (const HostError& e) {
            Diagnostics::Report(diagnostics, DiagnosticKind::HostFailure, record.type, "", e.what());
            return std::nullopt;
        }

        const CodecRegistry& codecs = registry.GetCodecs();

        for (const auto& [name, encoded] : record.properties) {
            const PropertySpec* spec = registry.FindProperty(record.type, name);
            if (!spec) {
                Diagnostics::Report(diagnostics, DiagnosticKind::MissingSchema, record.type, name, "property not in schema, skipped");
                continue;
            }
            if (spec->isReference) continue;

            auto decoded = codecs.DecodeValue(spec->typeTag, encoded, diagnostics, record.type, name);
            if (!decoded) continue;

            try {
                model.SetProperty(object, name, *decoded);
            }
            catch (const HostError& e) {
                Diagnostics::Report(diagnostics, DiagnosticKind::HostFailure, record.type, name, e.what());
            }
        }

        for (const auto& tag : record.tags) model.AddTag(object, tag);

        for (const auto& [name, attr] : record.attributes) {
            auto decoded = codecs.DecodeValue(attr.typeTag, attr.value, diagnostics, record.type, name);
            if (!decoded) continue;

            try {
                model.SetAttribute(object, name, *decoded);
            }
            catch (const HostError& e) {
                Diagnostics::Report(diagnostics, DiagnosticKind::HostFailure, record.type, name, e.what());
            }
        }

        return object;
    }

    std::optional<ObjectHandle> InstanceSerializer::DeserializeRecursive(const SerializedRecord& record, ObjectHandle parent,
                                                                         DeserializeContext& ctx)
    {
        // A record that fails to materialize takes its whole subtree with it
        auto object = DeserializeObject(record, ctx.diagnostics);
        if (!object) return std::nullopt;

        const size_t index = ctx.arena.size();
        ctx.arena.push_back({ *object, &record });
        if (!ctx.byId.emplace(record.id, index).second) {
            Diagnostics::Report(ctx.diagnostics, DiagnosticKind::DuplicateId, record.type, "",
                                "id " + std::to_string(record.id) + " already used; references to it keep the first object");
        }

        if (parent != NullObject) model.SetParent(*object, parent);

        for (const auto& child : record.children) DeserializeRecursive(child, *object, ctx);
        return object;
    }

    void InstanceSerializer::DeserializeReferences(DeserializeContext& ctx)
    {
        for (const auto& node : ctx.arena) {
            const SerializedRecord& record = *node.record;

            for (const auto& [name, encoded] : record.properties) {
                const PropertySpec* spec = registry.FindProperty(record.type, name);
                if (!spec || !spec->isReference) continue;

                std::optional<std::int64_t> id;
                if (auto i = std::get_if<std::int64_t>(&encoded)) id = *i;
                else if (auto d = std::get_if<double>(&encoded)) id = ToExactInt64(*d);

                if (!id) {
                    Diagnostics::Report(ctx.diagnostics, DiagnosticKind::DecodeFailure, record.type, name,
                                        "reference is not an id: " + ToString(encoded));
                    continue;
                }

                auto target = ctx.byId.find(*id);
                if (target == ctx.byId.end()) {
                    Diagnostics::Report(ctx.diagnostics, DiagnosticKind::DanglingReference, record.type, name,
                                        "no object with id " + std::to_string(*id));
                    continue;
                }

                try {
                    model.SetProperty(node.object, name, ObjectRef{ ctx.arena[target->second].object });
                }
                catch (const HostError& e) {
                    Diagnostics::Report(ctx.diagnostics, DiagnosticKind::HostFailure, record.type, name, e.what());
                }
            }
        }
    }

    std::optional<ObjectHandle> InstanceSerializer::DeserializeTree(const SerializedRecord& record, ObjectHandle parent,
                                                                    Diagnostics* diagnostics)
    {
        if (!registry.IsBuilt()) throw SchemaNotBuiltError("DeserializeTree called before BuildSchema");
        if (record.type.empty()) throw MalformedInputError("DeserializeTree: record has no Type");
        if (parent != NullObject && !model.IsValid(parent))
            throw MalformedInputError("DeserializeTree: parent " + std::to_string(parent) + " is not a valid object");

        DeserializeContext ctx;
        ctx.diagnostics = diagnostics;

        auto root = DeserializeRecursive(record, NullObject, ctx);
        if (!root) {
            SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[Serializer] Root record of class ", record.type, " cannot be created");
            return std::nullopt;
        }

        DeserializeReferences(ctx);

        if (parent != NullObject) model.SetParent(*root, parent);

        SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[Serializer] Deserialized ", ctx.arena.size(), " objects");
        return root;
    }

    std::optional<ObjectHandle> InstanceSerializer::DeserializeTreeFromJson(const std::string& jsonText, ObjectHandle parent,
                                                                            Diagnostics* diagnostics)
    {
        return DeserializeTree(RecordFromJson(jsonText), parent, diagnostics);
    }

} // namespace Serial
