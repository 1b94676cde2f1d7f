#include "pch.h"
#include "Reflection/SchemaRegistry.hpp"
#include "Hierarchy/IObjectModel.hpp"
#include "Serialization/Diagnostics.hpp"
#include "Serialization/RecordJson.hpp"
#include "SerialError.hpp"
#include "Logging.hpp"

namespace Serial {

    namespace {

        const char* const ROOT_SUPERCLASS = "<<<ROOT>>>";

        // Destroys the transient default-capture object on every exit path.
        class TransientObject {
        public:
            TransientObject(IObjectModel& model, ObjectHandle handle) : model(model), handle(handle) {}
            ~TransientObject()
            {
                try {
                    model.Destroy(handle);
                }
                catch (const std::exception& e) {
                    SERIAL_PRINT(SerialLogging::LogLevel::Error, "[SchemaRegistry] Failed to destroy transient object: ", e.what());
                }
            }

            TransientObject(const TransientObject&) = delete;
            TransientObject& operator=(const TransientObject&) = delete;

        private:
            IObjectModel& model;
            ObjectHandle handle;
        };

    } // namespace

    SchemaRegistry::SchemaRegistry(SerialSettings settings)
        : settings(std::move(settings)), codecs(&enums)
    {
    }

    void SchemaRegistry::RequireBuilt(const char* operation) const
    {
        if (!built) throw SchemaNotBuiltError(std::string(operation) + " called before BuildSchema");
    }

    void SchemaRegistry::BuildSchema(const ReflectionDump& dump)
    {
        bool ran = false;
        std::call_once(buildOnce, [&]() {
            ran = true;

            for (const auto& e : dump.enums) {
                for (const auto& item : e.items) enums.AddItem(e.name, item.name, item.value);
            }

            size_t services = 0;
            for (const auto& desc : dump.classes) {
                if (HasTag(desc.tags, settings.serviceClassTag)) {
                    ++services;
                    continue;
                }
                if (!pending.emplace(desc.name, &desc).second)
                    SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[SchemaRegistry] Duplicate class ", desc.name, " in dump, keeping the first");
            }

            for (const auto& desc : dump.classes) {
                std::vector<std::string> resolving;
                ResolveClass(desc.name, resolving);
            }
            pending.clear();

            for (const auto& tag : unknownTypeTags)
                SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[SchemaRegistry] No codec for value type ", tag, "; values pass through");

            built = true;
            SERIAL_PRINT(SerialLogging::LogLevel::Info, "[SchemaRegistry] Built schema: ", classes.size(), " classes, ",
                         services, " services skipped, ", enums.CategoryCount(), " enums");
        });

        if (!ran) SERIAL_LOG_WARN("[SchemaRegistry] BuildSchema called again; keeping the existing schema");
    }

    bool SchemaRegistry::IncludeMember(const MemberDescriptor& member) const
    {
        if (member.memberType != "Property" || member.name.empty()) return false;

        for (const auto& tag : settings.skippedMemberTags) {
            if (HasTag(member.tags, tag)) return false;
        }
        if (member.readSecurity != settings.publicSecurity || member.writeSecurity != settings.publicSecurity) return false;

        return !HasTag(settings.ignoredProperties, member.name);
    }

    ClassSchema SchemaRegistry::BuildClass(const ClassDescriptor& desc)
    {
        ClassSchema schema;
        schema.name = desc.name;
        schema.superclass = desc.superclass == ROOT_SUPERCLASS ? std::string() : desc.superclass;
        schema.instantiable = !HasTag(desc.tags, settings.notCreatableClassTag);

        for (const auto& member : desc.members) {
            if (!IncludeMember(member)) continue;

            PropertySpec spec;
            if (member.valueCategory == "Class") {
                spec.typeTag = "Reference";
                spec.isReference = true;
            }
            else {
                spec.typeTag = member.valueCategory == "Enum" ? std::string("Enum") : member.valueName;
                spec.valueType = CodecRegistry::TypeFromTag(spec.typeTag);
                if (!spec.valueType) unknownTypeTags.insert(spec.typeTag);
            }
            schema.properties.emplace(member.name, std::move(spec));
        }
        return schema;
    }

    void SchemaRegistry::ResolveClass(const std::string& className, std::vector<std::string>& resolving)
    {
        if (classes.count(className)) return;

        auto it = pending.find(className);
        if (it == pending.end()) return;

        const ClassDescriptor& desc = *it->second;
        resolving.push_back(className);

        ClassSchema schema = BuildClass(desc);

        if (!schema.superclass.empty()) {
            if (std::find(resolving.begin(), resolving.end(), schema.superclass) != resolving.end()) {
                SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[SchemaRegistry] Superclass cycle at ", className, " -> ",
                             schema.superclass, "; not inheriting across it");
            }
            else {
                ResolveClass(schema.superclass, resolving);

                auto super = classes.find(schema.superclass);
                if (super != classes.end()) {
                    // Copies, never shared: emplace keeps the local definition on name clashes.
                    for (const auto& [name, spec] : super->second.properties) schema.properties.emplace(name, spec);
                }
                else {
                    SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[SchemaRegistry] Superclass ", schema.superclass,
                                 " of ", className, " is not in the schema");
                }
            }
        }

        resolving.pop_back();
        classes.emplace(className, std::move(schema));
    }

    bool SchemaRegistry::HasClass(const std::string& className) const
    {
        return built && classes.count(className) != 0;
    }

    bool SchemaRegistry::IsInstantiable(const std::string& className) const
    {
        const ClassSchema* schema = FindClass(className);
        return schema && schema->instantiable;
    }

    const ClassSchema* SchemaRegistry::FindClass(const std::string& className) const
    {
        if (!built) return nullptr;
        auto it = classes.find(className);
        return it == classes.end() ? nullptr : &it->second;
    }

    const PropertySpec* SchemaRegistry::FindProperty(const std::string& className, const std::string& property) const
    {
        const ClassSchema* schema = FindClass(className);
        if (!schema) return nullptr;
        auto it = schema->properties.find(property);
        return it == schema->properties.end() ? nullptr : &it->second;
    }

    std::vector<std::string> SchemaRegistry::GetClassNames() const
    {
        std::vector<std::string> names;
        if (!built) return names;

        names.reserve(classes.size());
        for (const auto& entry : classes) names.push_back(entry.first);
        std::sort(names.begin(), names.end());
        return names;
    }

    bool SchemaRegistry::ResolveDefaults(const std::string& className, IObjectModel& model, Diagnostics* diagnostics)
    {
        RequireBuilt("ResolveDefaults");

        auto it = classes.find(className);
        if (it == classes.end() || !it->second.instantiable) return false;

        std::lock_guard<std::mutex> lock(defaultsMutex);
        if (resolved.count(className)) return true;

        ClassSchema& schema = it->second;
        const ObjectHandle handle = model.Create(className);
        {
            TransientObject transient(model, handle);

            for (auto& [name, spec] : schema.properties) {
                // References are always significant and never compared against a default
                if (spec.isReference) continue;

                try {
                    spec.defaultValue = model.GetProperty(handle, name);
                }
                catch (const HostError& e) {
                    spec.defaultValue = Value{};
                    Diagnostics::Report(diagnostics, DiagnosticKind::HostFailure, className, name,
                                        std::string("default could not be read: ") + e.what());
                }
            }
        }

        resolved.insert(className);
        SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[SchemaRegistry] Resolved defaults for ", className,
                     " (", schema.properties.size(), " properties)");
        return true;
    }

    bool SchemaRegistry::HasResolvedDefaults(const std::string& className) const
    {
        std::lock_guard<std::mutex> lock(defaultsMutex);
        return resolved.count(className) != 0;
    }

    std::string SchemaRegistry::ExportDefaults(bool pretty) const
    {
        rapidjson::Document doc;
        doc.SetObject();
        rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

        {
            std::lock_guard<std::mutex> lock(defaultsMutex);
            std::set<std::string> ordered(resolved.begin(), resolved.end());

            for (const auto& className : ordered) {
                const ClassSchema& schema = classes.at(className);

                rapidjson::Value props(rapidjson::kObjectType);
                for (const auto& [name, spec] : schema.properties) {
                    if (spec.isReference) continue;
                    // Composites without a codec cannot be represented; ImportDefaults then leaves the class alone
                    if (!spec.valueType && !ToEncodedScalar(spec.defaultValue)) continue;

                    auto encoded = codecs.EncodeValue(spec.typeTag, spec.defaultValue, nullptr, className, name);
                    if (!encoded) continue;

                    rapidjson::Value value;
                    WriteEncodedValue(*encoded, value, alloc);
                    props.AddMember(rapidjson::Value(name.c_str(), alloc), value, alloc);
                }
                doc.AddMember(rapidjson::Value(className.c_str(), alloc), props, alloc);
            }
        }

        return JsonToString(doc, pretty);
    }

    size_t SchemaRegistry::ImportDefaults(const std::string& jsonText, Diagnostics* diagnostics)
    {
        RequireBuilt("ImportDefaults");

        rapidjson::Document doc;
        doc.Parse<kJsonParseFlags>(jsonText.c_str(), jsonText.size());
        if (doc.HasParseError() || !doc.IsObject())
            throw MalformedInputError("Defaults snapshot is not a JSON object");

        std::lock_guard<std::mutex> lock(defaultsMutex);

        size_t imported = 0;
        for (auto member = doc.MemberBegin(); member != doc.MemberEnd(); ++member) {
            const std::string className(member->name.GetString(), member->name.GetStringLength());

            auto it = classes.find(className);
            if (it == classes.end() || !it->second.instantiable || resolved.count(className)) continue;

            if (!member->value.IsObject()) {
                SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[SchemaRegistry] Defaults for ", className, " are not an object; skipped");
                continue;
            }

            // All or nothing: a class is imported only when every property has a usable snapshot value
            std::map<std::string, Value> values;
            bool complete = true;
            for (const auto& [name, spec] : it->second.properties) {
                if (spec.isReference) continue;

                auto found = member->value.FindMember(name.c_str());
                if (found == member->value.MemberEnd()) {
                    complete = false;
                    break;
                }

                auto encoded = ReadEncodedValue(found->value);
                if (!encoded) {
                    Diagnostics::Report(diagnostics, DiagnosticKind::DecodeFailure, className, name,
                                        "snapshot value is not a JSON scalar");
                    complete = false;
                    break;
                }

                auto decoded = codecs.DecodeValue(spec.typeTag, *encoded, diagnostics, className, name);
                if (!decoded) {
                    complete = false;
                    break;
                }
                values.emplace(name, std::move(*decoded));
            }

            if (!complete) {
                SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[SchemaRegistry] Snapshot for ", className,
                             " is incomplete; defaults will be resolved live");
                continue;
            }

            for (auto& [name, value] : values) it->second.properties.at(name).defaultValue = std::move(value);
            resolved.insert(className);
            ++imported;
        }

        SERIAL_PRINT(SerialLogging::LogLevel::Info, "[SchemaRegistry] Imported defaults for ", imported, " classes");
        return imported;
    }

} // namespace Serial
