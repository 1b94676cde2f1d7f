#pragma once
/*********************************************************************************
* @File         SchemaRegistry.hpp
* @Brief        Per-class property schemas derived from a reflection dump, plus the
*               lazily resolved default value of every property.
*                  - BuildSchema runs once per registry (later calls are logged no-ops).
*                    Service classes are skipped, NotCreatable classes are kept for
*                    inheritance but are not instantiable, superclasses are resolved
*                    recursively so dump order does not matter.
*                  - ResolveDefaults creates one transient object per class through the
*                    host, reads every property and destroys it again. Resolution is
*                    monotonic: a class's defaults are written at most once.
*                  - ExportDefaults / ImportDefaults snapshot resolved defaults as JSON so
*                    a later process can skip the transient instantiations.
*               Schema building and default resolution are guarded; everything else is
*               read-only after BuildSchema.
*********************************************************************************/
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Serial.h"
#include "Values/Value.hpp"
#include "Codec/ValueCodec.hpp"
#include "Reflection/EnumCatalog.hpp"
#include "Reflection/ReflectionDump.hpp"
#include "Settings/SerialSettings.hpp"

namespace Serial {

    class IObjectModel;
    class Diagnostics;

    struct PropertySpec {
        std::string typeTag;                  // "Reference", "Enum" or the value type's own name
        std::optional<ValueType> valueType;   // unset for references and tags without a codec
        bool isReference = false;
        Value defaultValue;                   // valid once the owning class is resolved
    };

    struct ClassSchema {
        std::string name;
        std::string superclass;
        bool instantiable = false;
        std::map<std::string, PropertySpec> properties;
    };

    class SERIAL_API SchemaRegistry {
    public:
        explicit SchemaRegistry(SerialSettings settings = SerialSettings{});

        SchemaRegistry(const SchemaRegistry&) = delete;
        SchemaRegistry& operator=(const SchemaRegistry&) = delete;

        void BuildSchema(const ReflectionDump& dump);
        bool IsBuilt() const { return built; }

        bool HasClass(const std::string& className) const;
        bool IsInstantiable(const std::string& className) const;
        const ClassSchema* FindClass(const std::string& className) const;
        const PropertySpec* FindProperty(const std::string& className, const std::string& property) const;
        std::vector<std::string> GetClassNames() const;

        // Value type names seen while building that have no codec.
        const std::set<std::string>& GetUnknownTypeTags() const { return unknownTypeTags; }

        const EnumCatalog& GetEnumCatalog() const { return enums; }
        const CodecRegistry& GetCodecs() const { return codecs; }
        const SerialSettings& GetSettings() const { return settings; }

        /**
         * @brief Captures the default value of every property of className
         * @return true when defaults are available (already or newly resolved), false for
         *         classes that are unknown or not instantiable
         * @throws SchemaNotBuiltError before BuildSchema; HostError when the host cannot
         *         create the transient object
         */
        bool ResolveDefaults(const std::string& className, IObjectModel& model, Diagnostics* diagnostics = nullptr);
        bool HasResolvedDefaults(const std::string& className) const;

        // JSON object {className: {property: encodedValue}} for every resolved class.
        std::string ExportDefaults(bool pretty = false) const;

        // Marks classes from an ExportDefaults snapshot as resolved. Classes that are already
        // resolved, unknown, or missing a property in the snapshot are left alone.
        // Returns the number of classes imported.
        // Throws MalformedInputError when the text is not a JSON object.
        size_t ImportDefaults(const std::string& jsonText, Diagnostics* diagnostics = nullptr);

    private:
        void RequireBuilt(const char* operation) const;

        ClassSchema BuildClass(const ClassDescriptor& desc);
        void ResolveClass(const std::string& className, std::vector<std::string>& resolving);
        bool IncludeMember(const MemberDescriptor& member) const;

        SerialSettings settings;
        EnumCatalog enums;
        CodecRegistry codecs;

        std::once_flag buildOnce;
        std::atomic<bool> built{ false };

        std::unordered_map<std::string, ClassSchema> classes;
        std::set<std::string> unknownTypeTags;

        // Build-time scratch
        std::unordered_map<std::string, const ClassDescriptor*> pending;

        mutable std::mutex defaultsMutex;
        std::unordered_set<std::string> resolved;
    };

} // namespace Serial
