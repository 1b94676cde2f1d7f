#pragma once
/*********************************************************************************
* @File         Serializer.hpp
* @Brief        Tree serializer / deserializer over an IObjectModel.
*               Both directions are two-pass:
*                 1. Walk the tree pre-order into a call-local arena (ids 1..N on the way
*                    out, created objects on the way in). Ordinary properties, tags and
*                    attributes are handled here; reference properties are not.
*                 2. Patch every reference property against the completed arena.
*               References leaving the captured subtree are dropped (DanglingReference).
*               Nothing is rolled back: a partly deserialized tree stays as far as it got.
*********************************************************************************/
#include <optional>
#include <string>

#include "Serial.h"
#include "Values/Value.hpp"
#include "Serialization/SerializedRecord.hpp"

namespace Serial {

    class SchemaRegistry;
    class IObjectModel;
    class Diagnostics;

    class SERIAL_API InstanceSerializer {
    public:
        InstanceSerializer(SchemaRegistry& registry, IObjectModel& model);

        /**
         * @brief Serializes root and every serializable descendant
         * @return std::nullopt when root itself cannot be serialized
         * @throws MalformedInputError for an invalid handle, SchemaNotBuiltError before BuildSchema
         */
        std::optional<SerializedRecord> SerializeTree(ObjectHandle root, Diagnostics* diagnostics = nullptr);

        /**
         * @brief Recreates the tree described by record
         * @param parent Parent for the new root, assigned after references are linked
         * @return The new root, or std::nullopt when the root record's class cannot be created
         * @throws MalformedInputError for a record without Type or an invalid parent,
         *         SchemaNotBuiltError before BuildSchema
         */
        std::optional<ObjectHandle> DeserializeTree(const SerializedRecord& record, ObjectHandle parent = NullObject,
                                                    Diagnostics* diagnostics = nullptr);

        // Wire JSON wrappers; pretty printing follows SerialSettings::prettyJson.
        std::optional<std::string> SerializeTreeToJson(ObjectHandle root, Diagnostics* diagnostics = nullptr);
        std::optional<ObjectHandle> DeserializeTreeFromJson(const std::string& jsonText, ObjectHandle parent = NullObject,
                                                            Diagnostics* diagnostics = nullptr);

    private:
        struct SerializeContext;
        struct DeserializeContext;

        std::optional<SerializedRecord> SerializeObject(ObjectHandle object, Diagnostics* diagnostics);
        std::optional<size_t> SerializeRecursive(ObjectHandle object, SerializeContext& ctx);
        void SerializeReferences(SerializeContext& ctx);
        SerializedRecord Assemble(SerializeContext& ctx, size_t index);

        std::optional<ObjectHandle> DeserializeObject(const SerializedRecord& record, Diagnostics* diagnostics);
        std::optional<ObjectHandle> DeserializeRecursive(const SerializedRecord& record, ObjectHandle parent, DeserializeContext& ctx);
        void DeserializeReferences(DeserializeContext& ctx);

        SchemaRegistry& registry;
        IObjectModel& model;
    };

} // namespace Serial
