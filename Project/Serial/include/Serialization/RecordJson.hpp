#pragma once
/*********************************************************************************
* @File         RecordJson.hpp
* @Brief        Wire JSON for SerializedRecord trees:
*                 {"Type": "Part", "Id": 1, "Properties": {...},
*                  "Tags": [...], "Attributes": {"Name": ["typeTag", value]},
*                  "Children": [...]}
*               Tags, Attributes and Children are omitted when empty. Non-finite
*               numbers are written as NaN / Infinity / -Infinity and accepted back.
*               Reading throws MalformedInputError on unparsable text, a missing Type
*               or Id, or any member of the wrong shape.
*********************************************************************************/
#include <optional>
#include <string>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>

#include "Serial.h"
#include "Serialization/SerializedRecord.hpp"

namespace Serial {

    SERIAL_API std::string RecordToJson(const SerializedRecord& record, bool pretty = false);
    SERIAL_API SerializedRecord RecordFromJson(const std::string& jsonText);

    // Returns false (after logging) when the file cannot be written.
    SERIAL_API bool SaveRecordToFile(const std::string& path, const SerializedRecord& record, bool pretty = false);
    // Throws MalformedInputError when the file cannot be read or parsed.
    SERIAL_API SerializedRecord LoadRecordFromFile(const std::string& path);

    // Flags for every JSON document the library writes or reads: NaN and +/-Infinity are allowed.
    constexpr unsigned kJsonWriteFlags = rapidjson::kWriteNanAndInfFlag;
    constexpr unsigned kJsonParseFlags = rapidjson::kParseNanAndInfFlag;

    // Writes json with kJsonWriteFlags. Throws SerialError if the writer rejects a value.
    SERIAL_API std::string JsonToString(const rapidjson::Value& json, bool pretty);

    // Scalar <-> JSON helpers shared with the defaults snapshot.
    SERIAL_API void WriteEncodedValue(const EncodedValue& value, rapidjson::Value& out,
                                      rapidjson::Document::AllocatorType& alloc);
    // std::nullopt for arrays and objects.
    SERIAL_API std::optional<EncodedValue> ReadEncodedValue(const rapidjson::Value& json);

} // namespace Serial
