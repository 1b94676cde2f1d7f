#pragma once
/*********************************************************************************
* @File         SerializedRecord.hpp
* @Brief        Transport representation of one object and its subtree.
*               Wire shape (see RecordJson):
*                 {Type, Id, Properties:{name:value}, Tags?:[..],
*                  Attributes?:{name:[typeTag, value]}, Children?:[record..]}
*********************************************************************************/
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "Serial.h"

namespace Serial {

    // Transport-safe value: a JSON scalar. Composites are carried as base64 strings.
    using EncodedValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    struct EncodedAttribute {
        std::string typeTag;
        EncodedValue value;
    };

    struct SerializedRecord {
        std::int64_t id = 0;
        std::string type;
        std::map<std::string, EncodedValue> properties;
        std::vector<std::string> tags;                       // empty == absent
        std::map<std::string, EncodedAttribute> attributes;  // empty == absent
        std::vector<SerializedRecord> children;              // empty == absent
    };

    // Number of records in the tree rooted at record (including it).
    SERIAL_API size_t CountRecords(const SerializedRecord& record);

    SERIAL_API std::string ToString(const EncodedValue& value);

} // namespace Serial
