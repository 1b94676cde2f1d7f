#pragma once
/*********************************************************************************
* @File         ReflectionDump.hpp
* @Brief        In-memory form of an external reflection dump: every class with its
*               superclass, class tags and member descriptors, plus enum definitions.
*               ParseReflectionDump reads the usual API-dump JSON layout:
*                 { "Classes": [ { "Name", "Superclass", "Tags", "Members": [
*                     { "MemberType", "Name", "Security": {"Read","Write"} | "None",
*                       "ValueType": {"Category","Name"}, "Tags" } ] } ],
*                   "Enums": [ { "Name", "Items": [ { "Name", "Value" } ] } ] }
*               Fetching the dump is the caller's business.
*********************************************************************************/
#include <string>
#include <vector>

#include "Serial.h"

namespace Serial {

    struct MemberDescriptor {
        std::string name;
        std::string memberType = "Property";   // Property, Function, Event, Callback
        std::string readSecurity = "None";
        std::string writeSecurity = "None";
        std::string valueCategory;             // Primitive, DataType, Enum, Class
        std::string valueName;
        std::vector<std::string> tags;
    };

    struct ClassDescriptor {
        std::string name;
        std::string superclass;                 // empty or "<<<ROOT>>>" for the root class
        std::vector<std::string> tags;
        std::vector<MemberDescriptor> members;
    };

    struct EnumItemDescriptor {
        std::string name;
        int value = 0;
    };

    struct EnumDescriptor {
        std::string name;
        std::vector<EnumItemDescriptor> items;
    };

    struct ReflectionDump {
        std::vector<ClassDescriptor> classes;
        std::vector<EnumDescriptor> enums;
    };

    // Throws MalformedInputError when the text is not JSON or has no Classes array.
    SERIAL_API ReflectionDump ParseReflectionDump(const std::string& jsonText);

    // Reads the file and parses it; throws MalformedInputError when it cannot be read.
    SERIAL_API ReflectionDump LoadReflectionDump(const std::string& path);

    SERIAL_API bool HasTag(const std::vector<std::string>& tags, const std::string& tag);

} // namespace Serial
