#include "pch.h"
#include "Reflection/ReflectionDump.hpp"
#include "SerialError.hpp"
#include "Logging.hpp"

namespace Serial {

    namespace {

        std::string ReadString(const rapidjson::Value& obj, const char* key, const std::string& fallback = std::string())
        {
            auto it = obj.FindMember(key);
            if (it == obj.MemberEnd() || !it->value.IsString()) return fallback;
            return std::string(it->value.GetString(), it->value.GetStringLength());
        }

        std::vector<std::string> ReadStringArray(const rapidjson::Value& obj, const char* key)
        {
            std::vector<std::string> out;
            auto it = obj.FindMember(key);
            if (it == obj.MemberEnd() || !it->value.IsArray()) return out;

            for (const auto& item : it->value.GetArray()) {
                // Newer dumps carry structured tags ({"PreferredDescriptorName": ...}); only plain tags matter here.
                if (item.IsString()) out.emplace_back(item.GetString(), item.GetStringLength());
            }
            return out;
        }

        MemberDescriptor ReadMember(const rapidjson::Value& m)
        {
            MemberDescriptor member;
            member.name = ReadString(m, "Name");
            member.memberType = ReadString(m, "MemberType", "Property");
            member.tags = ReadStringArray(m, "Tags");

            auto sec = m.FindMember("Security");
            if (sec != m.MemberEnd()) {
                if (sec->value.IsString()) {
                    member.readSecurity = member.writeSecurity = sec->value.GetString();
                }
                else if (sec->value.IsObject()) {
                    member.readSecurity = ReadString(sec->value, "Read", "None");
                    member.writeSecurity = ReadString(sec->value, "Write", "None");
                }
            }

            auto vt = m.FindMember("ValueType");
            if (vt != m.MemberEnd() && vt->value.IsObject()) {
                member.valueCategory = ReadString(vt->value, "Category");
                member.valueName = ReadString(vt->value, "Name");
            }
            return member;
        }

    } // namespace

    bool HasTag(const std::vector<std::string>& tags, const std::string& tag)
    {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    }

    ReflectionDump ParseReflectionDump(const std::string& jsonText)
    {
        rapidjson::Document doc;
        doc.Parse(jsonText.c_str(), jsonText.size());

        if (doc.HasParseError()) {
            std::ostringstream ss;
            ss << "Reflection dump is not valid JSON (error " << static_cast<int>(doc.GetParseError())
               << " at offset " << doc.GetErrorOffset() << ")";
            throw MalformedInputError(ss.str());
        }
        if (!doc.IsObject() || !doc.HasMember("Classes") || !doc["Classes"].IsArray())
            throw MalformedInputError("Reflection dump has no Classes array");

        ReflectionDump dump;
        for (const auto& c : doc["Classes"].GetArray()) {
            if (!c.IsObject()) continue;

            ClassDescriptor cls;
            cls.name = ReadString(c, "Name");
            if (cls.name.empty()) {
                SERIAL_LOG_WARN("[ReflectionDump] Skipping class entry without a Name");
                continue;
            }
            cls.superclass = ReadString(c, "Superclass");
            cls.tags = ReadStringArray(c, "Tags");

            auto members = c.FindMember("Members");
            if (members != c.MemberEnd() && members->value.IsArray()) {
                for (const auto& m : members->value.GetArray()) {
                    if (m.IsObject()) cls.members.push_back(ReadMember(m));
                }
            }
            dump.classes.push_back(std::move(cls));
        }

        auto enums = doc.FindMember("Enums");
        if (enums != doc.MemberEnd() && enums->value.IsArray()) {
            for (const auto& e : enums->value.GetArray()) {
                if (!e.IsObject()) continue;

                EnumDescriptor desc;
                desc.name = ReadString(e, "Name");
                auto items = e.FindMember("Items");
                if (items != e.MemberEnd() && items->value.IsArray()) {
                    for (const auto& item : items->value.GetArray()) {
                        if (!item.IsObject()) continue;
                        EnumItemDescriptor itemDesc;
                        itemDesc.name = ReadString(item, "Name");
                        auto value = item.FindMember("Value");
                        if (value != item.MemberEnd() && value->value.IsInt()) itemDesc.value = value->value.GetInt();
                        desc.items.push_back(std::move(itemDesc));
                    }
                }
                if (!desc.name.empty()) dump.enums.push_back(std::move(desc));
            }
        }

        SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[ReflectionDump] Parsed ", dump.classes.size(), " classes, ",
                     dump.enums.size(), " enums");
        return dump;
    }

    ReflectionDump LoadReflectionDump(const std::string& path)
    {
        std::ifstream inFile(path, std::ios::binary);
        if (!inFile.is_open())
            throw MalformedInputError("Cannot open reflection dump: " + path);

        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        return ParseReflectionDump(jsonContent);
    }

} // namespace Serial
