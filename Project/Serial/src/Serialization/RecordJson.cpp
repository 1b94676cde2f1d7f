#include "pch.h"
#include "Serialization/RecordJson.hpp"
#include "SerialError.hpp"
#include "Logging.hpp"

namespace Serial {

    namespace {

        using CompactWriter = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                                rapidjson::CrtAllocator, kJsonWriteFlags>;
        using PrettyWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                                     rapidjson::CrtAllocator, kJsonWriteFlags>;

        void BuildRecordJson(const SerializedRecord& record, rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc)
        {
            out.SetObject();
            out.AddMember("Type", rapidjson::Value(record.type.c_str(), alloc), alloc);
            out.AddMember("Id", static_cast<int64_t>(record.id), alloc);

            rapidjson::Value props(rapidjson::kObjectType);
            for (const auto& [name, value] : record.properties) {
                rapidjson::Value v;
                WriteEncodedValue(value, v, alloc);
                props.AddMember(rapidjson::Value(name.c_str(), alloc), v, alloc);
            }
            out.AddMember("Properties", props, alloc);

            if (!record.tags.empty()) {
                rapidjson::Value tags(rapidjson::kArrayType);
                for (const auto& tag : record.tags) tags.PushBack(rapidjson::Value(tag.c_str(), alloc), alloc);
                out.AddMember("Tags", tags, alloc);
            }

            if (!record.attributes.empty()) {
                rapidjson::Value attrs(rapidjson::kObjectType);
                for (const auto& [name, attr] : record.attributes) {
                    rapidjson::Value pair(rapidjson::kArrayType);
                    pair.PushBack(rapidjson::Value(attr.typeTag.c_str(), alloc), alloc);
                    rapidjson::Value v;
                    WriteEncodedValue(attr.value, v, alloc);
                    pair.PushBack(v, alloc);
                    attrs.AddMember(rapidjson::Value(name.c_str(), alloc), pair, alloc);
                }
                out.AddMember("Attributes", attrs, alloc);
            }

            if (!record.children.empty()) {
                rapidjson::Value children(rapidjson::kArrayType);
                for (const auto& child : record.children) {
                    rapidjson::Value c;
                    BuildRecordJson(child, c, alloc);
                    children.PushBack(c, alloc);
                }
                out.AddMember("Children", children, alloc);
            }
        }

        std::string Where(const std::string& path, const char* member)
        {
            return path.empty() ? std::string(member) : path + "." + member;
        }

        SerializedRecord ParseRecord(const rapidjson::Value& json, const std::string& path)
        {
            if (!json.IsObject()) throw MalformedInputError("Record at " + (path.empty() ? std::string("root") : path) + " is not an object");

            SerializedRecord record;

            auto type = json.FindMember("Type");
            if (type == json.MemberEnd() || !type->value.IsString())
                throw MalformedInputError("Record at " + (path.empty() ? std::string("root") : path) + " has no string Type");
            record.type.assign(type->value.GetString(), type->value.GetStringLength());

            auto id = json.FindMember("Id");
            if (id == json.MemberEnd() || !id->value.IsInt64())
                throw MalformedInputError("Record " + record.type + " at " + (path.empty() ? std::string("root") : path) + " has no integer Id");
            record.id = id->value.GetInt64();

            auto props = json.FindMember("Properties");
            if (props != json.MemberEnd()) {
                if (!props->value.IsObject()) throw MalformedInputError(Where(path, "Properties") + " is not an object");
                for (auto m = props->value.MemberBegin(); m != props->value.MemberEnd(); ++m) {
                    std::string name(m->name.GetString(), m->name.GetStringLength());
                    auto value = ReadEncodedValue(m->value);
                    if (!value) throw MalformedInputError(Where(path, "Properties") + "." + name + " is not a scalar");
                    record.properties.emplace(std::move(name), std::move(*value));
                }
            }

            auto tags = json.FindMember("Tags");
            if (tags != json.MemberEnd()) {
                if (!tags->value.IsArray()) throw MalformedInputError(Where(path, "Tags") + " is not an array");
                for (const auto& tag : tags->value.GetArray()) {
                    if (!tag.IsString()) throw MalformedInputError(Where(path, "Tags") + " contains a non-string");
                    record.tags.emplace_back(tag.GetString(), tag.GetStringLength());
                }
            }

            auto attrs = json.FindMember("Attributes");
            if (attrs != json.MemberEnd()) {
                if (!attrs->value.IsObject()) throw MalformedInputError(Where(path, "Attributes") + " is not an object");
                for (auto m = attrs->value.MemberBegin(); m != attrs->value.MemberEnd(); ++m) {
                    std::string name(m->name.GetString(), m->name.GetStringLength());
                    const auto& pair = m->value;
                    if (!pair.IsArray() || pair.Size() != 2 || !pair[0].IsString())
                        throw MalformedInputError(Where(path, "Attributes") + "." + name + " is not a [typeTag, value] pair");

                    auto value = ReadEncodedValue(pair[1]);
                    if (!value) throw MalformedInputError(Where(path, "Attributes") + "." + name + " value is not a scalar");

                    EncodedAttribute attr;
                    attr.typeTag.assign(pair[0].GetString(), pair[0].GetStringLength());
                    attr.value = std::move(*value);
                    record.attributes.emplace(std::move(name), std::move(attr));
                }
            }

            auto children = json.FindMember("Children");
            if (children != json.MemberEnd()) {
                if (!children->value.IsArray()) throw MalformedInputError(Where(path, "Children") + " is not an array");
                rapidjson::SizeType index = 0;
                for (const auto& child : children->value.GetArray()) {
                    record.children.push_back(ParseRecord(child, Where(path, "Children") + "[" + std::to_string(index++) + "]"));
                }
            }

            return record;
        }

    } // namespace

    void WriteEncodedValue(const EncodedValue& value, rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc)
    {
        if (auto b = std::get_if<bool>(&value)) out.SetBool(*b);
        else if (auto i = std::get_if<std::int64_t>(&value)) out.SetInt64(*i);
        else if (auto d = std::get_if<double>(&value)) out.SetDouble(*d);
        else if (auto s = std::get_if<std::string>(&value)) out.SetString(s->c_str(), static_cast<rapidjson::SizeType>(s->size()), alloc);
        else out.SetNull();
    }

    std::optional<EncodedValue> ReadEncodedValue(const rapidjson::Value& json)
    {
        if (json.IsNull()) return EncodedValue{};
        if (json.IsBool()) return EncodedValue{ json.GetBool() };
        if (json.IsInt64()) return EncodedValue{ static_cast<std::int64_t>(json.GetInt64()) };
        if (json.IsNumber()) return EncodedValue{ json.GetDouble() };
        if (json.IsString()) return EncodedValue{ std::string(json.GetString(), json.GetStringLength()) };
        return std::nullopt;
    }

    std::string JsonToString(const rapidjson::Value& json, bool pretty)
    {
        rapidjson::StringBuffer buffer;
        bool complete = false;
        if (pretty) {
            PrettyWriter writer(buffer);
            complete = json.Accept(writer);
        }
        else {
            CompactWriter writer(buffer);
            complete = json.Accept(writer);
        }
        if (!complete) throw SerialError("JSON writer stopped before the end of the document");
        return std::string(buffer.GetString(), buffer.GetSize());
    }

    std::string RecordToJson(const SerializedRecord& record, bool pretty)
    {
        rapidjson::Document doc;
        BuildRecordJson(record, doc, doc.GetAllocator());
        return JsonToString(doc, pretty);
    }

    SerializedRecord RecordFromJson(const std::string& jsonText)
    {
        rapidjson::Document doc;
        doc.Parse<kJsonParseFlags>(jsonText.c_str(), jsonText.size());

        if (doc.HasParseError()) {
            std::ostringstream ss;
            ss << "Record JSON parse error " << static_cast<int>(doc.GetParseError()) << " at offset " << doc.GetErrorOffset();
            throw MalformedInputError(ss.str());
        }
        return ParseRecord(doc, "");
    }

    bool SaveRecordToFile(const std::string& path, const SerializedRecord& record, bool pretty)
    {
        namespace fs = std::filesystem;

        fs::path fullPath(path);
        if (fullPath.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(fullPath.parent_path(), ec);
            if (ec) {
                SERIAL_PRINT(SerialLogging::LogLevel::Error, "[RecordJson] Failed to create directory: ",
                             fullPath.parent_path().string(), " (", ec.message(), ")");
                return false;
            }
        }

        std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
        if (!outFile.is_open()) {
            SERIAL_PRINT(SerialLogging::LogLevel::Error, "[RecordJson] Failed to open file for writing: ", path);
            return false;
        }

        outFile << RecordToJson(record, pretty);
        if (!outFile) {
            SERIAL_PRINT(SerialLogging::LogLevel::Error, "[RecordJson] Failed to write file: ", path);
            return false;
        }

        SERIAL_PRINT(SerialLogging::LogLevel::Debug, "[RecordJson] Saved ", CountRecords(record), " records to ", path);
        return true;
    }

    SerializedRecord LoadRecordFromFile(const std::string& path)
    {
        std::ifstream inFile(path, std::ios::binary);
        if (!inFile.is_open()) throw MalformedInputError("Cannot open record file: " + path);

        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        return RecordFromJson(jsonContent);
    }

} // namespace Serial
