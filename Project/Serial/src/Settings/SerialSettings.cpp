#include "pch.h"
#include "Settings/SerialSettings.hpp"
#include "Logging.hpp"

namespace Serial {

    namespace {

        void ReadStringKey(const rapidjson::Document& doc, const char* key, std::string& out)
        {
            auto it = doc.FindMember(key);
            if (it == doc.MemberEnd()) return;
            if (!it->value.IsString()) {
                SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[SerialSettings] Ignoring '", key, "': expected a string");
                return;
            }
            out.assign(it->value.GetString(), it->value.GetStringLength());
        }

        void ReadStringListKey(const rapidjson::Document& doc, const char* key, std::vector<std::string>& out)
        {
            auto it = doc.FindMember(key);
            if (it == doc.MemberEnd()) return;

            bool valid = it->value.IsArray();
            if (valid) {
                for (const auto& item : it->value.GetArray()) valid = valid && item.IsString();
            }
            if (!valid) {
                SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[SerialSettings] Ignoring '", key, "': expected an array of strings");
                return;
            }

            out.clear();
            for (const auto& item : it->value.GetArray()) out.emplace_back(item.GetString(), item.GetStringLength());
        }

        void ReadBoolKey(const rapidjson::Document& doc, const char* key, bool& out)
        {
            auto it = doc.FindMember(key);
            if (it == doc.MemberEnd()) return;
            if (!it->value.IsBool()) {
                SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[SerialSettings] Ignoring '", key, "': expected a bool");
                return;
            }
            out = it->value.GetBool();
        }

        void WriteStringList(rapidjson::Document& doc, const char* key, const std::vector<std::string>& list)
        {
            auto& alloc = doc.GetAllocator();
            rapidjson::Value arr(rapidjson::kArrayType);
            for (const auto& s : list) arr.PushBack(rapidjson::Value(s.c_str(), alloc), alloc);
            doc.AddMember(rapidjson::StringRef(key), arr, alloc);
        }

    } // namespace

    bool ParseSettings(const std::string& jsonText, SerialSettings& out)
    {
        rapidjson::Document doc;
        doc.Parse(jsonText.c_str(), jsonText.size());

        if (doc.HasParseError() || !doc.IsObject()) {
            SERIAL_LOG_ERROR("[SerialSettings] Settings JSON is not a valid object");
            return false;
        }

        ReadStringListKey(doc, "ignoredProperties", out.ignoredProperties);
        ReadStringKey(doc, "serviceClassTag", out.serviceClassTag);
        ReadStringKey(doc, "notCreatableClassTag", out.notCreatableClassTag);
        ReadStringListKey(doc, "skippedMemberTags", out.skippedMemberTags);
        ReadStringKey(doc, "publicSecurity", out.publicSecurity);
        ReadStringKey(doc, "logLevel", out.logLevel);
        ReadBoolKey(doc, "logToFile", out.logToFile);
        ReadStringKey(doc, "logFilePath", out.logFilePath);
        ReadBoolKey(doc, "prettyJson", out.prettyJson);

        auto queue = doc.FindMember("maxLogQueueSize");
        if (queue != doc.MemberEnd()) {
            if (queue->value.IsUint64()) out.maxLogQueueSize = static_cast<size_t>(queue->value.GetUint64());
            else SERIAL_LOG_WARN("[SerialSettings] Ignoring 'maxLogQueueSize': expected a non-negative integer");
        }

        SerialLogging::LogLevel level;
        if (!SerialLogging::ParseLogLevel(out.logLevel, level)) {
            SERIAL_PRINT(SerialLogging::LogLevel::Warn, "[SerialSettings] Unknown logLevel '", out.logLevel, "', using info");
            out.logLevel = "info";
        }
        return true;
    }

    std::string SettingsToJson(const SerialSettings& settings)
    {
        rapidjson::Document doc;
        doc.SetObject();
        rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

        WriteStringList(doc, "ignoredProperties", settings.ignoredProperties);
        doc.AddMember("serviceClassTag", rapidjson::Value(settings.serviceClassTag.c_str(), alloc), alloc);
        doc.AddMember("notCreatableClassTag", rapidjson::Value(settings.notCreatableClassTag.c_str(), alloc), alloc);
        WriteStringList(doc, "skippedMemberTags", settings.skippedMemberTags);
        doc.AddMember("publicSecurity", rapidjson::Value(settings.publicSecurity.c_str(), alloc), alloc);
        doc.AddMember("logLevel", rapidjson::Value(settings.logLevel.c_str(), alloc), alloc);
        doc.AddMember("logToFile", settings.logToFile, alloc);
        doc.AddMember("logFilePath", rapidjson::Value(settings.logFilePath.c_str(), alloc), alloc);
        doc.AddMember("maxLogQueueSize", static_cast<uint64_t>(settings.maxLogQueueSize), alloc);
        doc.AddMember("prettyJson", settings.prettyJson, alloc);

        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
        return buffer.GetString();
    }

    bool LoadSettings(const std::string& path, SerialSettings& out)
    {
        namespace fs = std::filesystem;

        if (!fs::exists(path)) {
            SERIAL_PRINT(SerialLogging::LogLevel::Info, "[SerialSettings] No settings file at ", path, ", using defaults");
            return false;
        }

        std::ifstream inFile(path, std::ios::binary);
        if (!inFile.is_open()) {
            SERIAL_PRINT(SerialLogging::LogLevel::Error, "[SerialSettings] Failed to open file: ", path);
            return false;
        }

        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());

        SerialSettings loaded = out;
        if (!ParseSettings(jsonContent, loaded)) return false;
        out = std::move(loaded);

        SERIAL_PRINT(SerialLogging::LogLevel::Info, "[SerialSettings] Loaded settings from: ", path);
        return true;
    }

    bool SaveSettings(const std::string& path, const SerialSettings& settings)
    {
        namespace fs = std::filesystem;

        fs::path fullPath(path);
        if (fullPath.has_parent_path() && !fs::exists(fullPath.parent_path())) {
            std::error_code ec;
            fs::create_directories(fullPath.parent_path(), ec);
            if (ec) {
                SERIAL_PRINT(SerialLogging::LogLevel::Error, "[SerialSettings] Failed to create directory: ",
                             fullPath.parent_path().string(), " (", ec.message(), ")");
                return false;
            }
        }

        std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
        if (!outFile.is_open()) {
            SERIAL_PRINT(SerialLogging::LogLevel::Error, "[SerialSettings] Failed to write file: ", path);
            return false;
        }
        outFile << SettingsToJson(settings);
        return static_cast<bool>(outFile);
    }

    SerialLogging::LogOptions ToLogOptions(const SerialSettings& settings)
    {
        SerialLogging::LogOptions options;
        if (!SerialLogging::ParseLogLevel(settings.logLevel, options.level)) options.level = SerialLogging::LogLevel::Info;
        options.toFile = settings.logToFile;
        options.filePath = settings.logFilePath;
        options.queueCapacity = settings.maxLogQueueSize;
        return options;
    }

} // namespace Serial
