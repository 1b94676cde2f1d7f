#pragma once

#include <string>
#include <vector>

#include "Serial.h"
#include "Logging.hpp"

namespace Serial {

    // Tunables for schema building, logging and wire output. Loaded from a JSON file;
    // keys missing from the file keep the defaults below.
    struct SerialSettings {
        std::vector<std::string> ignoredProperties = { "Parent" };
        std::string serviceClassTag = "Service";
        std::string notCreatableClassTag = "NotCreatable";
        std::vector<std::string> skippedMemberTags = { "ReadOnly", "NotScriptable", "Deprecated" };
        std::string publicSecurity = "None";

        std::string logLevel = "info";
        bool logToFile = false;
        std::string logFilePath = "logs/serial.log";
        size_t maxLogQueueSize = 1000;

        bool prettyJson = false;
    };

    // Applies every recognised key of jsonText onto out. Returns false on a parse error.
    SERIAL_API bool ParseSettings(const std::string& jsonText, SerialSettings& out);
    SERIAL_API std::string SettingsToJson(const SerialSettings& settings);

    // Returns false (and leaves out untouched) when the file is missing or unreadable.
    SERIAL_API bool LoadSettings(const std::string& path, SerialSettings& out);
    SERIAL_API bool SaveSettings(const std::string& path, const SerialSettings& settings);

    SERIAL_API SerialLogging::LogOptions ToLogOptions(const SerialSettings& settings);

} // namespace Serial
