#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Serial.h"
#include "Values/Value.hpp"

namespace Serial {

    // Enum categories and their members, taken from the reflection dump.
    class SERIAL_API EnumCatalog {
    public:
        void AddItem(const std::string& category, const std::string& name, int value);

        bool HasCategory(const std::string& category) const;
        std::optional<EnumItem> Find(const std::string& category, const std::string& name) const;

        size_t CategoryCount() const { return categories.size(); }
        std::vector<std::string> GetItemNames(const std::string& category) const;

    private:
        std::unordered_map<std::string, std::unordered_map<std::string, int>> categories;
    };

} // namespace Serial
