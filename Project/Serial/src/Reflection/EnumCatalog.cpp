#include "pch.h"
#include "Reflection/EnumCatalog.hpp"

namespace Serial {

    void EnumCatalog::AddItem(const std::string& category, const std::string& name, int value)
    {
        categories[category][name] = value;
    }

    bool EnumCatalog::HasCategory(const std::string& category) const
    {
        return categories.count(category) != 0;
    }

    std::optional<EnumItem> EnumCatalog::Find(const std::string& category, const std::string& name) const
    {
        auto cat = categories.find(category);
        if (cat == categories.end()) return std::nullopt;

        auto item = cat->second.find(name);
        if (item == cat->second.end()) return std::nullopt;

        return EnumItem{ category, name, item->second };
    }

    std::vector<std::string> EnumCatalog::GetItemNames(const std::string& category) const
    {
        std::vector<std::string> names;
        auto cat = categories.find(category);
        if (cat == categories.end()) return names;

        names.reserve(cat->second.size());
        for (const auto& item : cat->second) names.push_back(item.first);
        std::sort(names.begin(), names.end());
        return names;
    }

} // namespace Serial
