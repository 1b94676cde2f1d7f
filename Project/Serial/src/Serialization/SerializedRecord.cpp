#include "pch.h"
#include "Serialization/SerializedRecord.hpp"

namespace Serial {

    size_t CountRecords(const SerializedRecord& record)
    {
        size_t count = 1;
        for (const auto& child : record.children) count += CountRecords(child);
        return count;
    }

    std::string ToString(const EncodedValue& value)
    {
        std::ostringstream os;
        if (std::holds_alternative<std::monostate>(value)) os << "null";
        else if (auto b = std::get_if<bool>(&value)) os << (*b ? "true" : "false");
        else if (auto i = std::get_if<std::int64_t>(&value)) os << *i;
        else if (auto d = std::get_if<double>(&value)) os << *d;
        else if (auto s = std::get_if<std::string>(&value)) os << '"' << *s << '"';
        return os.str();
    }

} // namespace Serial
