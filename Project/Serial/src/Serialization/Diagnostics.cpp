#include "pch.h"
#include "Serialization/Diagnostics.hpp"
#include "Logging.hpp"

namespace Serial {

    const char* ToString(DiagnosticKind kind)
    {
        switch (kind) {
            case DiagnosticKind::UnknownType:       return "UnknownType";
            case DiagnosticKind::NotInstantiable:   return "NotInstantiable";
            case DiagnosticKind::MissingSchema:     return "MissingSchema";
            case DiagnosticKind::DanglingReference: return "DanglingReference";
            case DiagnosticKind::DuplicateId:       return "DuplicateId";
            case DiagnosticKind::EncodeFailure:     return "EncodeFailure";
            case DiagnosticKind::DecodeFailure:     return "DecodeFailure";
            case DiagnosticKind::HostFailure:       return "HostFailure";
        }
        return "Unknown";
    }

    void Diagnostics::Add(DiagnosticKind kind, const std::string& className, const std::string& property, const std::string& message)
    {
        entries.push_back(Diagnostic{ kind, className, property, message });
    }

    size_t Diagnostics::Count(DiagnosticKind kind) const
    {
        return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
            [kind](const Diagnostic& d) { return d.kind == kind; }));
    }

    void Diagnostics::Report(Diagnostics* sink, DiagnosticKind kind, const std::string& className,
                             const std::string& property, const std::string& message)
    {
        // Version drift and out-of-tree references are expected; the rest deserve attention.
        SerialLogging::LogLevel level = SerialLogging::LogLevel::Warn;
        if (kind == DiagnosticKind::MissingSchema || kind == DiagnosticKind::DanglingReference
            || kind == DiagnosticKind::NotInstantiable) {
            level = SerialLogging::LogLevel::Debug;
        }

        SERIAL_PRINT(level, "[Serial] ", ToString(kind), " ", className,
                     property.empty() ? "" : ".", property, ": ", message);

        if (sink) sink->Add(kind, className, property, message);
    }

} // namespace Serial
