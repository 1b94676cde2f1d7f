#pragma once
/*********************************************************************************
* @File         Diagnostics.hpp
* @Brief        Structured record of every degrade-and-continue decision taken during
*               a serialize or deserialize call. Each report is also written to the
*               log, so callers that do not pass a collector still see it.
*********************************************************************************/
#include <string>
#include <vector>

#include "Serial.h"

namespace Serial {

    enum class DiagnosticKind {
        UnknownType,        // type tag without a codec; raw value passed through
        NotInstantiable,    // class cannot be created; node (and subtree) skipped
        MissingSchema,      // record property unknown to the current schema
        DanglingReference,  // reference target outside the tree / unresolvable id
        DuplicateId,        // record id seen twice during deserialization
        EncodeFailure,      // live value did not match its declared type
        DecodeFailure,      // encoded value could not be decoded
        HostFailure         // host model refused a get/set/create
    };

    SERIAL_API const char* ToString(DiagnosticKind kind);

    struct Diagnostic {
        DiagnosticKind kind;
        std::string className;
        std::string property;
        std::string message;
    };

    class SERIAL_API Diagnostics {
    public:
        void Add(DiagnosticKind kind, const std::string& className, const std::string& property, const std::string& message);

        const std::vector<Diagnostic>& GetEntries() const { return entries; }
        size_t Count(DiagnosticKind kind) const;
        size_t Size() const { return entries.size(); }
        bool Empty() const { return entries.empty(); }
        void Clear() { entries.clear(); }

        // Logs the event and, when sink is non-null, records it there.
        static void Report(Diagnostics* sink, DiagnosticKind kind, const std::string& className,
                           const std::string& property, const std::string& message);

    private:
        std::vector<Diagnostic> entries;
    };

} // namespace Serial
