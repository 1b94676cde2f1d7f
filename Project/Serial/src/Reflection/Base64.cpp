#include "pch.h"

#include "Reflection/Base64.hpp"
#include "Logging.hpp"

namespace Serial {

#pragma region Internal Function

    static const char b64_table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";

    static inline bool IsWhitespace(char c) {
        return c == '\r' || c == '\n' || c == ' ' || c == '\t';
    }

    // Reverse lookup, -1 for characters outside the alphabet
    static const std::array<int, 256>& ReverseTable() {
        static const std::array<int, 256> table = [] {
            std::array<int, 256> t{};
            t.fill(-1);
            for (int i = 0; i < 64; ++i) t[static_cast<unsigned char>(b64_table[i])] = i;
            return t;
        }();
        return table;
    }

#pragma endregion

    std::string Base64_Encode(const std::vector<unsigned char>& data)
    {
        if (data.empty()) return "";

        std::string out;
        out.reserve(((data.size() + 2) / 3) * 4);

        size_t i = 0;
        const size_t n = data.size();
        for (; i + 2 < n; i += 3) {
            uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | uint32_t(data[i + 2]);
            out.push_back(b64_table[(triple >> 18) & 0x3F]);
            out.push_back(b64_table[(triple >> 12) & 0x3F]);
            out.push_back(b64_table[(triple >> 6) & 0x3F]);
            out.push_back(b64_table[triple & 0x3F]);
        }

        const size_t rem = n - i;
        if (rem) {
            uint32_t triple = uint32_t(data[i]) << 16;
            if (rem == 2) triple |= uint32_t(data[i + 1]) << 8;

            out.push_back(b64_table[(triple >> 18) & 0x3F]);
            out.push_back(b64_table[(triple >> 12) & 0x3F]);
            out.push_back(rem == 2 ? b64_table[(triple >> 6) & 0x3F] : '=');
            out.push_back('=');
        }

        return out;
    }

    std::optional<std::vector<unsigned char>> Base64_Decode(const std::string& input)
    {
        std::string s;
        s.reserve(input.size());
        for (char c : input) {
            if (!IsWhitespace(c)) s.push_back(c);
        }

        if (s.empty()) return std::vector<unsigned char>{};

        if (s.size() % 4 != 0) {
            SERIAL_LOG_ERROR("Base64 decoding: invalid input length (not a multiple of 4).");
            return std::nullopt;
        }

        // '=' may only appear as the last one or two characters
        size_t padding = 0;
        if (s[s.size() - 1] == '=') ++padding;
        if (s[s.size() - 2] == '=') ++padding;
        if (s.find('=') < s.size() - padding) {
            SERIAL_LOG_ERROR("Base64 decoding: padding in the middle of the input.");
            return std::nullopt;
        }

        const auto& rev = ReverseTable();

        std::vector<unsigned char> out;
        out.reserve((s.size() / 4) * 3 - padding);

        for (size_t i = 0; i < s.size(); i += 4)
        {
            int v[4];
            for (size_t k = 0; k < 4; ++k) {
                const char c = s[i + k];
                v[k] = (c == '=') ? 0 : rev[static_cast<unsigned char>(c)];
                if (v[k] < 0) {
                    SERIAL_PRINT(SerialLogging::LogLevel::Error, "Base64 decoding: invalid character at position ", i + k, ".");
                    return std::nullopt;
                }
            }

            uint32_t triple = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) | (uint32_t(v[2]) << 6) | uint32_t(v[3]);

            out.push_back(static_cast<unsigned char>((triple >> 16) & 0xFF));
            if (s[i + 2] != '=') out.push_back(static_cast<unsigned char>((triple >> 8) & 0xFF));
            if (s[i + 3] != '=') out.push_back(static_cast<unsigned char>(triple & 0xFF));
        }

        return out;
    }

} // namespace Serial
