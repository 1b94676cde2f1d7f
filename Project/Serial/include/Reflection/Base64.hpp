#pragma once
/*********************************************************************************
* @File         Base64.hpp
* @Brief        Base64 text wrapping for packed composite values:
*                  - Base64_Encode: encodes a byte vector to a padded Base64 string.
*                  - Base64_Decode: decodes a Base64 string into bytes. Whitespace
*                    (CR/LF/space/tab) is ignored, length must be a multiple of 4
*                    after stripping, only A-Z a-z 0-9 + / and trailing '=' are valid.
*               Malformed input is reported through the log and a std::nullopt return,
*               never by crashing.
*********************************************************************************/
#include <optional>
#include <string>
#include <vector>

#include "Serial.h"

namespace Serial {

    // Encodes a vector of bytes to a base64 string.
    SERIAL_API std::string Base64_Encode(const std::vector<unsigned char>& data);

    // Decodes a base64 string to a vector of bytes; std::nullopt on malformed input.
    SERIAL_API std::optional<std::vector<unsigned char>> Base64_Decode(const std::string& data);

} // namespace Serial
