#pragma once
/*********************************************************************************
* @File         ByteBuffer.hpp
* @Brief        Fixed-width little-endian packing used by the composite codecs.
*                  - ByteWriter appends u8 / u32 / f32 / length-prefixed strings.
*                  - ByteReader consumes the same layout and throws
*                    MalformedInputError on truncated input.
*               Byte order is produced explicitly, so the packed form does not
*               depend on the host's endianness.
*********************************************************************************/
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Serial.h"

namespace Serial {

    class SERIAL_API ByteWriter {
    public:
        void WriteU8(std::uint8_t v);
        void WriteU32(std::uint32_t v);
        void WriteF32(float v);
        // u32 byte length followed by the raw bytes
        void WriteString(const std::string& s);

        const std::vector<unsigned char>& Bytes() const { return bytes; }
        std::vector<unsigned char> Release() { return std::move(bytes); }

    private:
        std::vector<unsigned char> bytes;
    };

    class SERIAL_API ByteReader {
    public:
        explicit ByteReader(const std::vector<unsigned char>& data) : data(data) {}
        ByteReader(std::vector<unsigned char>&&) = delete;

        std::uint8_t ReadU8();
        std::uint32_t ReadU32();
        float ReadF32();
        std::string ReadString();

        size_t Remaining() const { return data.size() - offset; }
        bool AtEnd() const { return offset == data.size(); }

        // Throws unless every byte has been consumed.
        void ExpectEnd(const char* what) const;

    private:
        void Require(size_t count, const char* what) const;

        const std::vector<unsigned char>& data;
        size_t offset = 0;
    };

} // namespace Serial
