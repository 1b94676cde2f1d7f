#include "pch.h"
#include "Codec/ByteBuffer.hpp"
#include "SerialError.hpp"

namespace Serial {

    static_assert(sizeof(float) == sizeof(std::uint32_t), "f32 packing expects 32-bit IEEE floats");

    void ByteWriter::WriteU8(std::uint8_t v)
    {
        bytes.push_back(v);
    }

    void ByteWriter::WriteU32(std::uint32_t v)
    {
        for (size_t i = 0; i < sizeof(std::uint32_t); ++i)
            bytes.push_back(static_cast<unsigned char>((v >> (8 * i)) & 0xFF));
    }

    void ByteWriter::WriteF32(float v)
    {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        WriteU32(bits);
    }

    void ByteWriter::WriteString(const std::string& s)
    {
        WriteU32(static_cast<std::uint32_t>(s.size()));
        bytes.insert(bytes.end(), s.begin(), s.end());
    }

    void ByteReader::Require(size_t count, const char* what) const
    {
        if (Remaining() < count) {
            std::ostringstream ss;
            ss << "Packed value truncated while reading " << what << ": need " << count
               << " bytes at offset " << offset << ", have " << Remaining();
            throw MalformedInputError(ss.str());
        }
    }

    std::uint8_t ByteReader::ReadU8()
    {
        Require(1, "u8");
        return data[offset++];
    }

    std::uint32_t ByteReader::ReadU32()
    {
        Require(sizeof(std::uint32_t), "u32");
        std::uint32_t v = 0;
        for (size_t i = 0; i < sizeof(std::uint32_t); ++i)
            v |= static_cast<std::uint32_t>(data[offset + i]) << (8 * i);
        offset += sizeof(std::uint32_t);
        return v;
    }

    float ByteReader::ReadF32()
    {
        const std::uint32_t bits = ReadU32();
        float v = 0.0f;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::string ByteReader::ReadString()
    {
        const std::uint32_t length = ReadU32();
        Require(length, "string bytes");
        std::string s(reinterpret_cast<const char*>(data.data() + offset), length);
        offset += length;
        return s;
    }

    void ByteReader::ExpectEnd(const char* what) const
    {
        if (!AtEnd()) {
            std::ostringstream ss;
            ss << "Packed " << what << " has " << Remaining() << " trailing bytes";
            throw MalformedInputError(ss.str());
        }
    }

} // namespace Serial
