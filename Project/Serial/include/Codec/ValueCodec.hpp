#pragma once
/*********************************************************************************
* @File         ValueCodec.hpp
* @Brief        Closed codec table converting host Values to transport-safe EncodedValues.
*                  - Primitives and name strings (BrickColor, Enum) pass through as JSON scalars.
*                  - Every other composite is packed little-endian (f32 fields, u32 counts and
*                    string lengths) and Base64 wrapped. Field order per type:
*                      NumberRange  Min Max
*                      Vector2      X Y
*                      Vector3      X Y Z
*                      CFrame       X Y Z R00 R01 R02 R10 R11 R12 R20 R21 R22
*                      Color3       R G B
*                      Color3uint8  u8 R, u8 G, u8 B
*                      PhysicalProperties  Density Friction Elasticity FrictionWeight ElasticityWeight
*                      NumberSequence      u32 N, N x (Time Value Envelope)
*                      Font         string Family, string Weight, string Style
*                      UDim2        X.Scale X.Offset Y.Scale Y.Offset
*                      UDim         Scale Offset
*               Codecs throw MalformedInputError; CodecRegistry::EncodeValue/DecodeValue turn
*               that into a diagnostic so tree walks never abort on a single value.
*********************************************************************************/
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "Serial.h"
#include "Values/Value.hpp"
#include "Serialization/SerializedRecord.hpp"

namespace Serial {

    class EnumCatalog;
    class Diagnostics;

    enum class ValueType {
        String,
        Bool,
        Int,
        Float,
        NumberRange,
        Vector2,
        Vector3,
        CFrame,
        BrickColor,
        Color3,
        Color3uint8,
        Enum,
        PhysicalProperties,
        NumberSequence,
        Font,
        UDim,
        UDim2
    };

    SERIAL_API const char* ToString(ValueType type);

    class SERIAL_API ValueCodec {
    public:
        virtual ~ValueCodec() = default;

        virtual ValueType GetType() const = 0;
        virtual const char* GetName() const = 0;

        // Throws MalformedInputError when value is not of this codec's type.
        virtual EncodedValue Encode(const Value& value) const = 0;
        // Throws MalformedInputError on a wrong-shaped or corrupt payload.
        virtual Value Decode(const EncodedValue& encoded) const = 0;
    };

    class SERIAL_API CodecRegistry {
    public:
        // enums may be null; Enum values then decode with value 0.
        explicit CodecRegistry(const EnumCatalog* enums = nullptr);
        ~CodecRegistry();

        CodecRegistry(const CodecRegistry&) = delete;
        CodecRegistry& operator=(const CodecRegistry&) = delete;

        const ValueCodec* Find(ValueType type) const;
        const ValueCodec* FindByTag(const std::string& typeTag) const;

        // Maps a schema or attribute type tag to its codec key; std::nullopt for unknown tags.
        static std::optional<ValueType> TypeFromTag(const std::string& typeTag);
        static bool IsKnownTag(const std::string& typeTag) { return TypeFromTag(typeTag).has_value(); }

        // Degrading entry points used by the tree walkers.
        // Unknown tag: scalar values pass through, others become null (UnknownType diagnostic).
        // Codec failure: EncodeFailure / DecodeFailure diagnostic and std::nullopt.
        std::optional<EncodedValue> EncodeValue(const std::string& typeTag, const Value& value, Diagnostics* diagnostics,
                                                const std::string& className, const std::string& property) const;
        std::optional<Value> DecodeValue(const std::string& typeTag, const EncodedValue& encoded, Diagnostics* diagnostics,
                                         const std::string& className, const std::string& property) const;

    private:
        std::map<ValueType, std::unique_ptr<ValueCodec>> codecs;
    };

    // Scalar conversions used for unknown-type pass-through.
    SERIAL_API Value ToValue(const EncodedValue& encoded);
    SERIAL_API std::optional<EncodedValue> ToEncodedScalar(const Value& value);

} // namespace Serial
