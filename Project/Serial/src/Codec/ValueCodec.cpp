#include "pch.h"
#include "Codec/ValueCodec.hpp"
#include "Codec/ByteBuffer.hpp"
#include "Reflection/Base64.hpp"
#include "Reflection/EnumCatalog.hpp"
#include "Serialization/Diagnostics.hpp"
#include "SerialError.hpp"
#include "Logging.hpp"

namespace Serial {

    const char* ToString(ValueType type)
    {
        switch (type) {
            case ValueType::String:             return "string";
            case ValueType::Bool:               return "bool";
            case ValueType::Int:                return "int64";
            case ValueType::Float:              return "double";
            case ValueType::NumberRange:        return "NumberRange";
            case ValueType::Vector2:            return "Vector2";
            case ValueType::Vector3:            return "Vector3";
            case ValueType::CFrame:             return "CFrame";
            case ValueType::BrickColor:         return "BrickColor";
            case ValueType::Color3:             return "Color3";
            case ValueType::Color3uint8:        return "Color3uint8";
            case ValueType::Enum:               return "Enum";
            case ValueType::PhysicalProperties: return "PhysicalProperties";
            case ValueType::NumberSequence:     return "NumberSequence";
            case ValueType::Font:               return "Font";
            case ValueType::UDim:               return "UDim";
            case ValueType::UDim2:              return "UDim2";
        }
        return "unknown";
    }

    Value ToValue(const EncodedValue& encoded)
    {
        return std::visit([](const auto& v) -> Value { return v; }, encoded);
    }

    std::optional<EncodedValue> ToEncodedScalar(const Value& value)
    {
        if (std::holds_alternative<std::monostate>(value)) return EncodedValue{};
        if (auto b = std::get_if<bool>(&value)) return EncodedValue{ *b };
        if (auto i = std::get_if<std::int64_t>(&value)) return EncodedValue{ *i };
        if (auto d = std::get_if<double>(&value)) return EncodedValue{ *d };
        if (auto s = std::get_if<std::string>(&value)) return EncodedValue{ *s };
        return std::nullopt;
    }

    namespace {

        [[noreturn]] void ThrowWrongValue(const char* codec, const Value& value)
        {
            throw MalformedInputError(std::string(codec) + ": cannot encode a value of type " + TypeOf(value));
        }

        [[noreturn]] void ThrowWrongEncoding(const char* codec, const EncodedValue& encoded)
        {
            throw MalformedInputError(std::string(codec) + ": unexpected encoded value " + ToString(encoded));
        }

        // ---------- Scalar codecs ----------

        class StringCodec final : public ValueCodec {
        public:
            ValueType GetType() const override { return ValueType::String; }
            const char* GetName() const override { return "string"; }
            EncodedValue Encode(const Value& value) const override
            {
                if (auto s = std::get_if<std::string>(&value)) return *s;
                ThrowWrongValue(GetName(), value);
            }
            Value Decode(const EncodedValue& encoded) const override
            {
                if (auto s = std::get_if<std::string>(&encoded)) return *s;
                ThrowWrongEncoding(GetName(), encoded);
            }
        };

        class BoolCodec final : public ValueCodec {
        public:
            ValueType GetType() const override { return ValueType::Bool; }
            const char* GetName() const override { return "bool"; }
            EncodedValue Encode(const Value& value) const override
            {
                if (auto b = std::get_if<bool>(&value)) return *b;
                ThrowWrongValue(GetName(), value);
            }
            Value Decode(const EncodedValue& encoded) const override
            {
                if (auto b = std::get_if<bool>(&encoded)) return *b;
                ThrowWrongEncoding(GetName(), encoded);
            }
        };

        // Integral doubles are accepted both ways; JSON readers do not always keep the distinction.
        class IntCodec final : public ValueCodec {
        public:
            ValueType GetType() const override { return ValueType::Int; }
            const char* GetName() const override { return "int64"; }
            EncodedValue Encode(const Value& value) const override
            {
                if (auto i = std::get_if<std::int64_t>(&value)) return *i;
                if (auto d = std::get_if<double>(&value)) {
                    if (auto i = ToExactInt64(*d)) return *i;
                }
                ThrowWrongValue(GetName(), value);
            }
            Value Decode(const EncodedValue& encoded) const override
            {
                if (auto i = std::get_if<std::int64_t>(&encoded)) return *i;
                if (auto d = std::get_if<double>(&encoded)) {
                    if (auto i = ToExactInt64(*d)) return *i;
                }
                ThrowWrongEncoding(GetName(), encoded);
            }
        };

        class FloatCodec final : public ValueCodec {
        public:
            ValueType GetType() const override { return ValueType::Float; }
            const char* GetName() const override { return "double"; }
            EncodedValue Encode(const Value& value) const override
            {
                if (auto d = std::get_if<double>(&value)) return *d;
                if (auto i = std::get_if<std::int64_t>(&value)) return static_cast<double>(*i);
                ThrowWrongValue(GetName(), value);
            }
            Value Decode(const EncodedValue& encoded) const override
            {
                if (auto d = std::get_if<double>(&encoded)) return *d;
                if (auto i = std::get_if<std::int64_t>(&encoded)) return static_cast<double>(*i);
                ThrowWrongEncoding(GetName(), encoded);
            }
        };

        class BrickColorCodec final : public ValueCodec {
        public:
            ValueType GetType() const override { return ValueType::BrickColor; }
            const char* GetName() const override { return "BrickColor"; }
            EncodedValue Encode(const Value& value) const override
            {
                if (auto bc = std::get_if<BrickColor>(&value)) return bc->name;
                ThrowWrongValue(GetName(), value);
            }
            Value Decode(const EncodedValue& encoded) const override
            {
                if (auto s = std::get_if<std::string>(&encoded)) return BrickColor{ *s };
                ThrowWrongEncoding(GetName(), encoded);
            }
        };

        class EnumCodec final : public ValueCodec {
        public:
            explicit EnumCodec(const EnumCatalog* enums) : catalog(enums) {}

            ValueType GetType() const override { return ValueType::Enum; }
            const char* GetName() const override { return "Enum"; }

            EncodedValue Encode(const Value& value) const override
            {
                if (auto e = std::get_if<EnumItem>(&value)) return e->category + "." + e->name;
                ThrowWrongValue(GetName(), value);
            }

            // Accepts "Category.Member" and "Enum.Category.Member".
            Value Decode(const EncodedValue& encoded) const override
            {
                auto text = std::get_if<std::string>(&encoded);
                if (!text) ThrowWrongEncoding(GetName(), encoded);
                if (!text->empty() && text->back() == '.')
                    throw MalformedInputError("Enum: expected Category.Member, got \"" + *text + "\"");

                std::vector<std::string> parts;
                std::stringstream ss(*text);
                std::string part;
                while (std::getline(ss, part, '.')) parts.push_back(part);
                if (parts.size() == 3 && parts[0] == "Enum") parts.erase(parts.begin());

                if (parts.size() != 2 || parts[0].empty() || parts[1].empty())
                    throw MalformedInputError("Enum: expected Category.Member, got \"" + *text + "\"");

                if (catalog && catalog->HasCategory(parts[0])) {
                    auto item = catalog->Find(parts[0], parts[1]);
                    if (!item) throw MalformedInputError("Enum: " + parts[0] + " has no member " + parts[1]);
                    return *item;
                }
                return EnumItem{ parts[0], parts[1], 0 };
            }

        private:
            const EnumCatalog* catalog;
        };

        // ---------- Packed composite codecs ----------

        template <typename T>
        class PackedCodec : public ValueCodec {
        public:
            EncodedValue Encode(const Value& value) const override
            {
                const T* v = std::get_if<T>(&value);
                if (!v) ThrowWrongValue(GetName(), value);

                ByteWriter writer;
                Pack(*v, writer);
                return Base64_Encode(writer.Bytes());
            }

            Value Decode(const EncodedValue& encoded) const override
            {
                auto text = std::get_if<std::string>(&encoded);
                if (!text) ThrowWrongEncoding(GetName(), encoded);

                auto bytes = Base64_Decode(*text);
                if (!bytes) throw MalformedInputError(std::string(GetName()) + ": payload is not valid base64");

                ByteReader reader(*bytes);
                T v = Unpack(reader);
                reader.ExpectEnd(GetName());
                return v;
            }

        protected:
            virtual void Pack(const T& v, ByteWriter& out) const = 0;
            virtual T Unpack(ByteReader& in) const = 0;
        };

#define SERIAL_PACKED_CODEC(NAME, TYPE) \
        class NAME##Codec : public PackedCodec<TYPE> \
        { \
        public: \
            ValueType GetType() const override { return ValueType::NAME; } \
            const char* GetName() const override { return #NAME; } \
        protected: \
            void Pack(const TYPE& v, ByteWriter& out) const override; \
            TYPE Unpack(ByteReader& in) const override; \
        };

        SERIAL_PACKED_CODEC(NumberRange, NumberRange)
        SERIAL_PACKED_CODEC(Vector2, Vector2)
        SERIAL_PACKED_CODEC(Vector3, Vector3)
        SERIAL_PACKED_CODEC(CFrame, CFrame)
        SERIAL_PACKED_CODEC(Color3, Color3)
        SERIAL_PACKED_CODEC(Color3uint8, Color3)
        SERIAL_PACKED_CODEC(PhysicalProperties, PhysicalProperties)
        SERIAL_PACKED_CODEC(NumberSequence, NumberSequence)
        SERIAL_PACKED_CODEC(Font, Font)
        SERIAL_PACKED_CODEC(UDim, UDim)
        SERIAL_PACKED_CODEC(UDim2, UDim2)

#undef SERIAL_PACKED_CODEC

        void NumberRangeCodec::Pack(const NumberRange& v, ByteWriter& out) const
        {
            out.WriteF32(v.min);
            out.WriteF32(v.max);
        }

        NumberRange NumberRangeCodec::Unpack(ByteReader& in) const
        {
            NumberRange v;
            v.min = in.ReadF32();
            v.max = in.ReadF32();
            return v;
        }

        void Vector2Codec::Pack(const Vector2& v, ByteWriter& out) const
        {
            out.WriteF32(v.x);
            out.WriteF32(v.y);
        }

        Vector2 Vector2Codec::Unpack(ByteReader& in) const
        {
            float x = in.ReadF32();
            float y = in.ReadF32();
            return Vector2(x, y);
        }

        void Vector3Codec::Pack(const Vector3& v, ByteWriter& out) const
        {
            out.WriteF32(v.x);
            out.WriteF32(v.y);
            out.WriteF32(v.z);
        }

        Vector3 Vector3Codec::Unpack(ByteReader& in) const
        {
            float x = in.ReadF32();
            float y = in.ReadF32();
            float z = in.ReadF32();
            return Vector3(x, y, z);
        }

        void CFrameCodec::Pack(const CFrame& v, ByteWriter& out) const
        {
            out.WriteF32(v.position.x);
            out.WriteF32(v.position.y);
            out.WriteF32(v.position.z);
            for (int row = 0; row < 3; ++row)
                for (int col = 0; col < 3; ++col)
                    out.WriteF32(GetRotationComponent(v, row, col));
        }

        CFrame CFrameCodec::Unpack(ByteReader& in) const
        {
            CFrame v;
            v.position.x = in.ReadF32();
            v.position.y = in.ReadF32();
            v.position.z = in.ReadF32();
            for (int row = 0; row < 3; ++row)
                for (int col = 0; col < 3; ++col)
                    SetRotationComponent(v, row, col, in.ReadF32());
            return v;
        }

        void Color3Codec::Pack(const Color3& v, ByteWriter& out) const
        {
            out.WriteF32(v.r);
            out.WriteF32(v.g);
            out.WriteF32(v.b);
        }

        Color3 Color3Codec::Unpack(ByteReader& in) const
        {
            Color3 v;
            v.r = in.ReadF32();
            v.g = in.ReadF32();
            v.b = in.ReadF32();
            return v;
        }

        std::uint8_t ToChannelByte(float c)
        {
            if (std::isnan(c)) return 0;
            float scaled = std::round(c * 255.0f);
            return static_cast<std::uint8_t>(std::clamp(scaled, 0.0f, 255.0f));
        }

        void Color3uint8Codec::Pack(const Color3& v, ByteWriter& out) const
        {
            out.WriteU8(ToChannelByte(v.r));
            out.WriteU8(ToChannelByte(v.g));
            out.WriteU8(ToChannelByte(v.b));
        }

        Color3 Color3uint8Codec::Unpack(ByteReader& in) const
        {
            Color3 v;
            v.r = in.ReadU8() / 255.0f;
            v.g = in.ReadU8() / 255.0f;
            v.b = in.ReadU8() / 255.0f;
            return v;
        }

        void PhysicalPropertiesCodec::Pack(const PhysicalProperties& v, ByteWriter& out) const
        {
            out.WriteF32(v.density);
            out.WriteF32(v.friction);
            out.WriteF32(v.elasticity);
            out.WriteF32(v.frictionWeight);
            out.WriteF32(v.elasticityWeight);
        }

        PhysicalProperties PhysicalPropertiesCodec::Unpack(ByteReader& in) const
        {
            PhysicalProperties v;
            v.density = in.ReadF32();
            v.friction = in.ReadF32();
            v.elasticity = in.ReadF32();
            v.frictionWeight = in.ReadF32();
            v.elasticityWeight = in.ReadF32();
            return v;
        }

        // The whole value may be absent (material defaults); null maps to null both ways.
        class NullablePhysicalPropertiesCodec final : public PhysicalPropertiesCodec {
        public:
            EncodedValue Encode(const Value& value) const override
            {
                if (IsNull(value)) return EncodedValue{};
                return PhysicalPropertiesCodec::Encode(value);
            }
            Value Decode(const EncodedValue& encoded) const override
            {
                if (std::holds_alternative<std::monostate>(encoded)) return Value{};
                return PhysicalPropertiesCodec::Decode(encoded);
            }
        };

        void NumberSequenceCodec::Pack(const NumberSequence& v, ByteWriter& out) const
        {
            out.WriteU32(static_cast<std::uint32_t>(v.keypoints.size()));
            for (const auto& kp : v.keypoints) {
                out.WriteF32(kp.time);
                out.WriteF32(kp.value);
                out.WriteF32(kp.envelope);
            }
        }

        NumberSequence NumberSequenceCodec::Unpack(ByteReader& in) const
        {
            NumberSequence v;
            std::uint32_t count = in.ReadU32();
            if (static_cast<size_t>(count) * 12 != in.Remaining())
                throw MalformedInputError("NumberSequence: keypoint count does not match payload size");

            v.keypoints.reserve(count);
            for (std::uint32_t i = 0; i < count; ++i) {
                NumberSequenceKeypoint kp;
                kp.time = in.ReadF32();
                kp.value = in.ReadF32();
                kp.envelope = in.ReadF32();
                v.keypoints.push_back(kp);
            }
            return v;
        }

        void FontCodec::Pack(const Font& v, ByteWriter& out) const
        {
            out.WriteString(v.family);
            out.WriteString(v.weight);
            out.WriteString(v.style);
        }

        Font FontCodec::Unpack(ByteReader& in) const
        {
            Font v;
            v.family = in.ReadString();
            v.weight = in.ReadString();
            v.style = in.ReadString();
            return v;
        }

        void UDimCodec::Pack(const UDim& v, ByteWriter& out) const
        {
            out.WriteF32(v.scale);
            out.WriteF32(v.offset);
        }

        UDim UDimCodec::Unpack(ByteReader& in) const
        {
            UDim v;
            v.scale = in.ReadF32();
            v.offset = in.ReadF32();
            return v;
        }

        void UDim2Codec::Pack(const UDim2& v, ByteWriter& out) const
        {
            out.WriteF32(v.x.scale);
            out.WriteF32(v.x.offset);
            out.WriteF32(v.y.scale);
            out.WriteF32(v.y.offset);
        }

        UDim2 UDim2Codec::Unpack(ByteReader& in) const
        {
            UDim2 v;
            v.x.scale = in.ReadF32();
            v.x.offset = in.ReadF32();
            v.y.scale = in.ReadF32();
            v.y.offset = in.ReadF32();
            return v;
        }

        const std::unordered_map<std::string, ValueType>& TagLookup()
        {
            static const std::unordered_map<std::string, ValueType> lookup = {
                { "string", ValueType::String },
                { "Content", ValueType::String },
                { "ProtectedString", ValueType::String },
                { "bool", ValueType::Bool },
                { "boolean", ValueType::Bool },
                { "int", ValueType::Int },
                { "int64", ValueType::Int },
                { "float", ValueType::Float },
                { "double", ValueType::Float },
                { "number", ValueType::Float },
                { "NumberRange", ValueType::NumberRange },
                { "Vector2", ValueType::Vector2 },
                { "Vector3", ValueType::Vector3 },
                { "CFrame", ValueType::CFrame },
                { "BrickColor", ValueType::BrickColor },
                { "Color3", ValueType::Color3 },
                { "Color3uint8", ValueType::Color3uint8 },
                { "Enum", ValueType::Enum },
                { "EnumItem", ValueType::Enum },
                { "PhysicalProperties", ValueType::PhysicalProperties },
                { "NumberSequence", ValueType::NumberSequence },
                { "Font", ValueType::Font },
                { "UDim", ValueType::UDim },
                { "UDim2", ValueType::UDim2 },
            };
            return lookup;
        }

    } // namespace

    CodecRegistry::CodecRegistry(const EnumCatalog* enums)
    {
        auto add = [this](std::unique_ptr<ValueCodec> codec) {
            ValueType type = codec->GetType();
            codecs[type] = std::move(codec);
        };

        add(std::make_unique<StringCodec>());
        add(std::make_unique<BoolCodec>());
        add(std::make_unique<IntCodec>());
        add(std::make_unique<FloatCodec>());
        add(std::make_unique<NumberRangeCodec>());
        add(std::make_unique<Vector2Codec>());
        add(std::make_unique<Vector3Codec>());
        add(std::make_unique<CFrameCodec>());
        add(std::make_unique<BrickColorCodec>());
        add(std::make_unique<Color3Codec>());
        add(std::make_unique<Color3uint8Codec>());
        add(std::make_unique<EnumCodec>(enums));
        add(std::make_unique<NullablePhysicalPropertiesCodec>());
        add(std::make_unique<NumberSequenceCodec>());
        add(std::make_unique<FontCodec>());
        add(std::make_unique<UDimCodec>());
        add(std::make_unique<UDim2Codec>());
    }

    CodecRegistry::~CodecRegistry() = default;

    const ValueCodec* CodecRegistry::Find(ValueType type) const
    {
        auto it = codecs.find(type);
        return it == codecs.end() ? nullptr : it->second.get();
    }

    const ValueCodec* CodecRegistry::FindByTag(const std::string& typeTag) const
    {
        auto type = TypeFromTag(typeTag);
        return type ? Find(*type) : nullptr;
    }

    std::optional<ValueType> CodecRegistry::TypeFromTag(const std::string& typeTag)
    {
        const auto& lookup = TagLookup();
        auto it = lookup.find(typeTag);
        if (it == lookup.end()) return std::nullopt;
        return it->second;
    }

    std::optional<EncodedValue> CodecRegistry::EncodeValue(const std::string& typeTag, const Value& value, Diagnostics* diagnostics,
                                                           const std::string& className, const std::string& property) const
    {
        const ValueCodec* codec = FindByTag(typeTag);
        if (!codec) {
            auto scalar = ToEncodedScalar(value);
            if (scalar) {
                Diagnostics::Report(diagnostics, DiagnosticKind::UnknownType, className, property,
                                    "no codec for type '" + typeTag + "', passing value through");
                return scalar;
            }
            Diagnostics::Report(diagnostics, DiagnosticKind::UnknownType, className, property,
                                "no codec for type '" + typeTag + "', " + TypeOf(value) + " value written as null");
            return EncodedValue{};
        }

        try {
            return codec->Encode(value);
        }
        catch (const SerialError& e) {
            Diagnostics::Report(diagnostics, DiagnosticKind::EncodeFailure, className, property, e.what());
            return std::nullopt;
        }
    }

    std::optional<Value> CodecRegistry::DecodeValue(const std::string& typeTag, const EncodedValue& encoded, Diagnostics* diagnostics,
                                                    const std::string& className, const std::string& property) const
    {
        const ValueCodec* codec = FindByTag(typeTag);
        if (!codec) {
            Diagnostics::Report(diagnostics, DiagnosticKind::UnknownType, className, property,
                                "no codec for type '" + typeTag + "', passing value through");
            return ToValue(encoded);
        }

        try {
            return codec->Decode(encoded);
        }
        catch (const SerialError& e) {
            Diagnostics::Report(diagnostics, DiagnosticKind::DecodeFailure, className, property, e.what());
            return std::nullopt;
        }
    }

} // namespace Serial
