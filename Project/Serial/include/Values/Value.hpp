#pragma once
/*********************************************************************************
* @File         Value.hpp
* @Brief        Closed set of property/attribute value types exchanged with the host
*               object model. Vector types are glm vectors; every other composite is a
*               small aggregate with value equality so default elision can compare a
*               live value against the cached class default with operator==.
*********************************************************************************/
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

#include "Serial.h"

namespace Serial {

    // Host object identity; 0 is never a live object.
    using ObjectHandle = std::uint64_t;
    constexpr ObjectHandle NullObject = 0;

    using Vector2 = glm::vec2;
    using Vector3 = glm::vec3;

    struct NumberRange {
        float min = 0.0f;
        float max = 0.0f;
        bool operator==(const NumberRange& o) const { return min == o.min && max == o.max; }
        bool operator!=(const NumberRange& o) const { return !(*this == o); }
    };

    // Position plus a rotation basis. rotation[c][r] follows glm's column-major storage;
    // the wire order is row-major R00 R01 R02 R10 ... (see ValueCodec).
    struct CFrame {
        glm::vec3 position{ 0.0f };
        glm::mat3 rotation{ 1.0f };
        bool operator==(const CFrame& o) const { return position == o.position && rotation == o.rotation; }
        bool operator!=(const CFrame& o) const { return !(*this == o); }
    };

    struct BrickColor {
        std::string name = "Medium stone grey";
        bool operator==(const BrickColor& o) const { return name == o.name; }
        bool operator!=(const BrickColor& o) const { return !(*this == o); }
    };

    // Channels in [0, 1]
    struct Color3 {
        float r = 0.0f;
        float g = 0.0f;
        float b = 0.0f;
        bool operator==(const Color3& o) const { return r == o.r && g == o.g && b == o.b; }
        bool operator!=(const Color3& o) const { return !(*this == o); }
    };

    // Identity is (category, name). value is filled from the enum catalogue when known.
    struct EnumItem {
        std::string category;
        std::string name;
        int value = 0;
        bool operator==(const EnumItem& o) const { return category == o.category && name == o.name; }
        bool operator!=(const EnumItem& o) const { return !(*this == o); }
    };

    struct PhysicalProperties {
        float density = 0.0f;
        float friction = 0.0f;
        float elasticity = 0.0f;
        float frictionWeight = 0.0f;
        float elasticityWeight = 0.0f;
        bool operator==(const PhysicalProperties& o) const {
            return density == o.density && friction == o.friction && elasticity == o.elasticity
                && frictionWeight == o.frictionWeight && elasticityWeight == o.elasticityWeight;
        }
        bool operator!=(const PhysicalProperties& o) const { return !(*this == o); }
    };

    struct NumberSequenceKeypoint {
        float time = 0.0f;
        float value = 0.0f;
        float envelope = 0.0f;
        bool operator==(const NumberSequenceKeypoint& o) const { return time == o.time && value == o.value && envelope == o.envelope; }
        bool operator!=(const NumberSequenceKeypoint& o) const { return !(*this == o); }
    };

    struct NumberSequence {
        std::vector<NumberSequenceKeypoint> keypoints;
        bool operator==(const NumberSequence& o) const { return keypoints == o.keypoints; }
        bool operator!=(const NumberSequence& o) const { return !(*this == o); }
    };

    struct Font {
        std::string family;
        std::string weight = "Regular";
        std::string style = "Normal";
        bool operator==(const Font& o) const { return family == o.family && weight == o.weight && style == o.style; }
        bool operator!=(const Font& o) const { return !(*this == o); }
    };

    struct UDim {
        float scale = 0.0f;
        float offset = 0.0f;
        bool operator==(const UDim& o) const { return scale == o.scale && offset == o.offset; }
        bool operator!=(const UDim& o) const { return !(*this == o); }
    };

    struct UDim2 {
        UDim x;
        UDim y;
        bool operator==(const UDim2& o) const { return x == o.x && y == o.y; }
        bool operator!=(const UDim2& o) const { return !(*this == o); }
    };

    // Reference to another object of the same host model. handle == NullObject means unset.
    struct ObjectRef {
        ObjectHandle handle = NullObject;
        bool operator==(const ObjectRef& o) const { return handle == o.handle; }
        bool operator!=(const ObjectRef& o) const { return !(*this == o); }
    };

    using Value = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        NumberRange,
        Vector2,
        Vector3,
        CFrame,
        BrickColor,
        Color3,
        EnumItem,
        PhysicalProperties,
        NumberSequence,
        Font,
        UDim,
        UDim2,
        ObjectRef>;

    inline bool IsNull(const Value& v) { return std::holds_alternative<std::monostate>(v); }

    // Scalars are the alternatives that map one-to-one onto JSON scalars.
    SERIAL_API bool IsScalar(const Value& v);

    // Runtime type tag of a value, as used for attributes.
    SERIAL_API std::string TypeOf(const Value& v);

    // Human readable rendering used in diagnostics.
    SERIAL_API std::string ToString(const Value& v);

    // Exact int64 for an integral double; std::nullopt when d is fractional, NaN, infinite or out of range.
    SERIAL_API std::optional<std::int64_t> ToExactInt64(double d);

    // Row-major accessors for the CFrame rotation basis.
    SERIAL_API float GetRotationComponent(const CFrame& cf, int row, int col);
    SERIAL_API void SetRotationComponent(CFrame& cf, int row, int col, float value);

} // namespace Serial
