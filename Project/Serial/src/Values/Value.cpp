#include "pch.h"
#include "Values/Value.hpp"

namespace Serial {

    namespace {
        template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
    }

    bool IsScalar(const Value& v)
    {
        return std::holds_alternative<std::monostate>(v)
            || std::holds_alternative<bool>(v)
            || std::holds_alternative<std::int64_t>(v)
            || std::holds_alternative<double>(v)
            || std::holds_alternative<std::string>(v);
    }

    std::string TypeOf(const Value& v)
    {
        return std::visit(Overloaded{
            [](const std::monostate&) -> std::string { return "nil"; },
            [](bool) -> std::string { return "boolean"; },
            [](std::int64_t) -> std::string { return "int64"; },
            [](double) -> std::string { return "number"; },
            [](const std::string&) -> std::string { return "string"; },
            [](const NumberRange&) -> std::string { return "NumberRange"; },
            [](const Vector2&) -> std::string { return "Vector2"; },
            [](const Vector3&) -> std::string { return "Vector3"; },
            [](const CFrame&) -> std::string { return "CFrame"; },
            [](const BrickColor&) -> std::string { return "BrickColor"; },
            [](const Color3&) -> std::string { return "Color3"; },
            [](const EnumItem&) -> std::string { return "EnumItem"; },
            [](const PhysicalProperties&) -> std::string { return "PhysicalProperties"; },
            [](const NumberSequence&) -> std::string { return "NumberSequence"; },
            [](const Font&) -> std::string { return "Font"; },
            [](const UDim&) -> std::string { return "UDim"; },
            [](const UDim2&) -> std::string { return "UDim2"; },
            [](const ObjectRef&) -> std::string { return "Instance"; },
        }, v);
    }

    std::string ToString(const Value& v)
    {
        std::ostringstream os;
        std::visit(Overloaded{
            [&](const std::monostate&) { os << "nil"; },
            [&](bool b) { os << (b ? "true" : "false"); },
            [&](std::int64_t i) { os << i; },
            [&](double d) { os << d; },
            [&](const std::string& s) { os << '"' << s << '"'; },
            [&](const NumberRange& r) { os << "NumberRange(" << r.min << ", " << r.max << ")"; },
            [&](const Vector2& p) { os << "Vector2(" << p.x << ", " << p.y << ")"; },
            [&](const Vector3& p) { os << "Vector3(" << p.x << ", " << p.y << ", " << p.z << ")"; },
            [&](const CFrame& cf) {
                os << "CFrame(" << cf.position.x << ", " << cf.position.y << ", " << cf.position.z;
                for (int r = 0; r < 3; ++r)
                    for (int c = 0; c < 3; ++c)
                        os << ", " << GetRotationComponent(cf, r, c);
                os << ")";
            },
            [&](const BrickColor& bc) { os << "BrickColor(" << bc.name << ")"; },
            [&](const Color3& c) { os << "Color3(" << c.r << ", " << c.g << ", " << c.b << ")"; },
            [&](const EnumItem& e) { os << "Enum." << e.category << "." << e.name; },
            [&](const PhysicalProperties& p) {
                os << "PhysicalProperties(" << p.density << ", " << p.friction << ", " << p.elasticity
                   << ", " << p.frictionWeight << ", " << p.elasticityWeight << ")";
            },
            [&](const NumberSequence& s) { os << "NumberSequence(" << s.keypoints.size() << " keypoints)"; },
            [&](const Font& f) { os << "Font(" << f.family << ", " << f.weight << ", " << f.style << ")"; },
            [&](const UDim& u) { os << "UDim(" << u.scale << ", " << u.offset << ")"; },
            [&](const UDim2& u) { os << "UDim2(" << u.x.scale << ", " << u.x.offset << ", " << u.y.scale << ", " << u.y.offset << ")"; },
            [&](const ObjectRef& ref) { os << "Instance#" << ref.handle; },
        }, v);
        return os.str();
    }

    std::optional<std::int64_t> ToExactInt64(double d)
    {
        // 2^63 is exact as a double; int64 covers [-2^63, 2^63)
        constexpr double limit = 9223372036854775808.0;
        if (!std::isfinite(d) || std::trunc(d) != d) return std::nullopt;
        if (d < -limit || d >= limit) return std::nullopt;
        return static_cast<std::int64_t>(d);
    }

    float GetRotationComponent(const CFrame& cf, int row, int col)
    {
        return cf.rotation[col][row];
    }

    void SetRotationComponent(CFrame& cf, int row, int col, float value)
    {
        cf.rotation[col][row] = value;
    }

} // namespace Serial
