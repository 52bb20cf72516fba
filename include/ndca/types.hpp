// Value types of the rule language and compile-time constants.
#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ndca
{

    // Bit width of the signed integer type.
    constexpr unsigned INT_BITS = 32;
    // Bit width of a cell state ID.
    constexpr unsigned CELL_STATE_BITS = 8;
    // Longest vector type accepted.
    constexpr unsigned MAX_VECTOR_LEN = 256;

    constexpr int64_t INT_MIN_VALUE = -(int64_t(1) << (INT_BITS - 1));
    constexpr int64_t INT_MAX_VALUE = (int64_t(1) << (INT_BITS - 1)) - 1;

    struct Type
    {
        enum class Kind
        {
            Int,
            CellState,
            Vector
        } kind = Kind::Int;
        unsigned vector_len{0}; // Vector

        static Type integer() { return Type{Kind::Int, 0}; }
        static Type cell_state() { return Type{Kind::CellState, 0}; }
        static Type vector(unsigned len) { return Type{Kind::Vector, len}; }

        bool is_int() const { return kind == Kind::Int; }
        bool is_cell_state() const { return kind == Kind::CellState; }
        bool is_vector() const { return kind == Kind::Vector; }
        // Vector lengths are 1 through MAX_VECTOR_LEN.
        bool is_valid() const { return kind != Kind::Vector || (vector_len >= 1 && vector_len <= MAX_VECTOR_LEN); }

        std::string to_string() const
        {
            switch (kind)
            {
            case Kind::Int:
                return "Int";
            case Kind::CellState:
                return "CellState";
            case Kind::Vector:
                return "Vector[" + std::to_string(vector_len) + "]";
            }
            return "?";
        }
    };

    inline bool operator==(const Type &a, const Type &b)
    {
        if (a.kind != b.kind)
            return false;
        return a.kind != Type::Kind::Vector || a.vector_len == b.vector_len;
    }
    inline bool operator!=(const Type &a, const Type &b) { return !(a == b); }

    // Compile-time value. Alternatives map one-to-one onto Type::Kind.
    using ConstValue = std::variant<int32_t, uint8_t, std::vector<int32_t>>;

    inline Type type_of(const ConstValue &v)
    {
        if (std::holds_alternative<int32_t>(v))
            return Type::integer();
        if (std::holds_alternative<uint8_t>(v))
            return Type::cell_state();
        return Type::vector(static_cast<unsigned>(std::get<std::vector<int32_t>>(v).size()));
    }

    // Zero value of a type; also the initial value of every variable.
    inline ConstValue default_value(const Type &t)
    {
        switch (t.kind)
        {
        case Type::Kind::Int:
            return ConstValue{std::in_place_type<int32_t>, 0};
        case Type::Kind::CellState:
            return ConstValue{std::in_place_type<uint8_t>, uint8_t{0}};
        case Type::Kind::Vector:
            return ConstValue{std::in_place_type<std::vector<int32_t>>, std::vector<int32_t>(t.vector_len, 0)};
        }
        return ConstValue{std::in_place_type<int32_t>, 0};
    }

    inline bool fits_int(int64_t v) { return v >= INT_MIN_VALUE && v <= INT_MAX_VALUE; }

} // namespace ndca
