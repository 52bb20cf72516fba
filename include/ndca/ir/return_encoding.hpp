// Encoding of the wide return integer shared by generated code and the execution host.
//   bit 63 set   -> error; remaining bits are an index into the error-point table
//   bit 63 clear -> the remaining bits hold a result of the function's return type
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "ndca/types.hpp"

namespace ndca {

constexpr unsigned RETURN_BITS = 64;
constexpr uint64_t RETURN_ERROR_BIT = uint64_t(1) << (RETURN_BITS - 1);

struct DecodedReturn { bool is_error; uint64_t payload; };

inline uint64_t encode_error_index(size_t k){ return RETURN_ERROR_BIT | static_cast<uint64_t>(k); }

inline DecodedReturn decode_return_value(uint64_t raw){
    return DecodedReturn{ (raw & RETURN_ERROR_BIT) != 0, raw & ~RETURN_ERROR_BIT };
}

// Results are zero-extended into the return integer, so the low bits of the
// payload are the value. Vectors are not returned through this channel.
inline std::optional<ConstValue> decode_result(uint64_t payload, const Type& t){
    switch(t.kind){
        case Type::Kind::Int: return ConstValue{std::in_place_type<int32_t>, static_cast<int32_t>(static_cast<uint32_t>(payload))};
        case Type::Kind::CellState: return ConstValue{std::in_place_type<uint8_t>, static_cast<uint8_t>(payload)};
        case Type::Kind::Vector: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace ndca
