// Value types, constants and the return-value encoding.
#include <gtest/gtest.h>

#include "ndca/types.hpp"
#include "ndca/ir/return_encoding.hpp"

using namespace ndca;

TEST(Types, EqualityIncludesVectorLength){
    EXPECT_EQ(Type::integer(), Type::integer());
    EXPECT_NE(Type::integer(), Type::cell_state());
    EXPECT_EQ(Type::vector(3), Type::vector(3));
    EXPECT_NE(Type::vector(3), Type::vector(4));
    EXPECT_EQ(Type::vector(3).to_string(), "Vector[3]");
    EXPECT_EQ(Type::cell_state().to_string(), "CellState");
}

TEST(Types, DefaultValues){
    EXPECT_EQ(std::get<int32_t>(default_value(Type::integer())), 0);
    EXPECT_EQ(std::get<uint8_t>(default_value(Type::cell_state())), 0);
    auto v = std::get<std::vector<int32_t>>(default_value(Type::vector(4)));
    EXPECT_EQ(v, std::vector<int32_t>(4, 0));
    EXPECT_EQ(type_of(default_value(Type::vector(4))), Type::vector(4));
}

TEST(Types, VectorLengthBounds){
    EXPECT_TRUE(Type::integer().is_valid());
    EXPECT_TRUE(Type::vector(1).is_valid());
    EXPECT_TRUE(Type::vector(MAX_VECTOR_LEN).is_valid());
    EXPECT_FALSE(Type::vector(0).is_valid());
    EXPECT_FALSE(Type::vector(MAX_VECTOR_LEN + 1).is_valid());
}

TEST(Types, IntRange){
    EXPECT_TRUE(fits_int(INT_MAX_VALUE));
    EXPECT_TRUE(fits_int(INT_MIN_VALUE));
    EXPECT_FALSE(fits_int(INT_MAX_VALUE + 1));
    EXPECT_FALSE(fits_int(INT_MIN_VALUE - 1));
    EXPECT_EQ(INT_MAX_VALUE, 2147483647);
}

TEST(ReturnEncoding, ErrorBitAndIndex){
    uint64_t raw = encode_error_index(5);
    auto d = decode_return_value(raw);
    EXPECT_TRUE(d.is_error);
    EXPECT_EQ(d.payload, 5u);
    EXPECT_EQ(raw >> 63, 1u);

    auto ok = decode_return_value(42);
    EXPECT_FALSE(ok.is_error);
    EXPECT_EQ(ok.payload, 42u);
}

TEST(ReturnEncoding, NegativeIntsAreZeroExtended){
    // -1 as i32 zero-extended to i64 leaves bit 63 clear.
    uint64_t raw = uint64_t(0xFFFFFFFFu);
    auto d = decode_return_value(raw);
    ASSERT_FALSE(d.is_error);
    auto v = decode_result(d.payload, Type::integer());
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(std::get<int32_t>(*v), -1);
    auto cs = decode_result(3, Type::cell_state());
    ASSERT_TRUE(cs.has_value());
    EXPECT_EQ(std::get<uint8_t>(*cs), 3);
    EXPECT_FALSE(decode_result(0, Type::vector(2)).has_value());
}
