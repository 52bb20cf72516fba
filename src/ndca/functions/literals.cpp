#include "ndca/functions/literals.hpp"
#include "ndca/ir/compiler.hpp"

#include <llvm/IR/Constants.h>

namespace ndca::functions {

std::optional<IntLiteral> IntLiteral::try_new(UserFunction&, const Span& span, int64_t value, BuildResult& r){
    if(!fits_int(value)){
        fail(r, make_error(ErrorKind::IntegerLiteralOutOfRange, span,
                           "integer literal "+std::to_string(value)+" does not fit in "+std::to_string(INT_BITS)+" bits"));
        return std::nullopt;
    }
    return IntLiteral{static_cast<int32_t>(value)};
}

std::optional<Type> IntLiteral::check_args(const UserFunction&, const Span& span, const Args& args, BuildResult& r) const {
    if(!expect_arg_count("integer literal", span, args, 0, r)) return std::nullopt;
    return Type::integer();
}

std::optional<Value> IntLiteral::compile(Compiler& c, const UserFunction&, const Args&) const {
    return Value{Type::integer(), llvm::ConstantInt::get(c.int_type(), static_cast<uint64_t>(static_cast<int64_t>(value)), /*isSigned*/ true)};
}

std::optional<ConstValue> IntLiteral::const_eval(const UserFunction&, const Args&) const {
    return ConstValue{std::in_place_type<int32_t>, value};
}

} // namespace ndca::functions
