#include "ndca/errors.hpp"

namespace ndca {

const char* error_code(ErrorKind kind){
    switch(kind){
        case ErrorKind::UseOfUninitializedVariable: return "E2000";
        case ErrorKind::BecomeInHelperFunction: return "E2001";
        case ErrorKind::ReturnInTransitionFunction: return "E2002";
        case ErrorKind::Expected: return "E2003";
        case ErrorKind::ExpectedGot: return "E2004";
        case ErrorKind::TypeError: return "E2005";
        case ErrorKind::InvalidComparison: return "E2006";
        case ErrorKind::Unimplemented: return "E2007";
        case ErrorKind::IntegerLiteralOutOfRange: return "E2008";
        case ErrorKind::InternalError: return "E2099";
        case ErrorKind::IntegerOverflow: return "E3000";
        case ErrorKind::DivideByZero: return "E3001";
        case ErrorKind::CellStateOutOfRange: return "E3002";
        case ErrorKind::NegativeExponent: return "E3003";
        case ErrorKind::BitshiftOutOfRange: return "E3004";
    }
    return "E2099";
}

bool is_runtime_error(ErrorKind kind){
    switch(kind){
        case ErrorKind::IntegerOverflow:
        case ErrorKind::DivideByZero:
        case ErrorKind::CellStateOutOfRange:
        case ErrorKind::NegativeExponent:
        case ErrorKind::BitshiftOutOfRange:
            return true;
        default:
            return false;
    }
}

LangError make_error(ErrorKind kind, const Span& span, std::string message, std::string hint){
    return LangError{kind, error_code(kind), std::move(message), std::move(hint), span};
}

LangError use_of_uninitialized_variable(const Span& span, const std::string& name){
    return make_error(ErrorKind::UseOfUninitializedVariable, span,
                      "use of uninitialized variable '"+name+"'",
                      "assign a value to '"+name+"' before reading it");
}

LangError expected(const Span& span, const std::string& what){
    return make_error(ErrorKind::Expected, span, "expected "+what);
}

LangError expected_got(const Span& span, const std::string& exp, const std::string& got){
    return make_error(ErrorKind::ExpectedGot, span, "expected "+exp+"; got "+got);
}

LangError type_error(const Span& span, const Type& exp, const Type& got){
    return make_error(ErrorKind::TypeError, span,
                      "type error: expected "+exp.to_string()+"; got "+got.to_string(),
                      "ensure the expression has type "+exp.to_string());
}

LangError unimplemented(const Span& span, const std::string& what){
    return make_error(ErrorKind::Unimplemented, span, what+" is not implemented");
}

LangError internal_error(const Span& span, const std::string& what){
    return make_error(ErrorKind::InternalError, span, "internal compiler error: "+what);
}

} // namespace ndca
