// Builds a small transition function from a hand-assembled syntax tree,
// prints its LLVM IR and runs it through the JIT.
//   usage: emit_rule_ir [n]
#include <cstdlib>
#include <iostream>

#include "ndca/ast/userfunc.hpp"
#include "ndca/diagnostics_json.hpp"
#include "ndca/ir/compiler.hpp"
#include "ndca/jit.hpp"
#include "ndca/syntax.hpp"

using namespace ndca;
namespace sx = ndca::syntax;

// n = <arg>
// x = n * 2
// x += 1
// if x > 6 { become #2 } else { become #(n % 2) }
static sx::StatementBlock rule_body(int64_t n){
    return {
        sx::set_var("n", sx::int_lit(n), Span{1, 1, 1, 6}),
        sx::set_var("x", sx::binary(sx::ident("n"), sx::OperatorToken::Asterisk, sx::int_lit(2), Span{2, 5, 2, 10}), Span{2, 1, 2, 10}),
        sx::set_var(sx::ident("x"), sx::AssignOp::Plus, sx::int_lit(1), Span{3, 1, 3, 7}),
        sx::if_else(sx::cmp({sx::ident("x"), sx::int_lit(6)}, {sx::ComparisonToken::Gt}, Span{4, 4, 4, 9}),
            {sx::become(sx::unary(sx::OperatorToken::Tag, sx::int_lit(2)), Span{4, 12, 4, 21})},
            {sx::become(sx::unary(sx::OperatorToken::Tag,
                 sx::paren(sx::binary(sx::ident("n"), sx::OperatorToken::Percent, sx::int_lit(2)))), Span{4, 32, 4, 47})},
            Span{4, 1, 4, 49}),
    };
}

int main(int argc, char** argv){
    int64_t n = argc > 1 ? std::strtoll(argv[1], nullptr, 10) : 3;
    UserFunction uf = UserFunction::new_transition_function(make_rule_meta(2, 1, 3));
    BuildResult r;
    if(!uf.build_body(rule_body(n), r)){
        std::cerr << build_result_to_json(r) << "\n";
        return 1;
    }

    {
        Compiler c("emit_rule_ir");
        if(!uf.compile(c, "transition")){ std::cerr << build_result_to_json(c.result()) << "\n"; return 1; }
        std::cout << c.print_ir();
    }

    auto jit = JitFunction::create(Compiler("emit_rule_ir"), uf, "transition", r);
    if(!jit){ std::cerr << build_result_to_json(r) << "\n"; return 1; }
    CallResult res = jit->call();
    if(!res.ok){
        std::cout << "Error: " << error_point_to_json(res.error_index, *res.error) << "\n";
        return 2;
    }
    std::cout << "Result: #" << unsigned(std::get<uint8_t>(*res.value)) << "\n";
    return 0;
}
