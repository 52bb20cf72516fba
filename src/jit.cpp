#include "ndca/jit.hpp"
#include "ndca/diagnostics_json.hpp"
#include "ndca/ast/userfunc.hpp"
#include "ndca/ir/compiler.hpp"
#include "ndca/ir/pass_pipeline.hpp"
#include "ndca/ir/return_encoding.hpp"

#include <cstdint>
#include <cstdio>
#include <mutex>

#include <llvm/Config/llvm-config.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>

namespace ndca {

static void initialize_native_target(){
    static std::once_flag once;
    std::call_once(once, []{
        llvm::InitializeNativeTarget();
        llvm::InitializeNativeTargetAsmPrinter();
        llvm::InitializeNativeTargetAsmParser();
    });
}

std::unique_ptr<JitFunction> JitFunction::create(Compiler&& c, const UserFunction& uf, const std::string& name, BuildResult& r){
    auto forward_errors = [&]{
        for(const LangError& e : c.result().errors) fail(r, e);
        if(c.result().errors.empty()) fail(r, internal_error({}, "code generation failed for '"+name+"'"));
        maybe_print_json(r);
    };
    if(!uf.compile(c, name)){ forward_errors(); return nullptr; }
    if(c.env().verifyIR && !c.verify_module()){ forward_errors(); return nullptr; }
    if(!ir::run_pass_pipeline(c.module(), c.env())){
        fail(r, internal_error({}, "module failed verification after the pass pipeline"));
        return nullptr;
    }
    if(c.env().dumpIR) llvm::errs() << c.print_ir();

    initialize_native_target();
    auto jitExp = llvm::orc::LLJITBuilder().create();
    if(!jitExp){
        fail(r, internal_error({}, "failed to create JIT: "+llvm::toString(jitExp.takeError())));
        return nullptr;
    }

    std::unique_ptr<JitFunction> out(new JitFunction());
    out->jit_ = std::move(*jitExp);
    out->name_ = name;
    out->return_type_ = uf.return_type();
    out->error_points_ = uf.error_points();

    if(auto err = out->jit_->addIRModule(c.take_module())){
        fail(r, internal_error({}, "failed to add module to JIT: "+llvm::toString(std::move(err))));
        return nullptr;
    }
    auto sym = out->jit_->lookup(name);
    if(!sym){
        fail(r, internal_error({}, "lookup('"+name+"') failed: "+llvm::toString(sym.takeError())));
        return nullptr;
    }
#if LLVM_VERSION_MAJOR >= 15
    out->fn_ = sym->toPtr<RawFn>();
#else
    out->fn_ = reinterpret_cast<RawFn>(static_cast<uintptr_t>(sym->getAddress()));
#endif
    if(c.env().debugCodegen) std::fprintf(stderr, "[ndca] linked %s at %p\n", name.c_str(), (void*)out->fn_);
    return out;
}

CallResult JitFunction::call() const {
    CallResult res;
    DecodedReturn d = decode_return_value(fn_());
    if(d.is_error){
        res.error_index = static_cast<size_t>(d.payload);
        if(res.error_index < error_points_.size()) res.error = error_points_[res.error_index];
        else res.error = internal_error({}, "unknown error point "+std::to_string(res.error_index));
        return res;
    }
    res.value = decode_result(d.payload, return_type_);
    res.ok = res.value.has_value();
    if(!res.ok) res.error = unimplemented({}, "returning a "+return_type_.to_string());
    return res;
}

} // namespace ndca
