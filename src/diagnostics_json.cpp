#include "ndca/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace ndca {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_span_json(std::ostringstream& os, const Span& sp){
    os<<"\"line\":"<<sp.line
      <<",\"col\":"<<sp.col
      <<",\"end_line\":"<<sp.end_line
      <<",\"end_col\":"<<sp.end_col;
}

std::string error_to_json(const LangError& e){
    std::ostringstream os;
    os<<"{"
        "\"code\":"<<json_escape(e.code)
        <<",\"message\":"<<json_escape(e.message)
        <<",\"hint\":"<<json_escape(e.hint)
        <<",\"runtime\":"<<(is_runtime_error(e.kind)?"true":"false")
        <<",";
    append_span_json(os, e.span);
    os<<"}";
    return os.str();
}

std::string build_result_to_json(const BuildResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){
        if(i) os<<",";
        os<<error_to_json(r.errors[i]);
    }
    os<<"]}";
    return os.str();
}

std::string error_point_to_json(size_t index, const LangError& e){
    std::ostringstream os;
    os<<"{\"error_point\":"<<index<<",\"error\":"<<error_to_json(e)<<"}";
    return os.str();
}

void maybe_print_json(const BuildResult& r){
    if(const char* env = std::getenv("NDCA_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=build_result_to_json(r);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace ndca
