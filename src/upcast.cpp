#include "upcast/upcast.hpp"

#include <cstdio>

namespace upcast {

Generation generate(std::string_view src, const Env& env, std::string_view filename, InputSyntax syntax){
    Generation g;
    Parser parser;
    ParseResult pr = syntax == InputSyntax::Edn ? parser.parse_edn(src) : parser.parse_string(src, filename);
    if(!pr.success){
        ErrorReporter rep{g.result};
        const char* hint = "every '{' needs a matching '}' and siblings are separated by ','";
        if(pr.code=="E0101") hint = "start the description with a binding list, e.g. [] or ['a, T: Debug]";
        else if(pr.code=="E0102") hint = "write (hierarchy [bindings] root...) with nodes as atoms or (label child...) lists";
        rep.emit_error(ErrorReporter::make(pr.code, pr.error_message, hint, pr.line, pr.column));
        g.result.success = false;
    } else {
        g.hierarchy = std::move(pr.hierarchy);
        g.plan = build_plan(g.hierarchy, env.trace);
        if(env.lint){
            lint_duplicate_labels(g.result, g.hierarchy);
            lint_unused_bindings(g.result, g.plan);
        }
    }
    if(env.diagJson) std::fprintf(stderr, "%s\n", diagnostics_to_json(g.result).c_str());
    return g;
}

} // namespace upcast
