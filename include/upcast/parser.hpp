#pragma once
#include "upcast/edn.hpp"
#include "upcast/hierarchy.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace upcast {

struct ParseResult {
    bool success{false};
    Hierarchy hierarchy;       // valid only when success
    std::string code;          // E0100 / E0101 / E0102 when !success
    std::string error_message; // If !success, human-readable message
    int line{0};
    int column{0};
};

struct parse_error : std::runtime_error {
    parse_error(std::string code, const std::string& msg, int line, int col)
        : std::runtime_error(msg), code(std::move(code)), line(line), col(col) {}
    std::string code;
    int line;
    int col;
};

class Parser {
public:
    // Surface syntax: `[bindings] root { child { ... }, ... }, ...`
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
    // EDN syntax: `(hierarchy [bindings] A (B C (D E)))`
    ParseResult parse_edn(std::string_view src) const;
};

// Throwing conveniences over Parser.
Hierarchy parse_hierarchy(std::string_view src, std::string_view filename = "<memory>");
Hierarchy hierarchy_from_edn(const edn::node_ptr& form);

} // namespace upcast
