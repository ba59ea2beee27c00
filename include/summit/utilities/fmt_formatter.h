#ifndef SUMMIT_FMT_FORMATTER_H
#define SUMMIT_FMT_FORMATTER_H

#include "ir/call_stack.h"
#include "ir/constraint/constraint.h"
#include "ir/function_summary.h"
#include "ir/source_location.h"
#include "sym/variable.h"

#include "z3++.h"

#include "spdlog/fmt/fmt.h"

#include <iterator>
#include <memory>
#include <sstream>
#include <vector>

template<>
struct fmt::formatter<z3::expr> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const z3::expr &e, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", e.to_string());
    }
};

template<>
struct fmt::formatter<sym::Var> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const sym::Var &v, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", v.getName());
    }
};

template<>
struct fmt::formatter<ir::SourceLocation> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const ir::SourceLocation &l, FormatContext &ctx) const {
        std::stringstream str;
        str << l;
        return fmt::format_to(ctx.out(), "{}", str.str());
    }
};

template<>
struct fmt::formatter<ir::CallStack> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const ir::CallStack &s, FormatContext &ctx) const {
        std::stringstream str;
        str << s;
        return fmt::format_to(ctx.out(), "{}", str.str());
    }
};

template<>
struct fmt::formatter<ir::Constraint> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const ir::Constraint &c, FormatContext &ctx) const {
        std::stringstream str;
        str << c;
        return fmt::format_to(ctx.out(), "{}", str.str());
    }
};

template<>
struct fmt::formatter<ir::FunctionSummary> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const ir::FunctionSummary &s, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", s.prettyPrint());
    }
};

template<>
struct fmt::formatter<std::vector<std::unique_ptr<ir::Constraint>>> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const std::vector<std::unique_ptr<ir::Constraint>> &v, FormatContext &ctx) const {
        std::stringstream str;
        str << "[";
        for (auto it = v.begin(); it != v.end(); ++it) {
            str << "\n\t" << **it;
            if (std::next(it) != v.end()) {
                str << ",";
            }
        }
        str << "\n]";
        return fmt::format_to(ctx.out(), "{}", str.str());
    }
};

#endif//SUMMIT_FMT_FORMATTER_H
