#ifndef SUMMIT_IR_ENVIRONMENT_H
#define SUMMIT_IR_ENVIRONMENT_H

#include "ir/function_summary.h"

#include <boost/iterator/transform_iterator.hpp>

#include "z3++.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ir {
    // Ordered fields of a struct declaration.
    using StructDecl = std::vector<std::pair<std::string, z3::sort>>;

    using TypeEnvironment = std::map<std::string, StructDecl>;

    /**
 * Immutable map from function name to its summary, built once per analyzed module. All expressions of the summaries
 * live in the z3 context of the environment.
 */
    class Environment {
    private:
        using summary_map_t = std::map<std::string, std::unique_ptr<FunctionSummary>>;

    public:
        // XXX copy constructor disabled
        Environment(const Environment &other) = delete;
        // XXX copy assignment disabled
        Environment &operator=(const Environment &) = delete;

        Environment(z3::context &context, summary_map_t name_to_summary);

        z3::context &getContext() const;

        // Returns true, if a summary for the given name exists, else returns false.
        bool hasSummary(const std::string &name) const;

        // Returns nullptr for functions that have not been abstracted.
        const FunctionSummary *findSummary(const std::string &name) const;

        const FunctionSummary &getSummary(const std::string &name) const;

        std::size_t size() const;

        std::ostream &print(std::ostream &os) const;

        friend std::ostream &operator<<(std::ostream &os, const Environment &environment) {
            return environment.print(os);
        }

    private:
        struct getName {
            getName() = default;
            const std::string &operator()(const summary_map_t::value_type &pair) const {
                return pair.first;
            }
        };

    public:
        using const_name_it = boost::transform_iterator<getName, summary_map_t::const_iterator>;
        const_name_it namesBegin() const;
        const_name_it namesEnd() const;

    private:
        z3::context *const _context;
        const summary_map_t _name_to_summary;
    };
}// namespace ir

#endif//SUMMIT_IR_ENVIRONMENT_H
