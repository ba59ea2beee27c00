#ifndef SUMMIT_FRONTEND_SUMMARY_READER_H
#define SUMMIT_FRONTEND_SUMMARY_READER_H

#include <gtest/gtest_prod.h>

#include "ir/call_stack.h"
#include "ir/constraint/constraint.h"
#include "ir/environment.h"
#include "ir/function_summary.h"
#include "ir/source_location.h"

#include "boost/optional.hpp"
#include "boost/property_tree/ptree.hpp"
#include "z3++.h"

#include <istream>
#include <map>
#include <memory>
#include <string>

class TestLibFrontend_Term_Test;

namespace frontend {
    /**
 * Reads the summaries emitted by the abstraction pass from XML. Every term is an SMT-LIB2 term over the variables
 * declared for the enclosing function or for the whole environment, e.g.
 *
 * <environment>
 *   <variable name="g" sort="Int"/>
 *   <struct name="Point"><field name="x" sort="Int"/></struct>
 *   <function name="f">
 *     <variable name="x" sort="Int"/>
 *     <argument>x</argument>
 *     <return>(+ x g)</return>
 *     <constraint kind="expression" origin="asserted" file="f.c" line="3" column="5">
 *       <condition>(> x 0)</condition>
 *     </constraint>
 *   </function>
 * </environment>
 */
    class SummaryReader {
    private:
        FRIEND_TEST(::TestLibFrontend, Term);

    public:
        // XXX default constructor disabled
        SummaryReader() = delete;
        // XXX copy constructor disabled
        SummaryReader(const SummaryReader &other) = delete;
        // XXX copy assignment disabled
        SummaryReader &operator=(const SummaryReader &) = delete;

        explicit SummaryReader(z3::context &context);

        std::unique_ptr<ir::Environment> fromXML(const std::string &path);

        std::unique_ptr<ir::Environment> fromXML(std::istream &is);

        // Struct declarations of the most recently read environment.
        const ir::TypeEnvironment &getTypeEnvironment() const;

    private:
        std::unique_ptr<ir::Environment> read(const boost::property_tree::ptree &property_tree);

        std::unique_ptr<ir::FunctionSummary> readFunction(const std::string &name,
                                                          const boost::property_tree::ptree &function_property,
                                                          const z3::func_decl_vector &global_declarations);

        std::unique_ptr<ir::Constraint> readConstraint(const boost::property_tree::ptree &constraint_property,
                                                       const z3::func_decl_vector &declarations);

        // Checks every call to a summarized function against the arity and the sorts of the callee.
        void validateCalls(const std::map<std::string, std::unique_ptr<ir::FunctionSummary>> &name_to_summary) const;

        ir::StructDecl readStruct(const boost::property_tree::ptree &struct_property);

        z3::func_decl readDeclaration(const boost::property_tree::ptree &variable_property);

        boost::optional<ir::SourceLocation> readLocation(const boost::property_tree::ptree &constraint_property) const;

        z3::sort readSort(const std::string &sort) const;

        // Parses an SMT-LIB2 term, boost::none for an empty term.
        boost::optional<z3::expr> parseTerm(const std::string &term, const z3::func_decl_vector &declarations);

    private:
        z3::context *const _context;
        ir::TypeEnvironment _type_environment;
    };
}// namespace frontend

#endif//SUMMIT_FRONTEND_SUMMARY_READER_H
