#include "frontend/summary_reader.h"
#include "ir/constraint/call_constraint.h"
#include "ir/constraint/expression_constraint.h"
#include "sym/variable.h"
#include "utilities/fmt_formatter.h"

#include "boost/algorithm/string/trim.hpp"
#include "boost/property_tree/xml_parser.hpp"

#include "spdlog/spdlog.h"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace frontend;

SummaryReader::SummaryReader(z3::context &context) : _context(&context) {}

std::unique_ptr<ir::Environment> SummaryReader::fromXML(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Could not open summary file " + path + ".");
    }
    return fromXML(file);
}

std::unique_ptr<ir::Environment> SummaryReader::fromXML(std::istream &is) {
    boost::property_tree::ptree property_tree;
    try {
        boost::property_tree::read_xml(is, property_tree);
    } catch (const boost::property_tree::xml_parser_error &error) {
        throw std::runtime_error(std::string("Malformed summary file: ") + error.what());
    }
    return read(property_tree);
}

const ir::TypeEnvironment &SummaryReader::getTypeEnvironment() const {
    return _type_environment;
}

std::unique_ptr<ir::Environment> SummaryReader::read(const boost::property_tree::ptree &property_tree) {
    auto logger = spdlog::get("Frontend");
    _type_environment.clear();
    z3::func_decl_vector global_declarations(*_context);
    std::map<std::string, std::unique_ptr<ir::FunctionSummary>> name_to_summary;
    boost::optional<const boost::property_tree::ptree &> environment = property_tree.get_child_optional("environment");
    if (!environment) {
        throw std::runtime_error("Summary file has no environment.");
    }
    for (const boost::property_tree::ptree::value_type &environment_property : *environment) {
        if (environment_property.first == "<xmlattr>" || environment_property.first == "<xmlcomment>") {
            // XXX do nothing
            continue;
        } else if (environment_property.first == "variable") {
            global_declarations.push_back(readDeclaration(environment_property.second));
        } else if (environment_property.first == "struct") {
            auto name = environment_property.second.get<std::string>("<xmlattr>.name");
            _type_environment.insert_or_assign(name, readStruct(environment_property.second));
        } else if (environment_property.first == "function") {
            auto name = environment_property.second.get<std::string>("<xmlattr>.name");
            if (name_to_summary.find(name) != name_to_summary.end()) {
                throw std::runtime_error("Duplicate summary for function " + name + ".");
            }
            std::unique_ptr<ir::FunctionSummary> function_summary =
                    readFunction(name, environment_property.second, global_declarations);
            SPDLOG_LOGGER_TRACE(logger, "{}: {}", name, *function_summary);
            name_to_summary.emplace(name, std::move(function_summary));
        } else {
            throw std::runtime_error("Unexpected environment property \"" + environment_property.first + "\".");
        }
    }
    validateCalls(name_to_summary);
    SPDLOG_LOGGER_INFO(logger, "Read {} summaries and {} struct declarations.", name_to_summary.size(),
                       _type_environment.size());
    return std::make_unique<ir::Environment>(*_context, std::move(name_to_summary));
}

std::unique_ptr<ir::FunctionSummary>
SummaryReader::readFunction(const std::string &name, const boost::property_tree::ptree &function_property,
                            const z3::func_decl_vector &global_declarations) {
    z3::func_decl_vector declarations(*_context);
    for (unsigned i = 0; i < global_declarations.size(); ++i) {
        declarations.push_back(global_declarations[i]);
    }
    std::vector<boost::optional<z3::expr>> argument_expressions;
    boost::optional<z3::expr> return_expression;
    std::vector<std::unique_ptr<ir::Constraint>> constraints;
    for (const boost::property_tree::ptree::value_type &property : function_property) {
        if (property.first == "<xmlattr>" || property.first == "<xmlcomment>") {
            // XXX do nothing
            continue;
        } else if (property.first == "variable") {
            declarations.push_back(readDeclaration(property.second));
        } else if (property.first == "argument") {
            argument_expressions.push_back(parseTerm(property.second.data(), declarations));
        } else if (property.first == "return") {
            if (return_expression.has_value()) {
                throw std::runtime_error("Function " + name + " has more than one return expression.");
            }
            return_expression = parseTerm(property.second.data(), declarations);
        } else if (property.first == "constraint") {
            constraints.push_back(readConstraint(property.second, declarations));
        } else {
            throw std::runtime_error("Unexpected property \"" + property.first + "\" of function " + name + ".");
        }
    }
    return std::make_unique<ir::FunctionSummary>(std::move(argument_expressions), std::move(return_expression),
                                                 std::move(constraints));
}

std::unique_ptr<ir::Constraint> SummaryReader::readConstraint(const boost::property_tree::ptree &constraint_property,
                                                              const z3::func_decl_vector &declarations) {
    auto kind = constraint_property.get<std::string>("<xmlattr>.kind");
    std::shared_ptr<const ir::CallStack> call_stack =
            ir::CallStack::makeFrame(readLocation(constraint_property), ir::CallStack::makeTop());
    boost::optional<z3::expr> assumption =
            parseTerm(constraint_property.get<std::string>("assuming", ""), declarations);
    if (!assumption.has_value()) {
        assumption = _context->bool_val(true);
    }
    if (kind == "expression") {
        auto origin_name = constraint_property.get<std::string>("<xmlattr>.origin", "implied");
        ir::ExpressionConstraint::Origin origin;
        if (origin_name == "asserted") {
            origin = ir::ExpressionConstraint::Origin::ASSERTED;
        } else if (origin_name == "implied") {
            origin = ir::ExpressionConstraint::Origin::IMPLIED;
        } else {
            throw std::runtime_error("Unexpected constraint origin \"" + origin_name + "\".");
        }
        boost::optional<z3::expr> condition =
                parseTerm(constraint_property.get<std::string>("condition", ""), declarations);
        if (!condition.has_value()) {
            throw std::runtime_error("Expression constraint without condition.");
        }
        return std::make_unique<ir::ExpressionConstraint>(*condition, *assumption, origin, std::move(call_stack));
    } else if (kind == "call") {
        auto callee = constraint_property.get<std::string>("<xmlattr>.callee");
        std::vector<boost::optional<z3::expr>> arguments;
        for (const boost::property_tree::ptree::value_type &property : constraint_property) {
            if (property.first == "argument") {
                arguments.push_back(parseTerm(property.second.data(), declarations));
            }
        }
        boost::optional<sym::Var> result;
        boost::optional<z3::expr> z3_result =
                parseTerm(constraint_property.get<std::string>("<xmlattr>.result", ""), declarations);
        if (z3_result.has_value()) {
            if (!sym::Var::isVariable(*z3_result)) {
                throw std::runtime_error("Result of call to " + callee + " is not a variable.");
            }
            result = sym::Var(*z3_result);
        }
        return std::make_unique<ir::CallConstraint>(std::move(callee), std::move(arguments), std::move(result),
                                                    *assumption, std::move(call_stack));
    } else {
        throw std::runtime_error("Unexpected constraint kind \"" + kind + "\".");
    }
}

void SummaryReader::validateCalls(
        const std::map<std::string, std::unique_ptr<ir::FunctionSummary>> &name_to_summary) const {
    for (const auto &name_to_summary_pair : name_to_summary) {
        for (const std::unique_ptr<ir::Constraint> &constraint : name_to_summary_pair.second->getConstraints()) {
            if (constraint->getKind() != ir::Constraint::Kind::CALL) {
                continue;
            }
            const auto &call_constraint = dynamic_cast<const ir::CallConstraint &>(*constraint);
            auto it = name_to_summary.find(call_constraint.getCallee());
            if (it == name_to_summary.end()) {
                // XXX calls to functions without summary stay opaque
                continue;
            }
            std::stringstream call_site;
            call_site << "call to " << call_constraint.getCallee() << " in " << name_to_summary_pair.first;
            if (call_constraint.getCallStack()->getLocation().has_value()) {
                call_site << " at " << *call_constraint.getCallStack()->getLocation();
            }
            const ir::FunctionSummary &callee_summary = *it->second;
            const std::vector<boost::optional<z3::expr>> &arguments = call_constraint.getArguments();
            if (arguments.size() != callee_summary.getArity()) {
                throw std::runtime_error("Arity mismatch in " + call_site.str() + ": expected " +
                                         std::to_string(callee_summary.getArity()) + " arguments, but got " +
                                         std::to_string(arguments.size()) + ".");
            }
            const std::vector<boost::optional<z3::expr>> &formals = callee_summary.getArgumentExpressions();
            for (std::vector<boost::optional<z3::expr>>::size_type i = 0; i < arguments.size(); ++i) {
                if (arguments.at(i).has_value() && formals.at(i).has_value() &&
                    !z3::eq(arguments.at(i)->get_sort(), formals.at(i)->get_sort())) {
                    throw std::runtime_error("Sort mismatch of argument " + std::to_string(i) + " in " +
                                             call_site.str() + ".");
                }
            }
            const boost::optional<sym::Var> &result = call_constraint.getResult();
            const boost::optional<z3::expr> &return_expression = callee_summary.getReturnExpression();
            if (result.has_value() && return_expression.has_value() &&
                !z3::eq(result->getSort(), return_expression->get_sort())) {
                throw std::runtime_error("Sort mismatch of the result in " + call_site.str() + ".");
            }
        }
    }
}

ir::StructDecl SummaryReader::readStruct(const boost::property_tree::ptree &struct_property) {
    ir::StructDecl struct_decl;
    for (const boost::property_tree::ptree::value_type &property : struct_property) {
        if (property.first == "field") {
            auto name = property.second.get<std::string>("<xmlattr>.name");
            auto sort = property.second.get<std::string>("<xmlattr>.sort");
            struct_decl.emplace_back(std::move(name), readSort(sort));
        }
    }
    return struct_decl;
}

z3::func_decl SummaryReader::readDeclaration(const boost::property_tree::ptree &variable_property) {
    auto name = variable_property.get<std::string>("<xmlattr>.name");
    auto sort = variable_property.get<std::string>("<xmlattr>.sort");
    return _context->constant(name.c_str(), readSort(sort)).decl();
}

boost::optional<ir::SourceLocation>
SummaryReader::readLocation(const boost::property_tree::ptree &constraint_property) const {
    boost::optional<std::string> file = constraint_property.get_optional<std::string>("<xmlattr>.file");
    if (!file.has_value()) {
        return boost::none;
    }
    auto line = constraint_property.get<unsigned int>("<xmlattr>.line", 0);
    auto column = constraint_property.get<unsigned int>("<xmlattr>.column", 0);
    return ir::SourceLocation(*file, line, column);
}

z3::sort SummaryReader::readSort(const std::string &sort) const {
    if (sort == "Int") {
        return _context->int_sort();
    } else if (sort == "Bool") {
        return _context->bool_sort();
    } else if (sort == "Real") {
        return _context->real_sort();
    } else {
        throw std::runtime_error("Unsupported sort \"" + sort + "\".");
    }
}

boost::optional<z3::expr> SummaryReader::parseTerm(const std::string &term,
                                                   const z3::func_decl_vector &declarations) {
    std::string trimmed_term = boost::algorithm::trim_copy(term);
    if (trimmed_term.empty()) {
        return boost::none;
    }
    // XXX z3 only parses complete scripts, the term is extracted from a trivial equality of sort-independent shape
    std::string script = "(assert (= " + trimmed_term + " " + trimmed_term + "))";
    z3::sort_vector sorts(*_context);
    try {
        z3::expr_vector assertions = _context->parse_string(script.c_str(), sorts, declarations);
        if (assertions.size() != 1) {
            throw std::runtime_error("Term \"" + trimmed_term + "\" does not denote a single expression.");
        }
        return assertions[0].arg(0);
    } catch (const z3::exception &exception) {
        throw std::runtime_error("Could not parse term \"" + trimmed_term + "\": " + exception.msg());
    }
}
