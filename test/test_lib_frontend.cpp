#include <gtest/gtest.h>

#include "analysis/analyzer.h"
#include "analysis/configuration.h"
#include "analysis/constraint_instantiator.h"
#include "frontend/summary_reader.h"
#include "ir/constraint/call_constraint.h"
#include "ir/constraint/expression_constraint.h"
#include "ir/environment.h"

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "z3++.h"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace frontend;

class TestLibFrontend : public ::testing::Test {
public:
    TestLibFrontend() : ::testing::Test() {}

protected:
    void SetUp() override {
        for (const std::string &name : {"Frontend", "Instantiation", "Analysis"}) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);

            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("logs/" + name + ".txt", true);
            file_sink->set_level(spdlog::level::trace);

            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(console_sink);
            sinks.push_back(file_sink);

            auto logger = std::make_shared<spdlog::logger>(name, std::begin(sinks), std::end(sinks));
            logger->set_level(spdlog::level::trace);

            spdlog::register_logger(logger);
        }
    }

    void TearDown() override {
        spdlog::drop("Frontend");
        spdlog::drop("Instantiation");
        spdlog::drop("Analysis");
    }

    std::unique_ptr<ir::Environment> fromString(const std::string &xml) {
        SummaryReader summary_reader(_context);
        std::istringstream is(xml);
        return summary_reader.fromXML(is);
    }

    z3::context _context;
};

TEST_F(TestLibFrontend, Term) {
    SummaryReader summary_reader(_context);
    z3::expr x = _context.int_const("x");
    z3::expr b = _context.bool_const("b");
    z3::func_decl_vector declarations(_context);
    declarations.push_back(x.decl());
    declarations.push_back(b.decl());

    ASSERT_TRUE(z3::eq(*summary_reader.parseTerm("  (+ x 1)\n", declarations), x + 1));
    ASSERT_TRUE(z3::eq(*summary_reader.parseTerm("b", declarations), b));
    ASSERT_TRUE(summary_reader.parseTerm("true", declarations)->is_true());
    ASSERT_FALSE(summary_reader.parseTerm("", declarations).has_value());
    ASSERT_FALSE(summary_reader.parseTerm(" \n\t ", declarations).has_value());
    ASSERT_THROW(summary_reader.parseTerm("(+ x", declarations), std::runtime_error);
    ASSERT_THROW(summary_reader.parseTerm("(+ y 1)", declarations), std::runtime_error);
}

TEST_F(TestLibFrontend, Environment) {
    SummaryReader summary_reader(_context);
    std::unique_ptr<ir::Environment> environment = summary_reader.fromXML("file/summary_abs.xml");
    ASSERT_EQ(environment->size(), 2);
    std::vector<std::string> names(environment->namesBegin(), environment->namesEnd());
    ASSERT_EQ(names, (std::vector<std::string>{"abs", "main"}));

    const ir::TypeEnvironment &type_environment = summary_reader.getTypeEnvironment();
    ASSERT_EQ(type_environment.size(), 1);
    const ir::StructDecl &point = type_environment.at("Point");
    ASSERT_EQ(point.size(), 2);
    ASSERT_EQ(point.at(0).first, "x");
    ASSERT_TRUE(point.at(0).second.is_int());
    ASSERT_EQ(point.at(1).first, "y");
    ASSERT_TRUE(point.at(1).second.is_real());

    const ir::FunctionSummary &abs_summary = environment->getSummary("abs");
    ASSERT_EQ(abs_summary.getSignature(), "(v) -> ret");
    ASSERT_EQ(abs_summary.getConstraints().size(), 2);
    const auto &definition = dynamic_cast<const ir::ExpressionConstraint &>(*abs_summary.getConstraints().at(0));
    ASSERT_EQ(definition.getOrigin(), ir::ExpressionConstraint::Origin::IMPLIED);
    ASSERT_TRUE(definition.getAssumption().is_true());
    ASSERT_EQ(*definition.getCallStack()->getLocation(), ir::SourceLocation("abs.c", 3, 9));
    const auto &assertion = dynamic_cast<const ir::ExpressionConstraint &>(*abs_summary.getConstraints().at(1));
    ASSERT_EQ(assertion.getOrigin(), ir::ExpressionConstraint::Origin::ASSERTED);
    ASSERT_TRUE(z3::eq(assertion.getCondition(), _context.int_const("ret") >= 0));

    const ir::FunctionSummary &main_summary = environment->getSummary("main");
    ASSERT_EQ(main_summary.getSignature(), "(n, *) -> *");
    ASSERT_EQ(main_summary.getConstraints().size(), 3);
    ASSERT_EQ(main_summary.getConstraints().at(0)->getKind(), ir::Constraint::Kind::CALL);
    const auto &call = dynamic_cast<const ir::CallConstraint &>(*main_summary.getConstraints().at(0));
    ASSERT_EQ(call.getCallee(), "abs");
    ASSERT_EQ(call.getResult()->getName(), "m");
    ASSERT_EQ(call.getArguments().size(), 1);
    ASSERT_TRUE(z3::eq(*call.getArguments().at(0), _context.int_const("n") - 1));
    ASSERT_TRUE(z3::eq(call.getAssumption(), _context.int_const("n") > _context.int_const("g_count")));
    ASSERT_EQ(*call.getCallStack()->getLocation(), ir::SourceLocation("main.c", 7, 13));
    const auto &opaque_call = dynamic_cast<const ir::CallConstraint &>(*main_summary.getConstraints().at(1));
    ASSERT_EQ(opaque_call.getCallee(), "printf");
    ASSERT_FALSE(opaque_call.getResult().has_value());
    ASSERT_EQ(opaque_call.getArguments().size(), 1);
    ASSERT_FALSE(opaque_call.getArguments().at(0).has_value());
}

TEST_F(TestLibFrontend, Instantiation) {
    SummaryReader summary_reader(_context);
    std::unique_ptr<ir::Environment> environment = summary_reader.fromXML("file/summary_abs.xml");
    std::vector<std::unique_ptr<ir::Constraint>> constraints = analysis::instantiate("main", *environment);
    // bindings of main and abs, both constraints of abs, binding of the result of abs and the unresolved assert
    ASSERT_EQ(constraints.size(), 6);
    const auto &result_binding = dynamic_cast<const ir::ExpressionConstraint &>(*constraints.at(4));
    ASSERT_TRUE(z3::eq(result_binding.getCondition(), _context.int_const("%5") == _context.int_const("%4")));
    ASSERT_EQ(*result_binding.getCallStack()->getLocation(), ir::SourceLocation("main.c", 7, 13));

    std::unique_ptr<ir::Environment> recursive_environment = summary_reader.fromXML("file/summary_recursion.xml");
    ASSERT_EQ(analysis::instantiate("even", *recursive_environment).size(), 5);
    ASSERT_EQ(analysis::instantiate("odd", *recursive_environment).size(), 5);
}

TEST_F(TestLibFrontend, Analyzer) {
    SummaryReader summary_reader(_context);
    std::unique_ptr<ir::Environment> environment = summary_reader.fromXML("file/summary_abs.xml");
    auto configuration = std::make_unique<analysis::Configuration>();
    configuration->_entries = std::vector<std::string>{"main"};
    configuration->_check_satisfiability = true;
    analysis::Analyzer analyzer(std::move(configuration), *environment);
    analyzer.run();

    const std::vector<analysis::Warning> &warnings = analyzer.getWarnings().at("main");
    ASSERT_EQ(warnings.size(), 1);
    std::stringstream str;
    str << warnings.at(0);
    ASSERT_EQ(str.str(), "main.c:9:5: warning: Failed to parse the assert condition");
    ASSERT_EQ(analyzer.getCheckResults().at("main"), z3::sat);
}

TEST_F(TestLibFrontend, MalformedSummaries) {
    SummaryReader summary_reader(_context);
    ASSERT_THROW(summary_reader.fromXML("file/does_not_exist.xml"), std::runtime_error);
    ASSERT_THROW(summary_reader.fromXML("file/summary_unsupported_sort.xml"), std::runtime_error);
    ASSERT_THROW(summary_reader.fromXML("file/summary_sort_mismatch.xml"), std::runtime_error);

    ASSERT_THROW(fromString("<environment><function name=\"f\">"), std::runtime_error);
    ASSERT_THROW(fromString("<module/>"), std::runtime_error);
    ASSERT_THROW(fromString("<environment><function/></environment>"), std::runtime_error);
    ASSERT_THROW(fromString("<environment><function name=\"f\"/><function name=\"f\"/></environment>"),
                 std::runtime_error);
    ASSERT_THROW(fromString("<environment><function name=\"f\"><return>1</return><return>2</return></function>"
                            "</environment>"),
                 std::runtime_error);
    ASSERT_THROW(fromString("<environment><function name=\"f\"><constraint kind=\"loop\"/></function>"
                            "</environment>"),
                 std::runtime_error);
    ASSERT_THROW(fromString("<environment><function name=\"f\"><constraint kind=\"expression\"/></function>"
                            "</environment>"),
                 std::runtime_error);
    ASSERT_THROW(fromString("<environment><function name=\"f\"><variable name=\"x\" sort=\"Int\"/>"
                            "<constraint kind=\"call\" callee=\"g\" result=\"(+ x 1)\"/></function></environment>"),
                 std::runtime_error);

    std::unique_ptr<ir::Environment> environment = fromString("<environment/>");
    ASSERT_EQ(environment->size(), 0);
}

TEST_F(TestLibFrontend, CallSignatures) {
    const std::string callee = "<function name=\"g\"><variable name=\"b\" sort=\"Bool\"/>"
                               "<variable name=\"r\" sort=\"Bool\"/><argument>b</argument><return>r</return>"
                               "</function>";
    const std::string caller_prefix = "<function name=\"f\"><variable name=\"x\" sort=\"Int\"/>"
                                      "<variable name=\"y\" sort=\"Bool\"/><argument>x</argument>";

    // an integer passed to a boolean formal
    try {
        fromString("<environment>" + callee + caller_prefix +
                   "<constraint kind=\"call\" callee=\"g\" file=\"f.c\" line=\"4\" column=\"2\">"
                   "<argument>x</argument></constraint></function></environment>");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error &error) {
        ASSERT_EQ(std::string(error.what()), "Sort mismatch of argument 0 in call to g in f at f.c:4:2.");
    }

    // two arguments for a single formal
    try {
        fromString("<environment>" + callee + caller_prefix +
                   "<constraint kind=\"call\" callee=\"g\"><argument>y</argument><argument>y</argument>"
                   "</constraint></function></environment>");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error &error) {
        ASSERT_EQ(std::string(error.what()), "Arity mismatch in call to g in f: expected 1 arguments, but got 2.");
    }
    ASSERT_THROW(fromString("<environment>" + callee + caller_prefix +
                            "<constraint kind=\"call\" callee=\"g\"/></function></environment>"),
                 std::runtime_error);

    // an integer variable receiving a boolean result
    ASSERT_THROW(fromString("<environment>" + callee + caller_prefix +
                            "<constraint kind=\"call\" callee=\"g\" result=\"x\"><argument>y</argument>"
                            "</constraint></function></environment>"),
                 std::runtime_error);

    // unknown arguments and callees without summary are not checked
    std::unique_ptr<ir::Environment> environment =
            fromString("<environment>" + callee + caller_prefix +
                       "<constraint kind=\"call\" callee=\"g\" result=\"y\"><argument/></constraint>"
                       "<constraint kind=\"call\" callee=\"h\" result=\"x\"><argument>x</argument>"
                       "<argument>y</argument></constraint></function></environment>");
    ASSERT_EQ(environment->size(), 2);
    // binding of x and binding of the result of g
    ASSERT_EQ(analysis::instantiate("f", *environment).size(), 2);
}
