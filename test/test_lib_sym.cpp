#include <gtest/gtest.h>

#include "sym/expression.h"
#include "sym/variable.h"
#include "sym/variable_generator.h"

#include "z3++.h"

#include <stdexcept>
#include <vector>

using namespace sym;

class TestLibSym : public ::testing::Test {
public:
    TestLibSym() : ::testing::Test() {}

protected:
    z3::context _context;
};

TEST_F(TestLibSym, Var) {
    z3::expr x = _context.int_const("x");
    z3::expr b = _context.bool_const("b");
    ASSERT_TRUE(Var::isVariable(x));
    ASSERT_TRUE(Var::isVariable(b));
    ASSERT_FALSE(Var::isVariable(x + 1));
    ASSERT_FALSE(Var::isVariable(_context.int_val(1)));
    ASSERT_FALSE(Var::isVariable(_context.bool_val(true)));
    ASSERT_THROW(Var(x + 1), std::logic_error);

    Var v_x(x);
    Var v_b(b);
    ASSERT_EQ(v_x.getName(), "x");
    ASSERT_EQ(v_x.getKind(), Var::Kind::EXPRESSION);
    ASSERT_EQ(v_b.getKind(), Var::Kind::BOOLEAN);
    ASSERT_TRUE(z3::eq(v_x.getSort(), _context.int_sort()));
    // XXX z3 hash-conses constants, identical declarations denote the same variable
    ASSERT_EQ(v_x, Var(_context.int_const("x")));
    ASSERT_NE(v_x, Var(_context.int_const("y")));
}

TEST_F(TestLibSym, VariableGenerator) {
    VariableGenerator variable_generator(_context);
    ASSERT_EQ(variable_generator._counter, 0);
    Var v_0 = variable_generator.makeFresh(_context.int_sort());
    Var v_1 = variable_generator.makeFresh(_context.bool_sort());
    Var v_2 = variable_generator.makeFresh(_context.int_sort());
    ASSERT_EQ(variable_generator._counter, 3);
    ASSERT_EQ(v_0.getName(), "%0");
    ASSERT_EQ(v_1.getName(), "%1");
    ASSERT_EQ(v_1.getKind(), Var::Kind::BOOLEAN);
    ASSERT_NE(v_0, v_2);
    ASSERT_TRUE(z3::eq(v_2.getSort(), _context.int_sort()));
}

TEST_F(TestLibSym, Substitute) {
    z3::expr x = _context.int_const("x");
    z3::expr y = _context.int_const("y");
    z3::expr z = _context.int_const("z");
    unsigned int lookups = 0;
    Renaming renaming = [&](const Var &variable) -> boost::optional<z3::expr> {
        ++lookups;
        if (variable.getName() == "x") {
            return z;
        }
        return boost::none;
    };
    z3::expr substituted = substitute(x + x * y, renaming);
    ASSERT_TRUE(z3::eq(substituted, z + z * y));
    // XXX one lookup per occurrence
    ASSERT_EQ(lookups, 3);

    ASSERT_FALSE(substitute(boost::optional<z3::expr>(), renaming).has_value());

    std::vector<boost::optional<z3::expr>> expressions{x, boost::none, y};
    std::vector<boost::optional<z3::expr>> substituted_expressions = substitute(expressions, renaming);
    ASSERT_EQ(substituted_expressions.size(), 3);
    ASSERT_TRUE(z3::eq(*substituted_expressions.at(0), z));
    ASSERT_FALSE(substituted_expressions.at(1).has_value());
    ASSERT_TRUE(z3::eq(*substituted_expressions.at(2), y));

    Renaming sort_changing_renaming = [&](const Var &) -> boost::optional<z3::expr> {
        return _context.bool_val(true);
    };
    ASSERT_THROW(substitute(x + 1, sort_changing_renaming), std::logic_error);
}

TEST_F(TestLibSym, EqualAndConjoin) {
    z3::expr x = _context.int_const("x");
    z3::expr y = _context.int_const("y");
    z3::expr b = _context.bool_const("b");

    ASSERT_TRUE(equal(x, boost::none).empty());
    std::vector<z3::expr> equalities = equal(x, boost::optional<z3::expr>(y));
    ASSERT_EQ(equalities.size(), 1);
    ASSERT_TRUE(z3::eq(equalities.at(0), x == y));
    ASSERT_THROW(equal(x, boost::optional<z3::expr>(b)), std::logic_error);

    z3::expr t = _context.bool_val(true);
    ASSERT_TRUE(z3::eq(conjoin(t, b), b));
    ASSERT_TRUE(z3::eq(conjoin(b, t), b));
    ASSERT_TRUE(z3::eq(conjoin(b, x > y), b && x > y));
}
