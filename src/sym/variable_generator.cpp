#include "sym/variable_generator.h"

#include <string>

using namespace sym;

VariableGenerator::VariableGenerator(z3::context &context) : _context(&context), _counter(0) {}

Var VariableGenerator::makeFresh(const z3::sort &sort) {
    // XXX '%' never occurs in names of the abstraction, fresh variables can not capture summary variables
    std::string name = "%" + std::to_string(_counter++);
    return Var(_context->constant(name.c_str(), sort));
}

z3::context &VariableGenerator::getContext() const {
    return *_context;
}
