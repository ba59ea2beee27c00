#include "ir/call_stack.h"

#include <sstream>
#include <stdexcept>
#include <utility>

using namespace ir;

CallStack::CallStack(Kind kind, boost::optional<SourceLocation> location, std::shared_ptr<const CallStack> caller)
    : _kind(kind), _location(std::move(location)), _caller(std::move(caller)) {}

std::shared_ptr<const CallStack> CallStack::makeTop() {
    // XXX constructor is private, std::make_shared is not applicable
    return std::shared_ptr<const CallStack>(new CallStack(Kind::TOP, boost::none, nullptr));
}

std::shared_ptr<const CallStack> CallStack::makeFrame(boost::optional<SourceLocation> location,
                                                      std::shared_ptr<const CallStack> caller) {
    if (caller == nullptr) {
        throw std::logic_error("Frame without caller, use the top of the stack instead.");
    }
    return std::shared_ptr<const CallStack>(new CallStack(Kind::FRAME, std::move(location), std::move(caller)));
}

CallStack::Kind CallStack::getKind() const {
    return _kind;
}

const boost::optional<SourceLocation> &CallStack::getLocation() const {
    return _location;
}

const std::shared_ptr<const CallStack> &CallStack::getCaller() const {
    if (_kind == Kind::TOP) {
        throw std::logic_error("Top of the stack has no caller.");
    }
    return _caller;
}

unsigned int CallStack::getDepth() const {
    unsigned int depth = 0;
    for (const CallStack *call_stack = this; call_stack->_kind == Kind::FRAME; call_stack = call_stack->_caller.get()) {
        ++depth;
    }
    return depth;
}

std::ostream &CallStack::print(std::ostream &os) const {
    std::stringstream str;
    str << "[";
    for (const CallStack *call_stack = this; call_stack->_kind == Kind::FRAME; call_stack = call_stack->_caller.get()) {
        if (call_stack != this) {
            str << " <- ";
        }
        if (call_stack->_location.has_value()) {
            str << *call_stack->_location;
        } else {
            str << "?";
        }
    }
    str << "]";
    return os << str.str();
}
