#ifndef SUMMIT_IR_CALL_STACK_H
#define SUMMIT_IR_CALL_STACK_H

#include "ir/source_location.h"

#include "boost/optional.hpp"

#include <memory>
#include <ostream>

namespace ir {
    /**
 * Persistent chain of call site locations from the root of an instantiation down to the origin of a constraint. A
 * frame is never mutated after its creation and strictly extends its caller, hence the chain is acyclic and frames
 * can be shared between all constraints instantiated at the same call site.
 */
    class CallStack {
    public:
        enum class Kind { TOP, FRAME };

        // XXX default constructor disabled
        CallStack() = delete;
        // XXX copy constructor disabled
        CallStack(const CallStack &other) = delete;
        // XXX copy assignment disabled
        CallStack &operator=(const CallStack &) = delete;

        static std::shared_ptr<const CallStack> makeTop();

        static std::shared_ptr<const CallStack> makeFrame(boost::optional<SourceLocation> location,
                                                          std::shared_ptr<const CallStack> caller);

        Kind getKind() const;

        // Location of this frame, boost::none for the top of the stack and for frames without debug information.
        const boost::optional<SourceLocation> &getLocation() const;

        // Throws for the top of the stack.
        const std::shared_ptr<const CallStack> &getCaller() const;

        // Number of frames, the top of the stack has depth zero.
        unsigned int getDepth() const;

        std::ostream &print(std::ostream &os) const;

        friend std::ostream &operator<<(std::ostream &os, const CallStack &call_stack) {
            return call_stack.print(os);
        }

    private:
        CallStack(Kind kind, boost::optional<SourceLocation> location, std::shared_ptr<const CallStack> caller);

    private:
        const Kind _kind;
        const boost::optional<SourceLocation> _location;
        const std::shared_ptr<const CallStack> _caller;
    };
}// namespace ir

#endif//SUMMIT_IR_CALL_STACK_H
