#ifndef SUMMIT_ANALYSIS_WARNING_H
#define SUMMIT_ANALYSIS_WARNING_H

#include "ir/source_location.h"

#include <ostream>
#include <string>

namespace analysis {
    class Warning {
    public:
        Warning(std::string message, ir::SourceLocation location);

        const std::string &getMessage() const;

        const ir::SourceLocation &getLocation() const;

        // "file:line:column: warning: message"
        std::ostream &print(std::ostream &os) const;

        friend std::ostream &operator<<(std::ostream &os, const Warning &warning) {
            return warning.print(os);
        }

    private:
        std::string _message;
        ir::SourceLocation _location;
    };
}// namespace analysis

#endif//SUMMIT_ANALYSIS_WARNING_H
