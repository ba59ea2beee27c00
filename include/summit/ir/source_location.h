#ifndef SUMMIT_IR_SOURCE_LOCATION_H
#define SUMMIT_IR_SOURCE_LOCATION_H

#include <ostream>
#include <string>
#include <tuple>

namespace ir {
    class SourceLocation {
    public:
        SourceLocation(std::string file, unsigned int line, unsigned int column);

        const std::string &getFile() const;

        unsigned int getLine() const;

        unsigned int getColumn() const;

        std::ostream &print(std::ostream &os) const;

        friend std::ostream &operator<<(std::ostream &os, const SourceLocation &source_location) {
            return source_location.print(os);
        }

        friend bool operator==(const SourceLocation &lhs, const SourceLocation &rhs) {
            return std::tie(lhs._file, lhs._line, lhs._column) == std::tie(rhs._file, rhs._line, rhs._column);
        }

        friend bool operator!=(const SourceLocation &lhs, const SourceLocation &rhs) {
            return !(lhs == rhs);
        }

        friend bool operator<(const SourceLocation &lhs, const SourceLocation &rhs) {
            return std::tie(lhs._file, lhs._line, lhs._column) < std::tie(rhs._file, rhs._line, rhs._column);
        }

    private:
        std::string _file;
        unsigned int _line;
        unsigned int _column;
    };
}// namespace ir

#endif//SUMMIT_IR_SOURCE_LOCATION_H
