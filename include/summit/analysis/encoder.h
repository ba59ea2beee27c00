#ifndef SUMMIT_ANALYSIS_ENCODER_H
#define SUMMIT_ANALYSIS_ENCODER_H

#include "ir/constraint/constraint.h"

#include "z3++.h"

#include <memory>
#include <vector>

namespace analysis {
    /**
     * Encodes a flattened constraint system for the solver, every constraint becomes the implication of its condition
     * by its assumption.
     */
    class Encoder {
    public:
        // XXX default constructor disabled
        Encoder() = delete;
        // XXX copy constructor disabled
        Encoder(const Encoder &other) = delete;
        // XXX copy assignment disabled
        Encoder &operator=(const Encoder &) = delete;

        explicit Encoder(z3::context &context);

        z3::expr encode(const ir::Constraint &constraint) const;

        z3::expr_vector encode(const std::vector<std::unique_ptr<ir::Constraint>> &constraints) const;

    private:
        z3::context *const _context;
    };
}// namespace analysis

#endif//SUMMIT_ANALYSIS_ENCODER_H
