#ifndef BASE_SOLVER_HPP
#define BASE_SOLVER_HPP

// ===================================================================
/**
 * Header-only BaseSolver class
 * Makes use of the Curiously Recurring Template Pattern (CRTP):
 * https://en.wikipedia.org/wiki/Curiously_recurring_template_pattern
 * --
 * Derived solvers must expose a ScallopGeometry member named Geometry
 * and a FormLinearSystem() method filling Lhs and Rhs. The last
 * unknown of every system is the hinge translation speed U.
 */
// ===================================================================
/*
 * BaseSolver.hpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <stdexcept>

#include "Quadrature.hpp"


template<class Solver, typename number>
class BaseSolver
{
public:
    explicit BaseSolver(const SimParams<number>& Params)
    {
        // Reject invalid configurations before any allocation takes place
        Params.Validate();
    }

    MatrixXX<number> Lhs;
    VectorX <number> Rhs;
    VectorX <number> Solution;

    // ============================
    /* Rebuild and solve the hydrodynamic system, returning U */
    // ============================
    number Step(number t, number x_hinge)
    {
        Solver* solver = static_cast<Solver*>(this);

        solver->Geometry.Update(t, x_hinge);
        solver->FormLinearSystem();

        SolveSystem();

        return TranslationSpeed();
    }

    // ============================
    /* Dense direct solve using column-pivoting Householder QR decomposition */
    // ============================
    void SolveSystem()
    {
        if ( (Lhs.rows() != Lhs.cols()) || (Lhs.rows() != Rhs.size()) )
        {
            throw std::runtime_error("Inconsistent hydrodynamic system dimensions");
        }

        Eigen::ColPivHouseholderQR<MatrixXX<number> > QR(Lhs);

        if ( !QR.isInvertible() ) throw std::runtime_error("Singular hydrodynamic system matrix");

        Solution = QR.solve(Rhs);

        if ( !Solution.allFinite() ) throw std::runtime_error("Non-finite solution of the hydrodynamic system");
    }

    inline number TranslationSpeed() const {return Solution(Solution.size()-1);}
};

#endif
