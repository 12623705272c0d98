#ifndef BEM_SOLVER_HPP_
#define BEM_SOLVER_HPP_

#include "BaseSolver.hpp"


template<typename number>
class BEMSolver: public BaseSolver<BEMSolver<number>, number>
{
public:
    BEMSolver(const SimParams<number>&);

    uint   N;

    number L;
    number ds;
    number delta;

    // Element boundaries and midpoints
    ArrayX<number> S_edges;
    ArrayX<number> S_mid;

    ScallopGeometry  <number> Geometry;
    QuadratureSampler<number> Sampler;

    static inline const char* Name() {return "regularized Stokeslet";}

    void FormLinearSystem();

    number NetForce() const;
    Matrix3X<number> ForceDensity(uint) const;

private:
    Matrix33<number> Mirror_;
};

#endif
