#ifndef NONLOCAL_SOLVER_HPP_
#define NONLOCAL_SOLVER_HPP_

#include "BaseSolver.hpp"


template<typename number>
class NonlocalSolver: public BaseSolver<NonlocalSolver<number>, number>
{
public:
    NonlocalSolver(const SimParams<number>&);

    uint   N_PTS;

    number L;
    number a;
    number c;
    number delta;

    // Clenshaw-Curtis weights and nodes on [-L/2, L/2]
    ArrayX<number> W;
    ArrayX<number> S;

    ScallopGeometry<number> Geometry;

    static inline const char* Name() {return "nonlocal slender body";}

    void FormLinearSystem();

    number NetForce() const;

private:
    static uint NumNodes_(const SimParams<number>&);
    static ArrayX<number> Rule_(const SimParams<number>&, ArrayX<number>*);
};

#endif
