// ===================================================================
/**
 * Boundary element solver based on regularized Stokeslets.
 * --
 * Only the force densities of the upper filament are unknowns: those
 * of the lower filament are their mirror image under y -> -y. This
 * reduction holds for the antiphase two-filament scallop only.
 */
// ===================================================================
/*
 * BEMSolver.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <vector>

#include "Stokeslet.hpp"
#include "Solvers/BEMSolver.hpp"


template<typename number>
BEMSolver<number>::BEMSolver(const SimParams<number>& Params):
    BaseSolver<BEMSolver<number>, number>(Params),
    N       (Params.n_seg),
    L       (Params.L),
    ds      (Params.L / Params.n_seg),
    delta   (Params.delta),
    S_edges (ArrayX<number>::LinSpaced(Params.n_seg+1, -Params.L/2., Params.L/2.)),
    S_mid   ((S_edges.head(N) + S_edges.tail(N)) / (number)2.),
    Geometry(Params, S_mid, 5.*Params.delta),
    Sampler (Params.n_fine, S_edges)
{
    Mirror_ = Vector3<number>(1., -1., 1.).asDiagonal();

    this->Lhs = MatrixXX<number>::Zero(3*N+1, 3*N+1);
    this->Rhs = VectorX <number>::Zero(3*N+1);
}

// ============================
/* Assemble the no-slip and force-free equations */
// ============================
template<typename number>
void BEMSolver<number>::FormLinearSystem()
{
    this->Lhs.setZero();
    this->Rhs.setZero();

    // Source quadrature points only depend on the current geometry
    std::vector<Matrix3X<number> > Sources1(N);
    std::vector<Matrix3X<number> > Sources2(N);
    std::vector<ArrayX  <number> > Weights (N);

    for ( uint idx_j = 0; idx_j < N; ++idx_j )
    {
        Sampler.Sample(Geometry, idx_j, FILA_UPPER, &Sources1[idx_j], &Weights[idx_j]);
        Sampler.Sample(Geometry, idx_j, FILA_LOWER, &Sources2[idx_j], &Weights[idx_j]);
    }

    for ( uint idx_i = 0; idx_i < N; ++idx_i )
    {
        Vector3<number> Target = Geometry.R1.col(idx_i);

        for ( uint idx_j = 0; idx_j < N; ++idx_j )
        {
            // Self-interaction of the upper filament
            Matrix33<number> G_self  = Stokeslet<number>::Integrate(Sources1[idx_j], Target, Weights[idx_j], delta);

            // Lower filament, with mirrored force densities
            Matrix33<number> G_cross = Stokeslet<number>::Integrate(Sources2[idx_j], Target, Weights[idx_j], delta);

            this->Lhs.template block<3,3>(3*idx_i, 3*idx_j) += G_self + G_cross * Mirror_;
        }

        // Prescribed rotational velocity
        number v_rot = (S_mid(idx_i) + L/2.) * Geometry.theta1_dot;

        this->Rhs(3*idx_i)   = -v_rot * sin(Geometry.theta1);
        this->Rhs(3*idx_i+1) =  v_rot * cos(Geometry.theta1);
        this->Rhs(3*idx_i+2) =  0.;

        // Rigid translation along x
        this->Lhs(3*idx_i, 3*N) = -1.;

        // Force-free condition along x
        this->Lhs(3*N, 3*idx_i) = ds;
    }
}

// ============================
/* Net x-force of the solved upper filament force densities */
// ============================
template<typename number>
number BEMSolver<number>::NetForce() const
{
    return ds * ForceDensity(FILA_UPPER).row(0).sum();
}

// ============================
/* Solved force densities, one column per element */
// ============================
template<typename number>
Matrix3X<number> BEMSolver<number>::ForceDensity(uint fila_id) const
{
    if ( this->Solution.size() != 3*N+1 ) throw std::runtime_error("Force densities requested before any solve");

    Matrix3X<number> F1 = Matrix3X<number>::Map(this->Solution.data(), 3, N);

    if ( fila_id == FILA_UPPER ) return F1;
    if ( fila_id == FILA_LOWER ) return Mirror_ * F1;

    throw std::runtime_error("Invalid filament id " + std::to_string(fila_id));
}

template class BEMSolver<float>;
template class BEMSolver<double>;
