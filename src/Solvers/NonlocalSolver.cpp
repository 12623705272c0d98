// ===================================================================
/**
 * Nonlocal slender body theory solver for the rigid scallop.
 * --
 * Planar force densities are collocated at Clenshaw-Curtis nodes. The
 * self-interaction combines the local drag c(I+pp) + 2(I-pp) with the
 * regularized nonlocal integral, while the mirrored lower filament
 * acts through point Stokeslets. All equations are scaled by 8 pi.
 */
// ===================================================================
/*
 * NonlocalSolver.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <cmath>

#include "Stokeslet.hpp"
#include "Solvers/NonlocalSolver.hpp"


template<typename number>
NonlocalSolver<number>::NonlocalSolver(const SimParams<number>& Params):
    BaseSolver<NonlocalSolver<number>, number>(Params),
    N_PTS   (NumNodes_(Params)),
    L       (Params.L),
    a       (Params.a_fil),
    c       (std::abs(std::log(SQR(Params.a_fil / Params.L)) + (number)1.)),
    delta   (4.*Params.a_fil),
    W       (),
    S       (Rule_(Params, &W)),
    Geometry(Params, S, 5.*Params.a_fil)
{
    this->Lhs = MatrixXX<number>::Zero(2*N_PTS+1, 2*N_PTS+1);
    this->Rhs = VectorX <number>::Zero(2*N_PTS+1);
}

// ============================
/* Collocation node count, after the slender body checks */
// ============================
template<typename number>
uint NonlocalSolver<number>::NumNodes_(const SimParams<number>& Params)
{
    Params.ValidateSlenderBody();

    return Params.n_cc + 1;
}

// ============================
/* Clenshaw-Curtis rule on the filament - returns the nodes */
// ============================
template<typename number>
ArrayX<number> NonlocalSolver<number>::Rule_(const SimParams<number>& Params, ArrayX<number>* Weights)
{
    ArrayX<number> Nodes_ref;
    ArrayX<number> Weights_ref;
    ArrayX<number> Nodes;

    Quadrature<number>::ClenshawCurtis(Params.n_cc, &Nodes_ref, &Weights_ref);
    Quadrature<number>::Rescale(Nodes_ref, Weights_ref, -Params.L/2., Params.L/2., &Nodes, Weights);

    return Nodes;
}

// ============================
/* Assemble the slender body equations */
// ============================
template<typename number>
void NonlocalSolver<number>::FormLinearSystem()
{
    uint idx_U = 2*N_PTS;

    this->Lhs.setZero();
    this->Rhs.setZero();

    number theta     = Geometry.theta1;
    number theta_dot = Geometry.theta1_dot;

    Vector2<number>  P(cos(theta), sin(theta));
    Matrix22<number> PP = P * P.transpose();

    Matrix22<number> I_p_pp = Matrix22<number>::Identity() + PP;
    Matrix22<number> I_m_pp = Matrix22<number>::Identity() - PP;

    Matrix22<number> Local  = c * I_p_pp + (number)2. * I_m_pp;
    Matrix22<number> Mirror = Vector2<number>(1., -1.).asDiagonal();

    for ( uint idx_i = 0; idx_i < N_PTS; ++idx_i )
    {
        number sum_inv(0.);

        Vector2<number> R_i = Geometry.R1.col(idx_i).template head<2>();

        for ( uint idx_j = 0; idx_j < N_PTS; ++idx_j )
        {
            number s_inv = 1. / sqrt(SQR(S(idx_i) - S(idx_j)) + SQR(delta));

            sum_inv += W(idx_j) * s_inv;

            // Nonlocal self-interaction
            this->Lhs.template block<2,2>(2*idx_i, 2*idx_j) += (W(idx_j) * s_inv) * I_p_pp;

            // Mirrored lower filament
            Vector2<number> R_ij = R_i - Geometry.R2.col(idx_j).template head<2>();

            this->Lhs.template block<2,2>(2*idx_i, 2*idx_j) += W(idx_j) * Stokeslet<number>::Planar(R_ij) * Mirror;
        }

        // Subtracted local part of the nonlocal integral and local drag
        this->Lhs.template block<2,2>(2*idx_i, 2*idx_i) += Local - sum_inv * I_p_pp;

        // Prescribed rotational velocity
        number v_rot = 8.*PI * (S(idx_i) + L/2.) * theta_dot;

        this->Rhs(2*idx_i)   = -v_rot * sin(theta);
        this->Rhs(2*idx_i+1) =  v_rot * cos(theta);

        // Rigid translation along x
        this->Lhs(2*idx_i, idx_U) = -8.*PI;

        // Force-free condition along x
        this->Lhs(idx_U, 2*idx_i) = W(idx_i);
    }
}

// ============================
/* Quadrature of the solved x-force densities */
// ============================
template<typename number>
number NonlocalSolver<number>::NetForce() const
{
    if ( this->Solution.size() != 2*N_PTS+1 ) throw std::runtime_error("Force densities requested before any solve");

    number f_x(0.);

    for ( uint idx_i = 0; idx_i < N_PTS; ++idx_i ) f_x += W(idx_i) * this->Solution(2*idx_i);

    return f_x;
}

template class NonlocalSolver<float>;
template class NonlocalSolver<double>;
