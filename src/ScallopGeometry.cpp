// ===================================================================
/**
 * Prescribed kinematics of the two hinged rods. The lower filament
 * is the mirror image of the upper one about the x-axis.
 */
// ===================================================================
/*
 * ScallopGeometry.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <stdexcept>

#include "ScallopGeometry.hpp"


// ============================
/* Class constructor */
// ============================
template<typename number>
ScallopGeometry<number>::ScallopGeometry(const SimParams<number>& Params, const ArrayX<number>& S_col_, number sep)
{
    L        = Params.L;

    theta_A_ = Params.theta_A;
    theta_0_ = Params.theta_0;
    tau_     = Params.tau;

    S_col    = S_col_;

    R1       = Matrix3X<number>::Zero(3, S_col.size());
    R2       = Matrix3X<number>::Zero(3, S_col.size());

    // Hinge anchors are vertically offset by +/- sep
    R_hinge1 << 0., sep, 0.;
    R_hinge2 << 0., -sep, 0.;

    Update(0., 0.);
}

// ============================
/* Orientations and collocation points at time t */
// ============================
template<typename number>
void ScallopGeometry<number>::Update(number t, number x_hinge)
{
    number omega = 2.*PI / tau_;

    theta1     = theta_A_ * sin(omega * t) + theta_0_;
    theta1_dot = theta_A_ * omega * cos(omega * t);

    // Antiphase coupling
    theta2     = -theta1;
    theta2_dot = -theta1_dot;

    P1 << cos(theta1), sin(theta1), 0.;
    P2 << cos(theta2), sin(theta2), 0.;

    R_hinge1(0) = x_hinge;
    R_hinge2(0) = x_hinge;

    for ( uint idx_s = 0; idx_s < S_col.size(); ++idx_s )
    {
        R1.col(idx_s) = Position(FILA_UPPER, S_col(idx_s));
        R2.col(idx_s) = Position(FILA_LOWER, S_col(idx_s));
    }
}

// ============================
/* Per-filament accessors */
// ============================
template<typename number>
const Vector3<number>& ScallopGeometry<number>::Hinge(uint fila_id) const
{
    if ( fila_id == FILA_UPPER ) return R_hinge1;
    if ( fila_id == FILA_LOWER ) return R_hinge2;

    throw std::runtime_error("Invalid filament id " + std::to_string(fila_id));
}

template<typename number>
const Vector3<number>& ScallopGeometry<number>::Tangent(uint fila_id) const
{
    if ( fila_id == FILA_UPPER ) return P1;
    if ( fila_id == FILA_LOWER ) return P2;

    throw std::runtime_error("Invalid filament id " + std::to_string(fila_id));
}

template class ScallopGeometry<float>;
template class ScallopGeometry<double>;
