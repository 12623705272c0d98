#ifndef STOKESLET_HPP_
#define STOKESLET_HPP_

// ===================================================================
/**
 * Regularized Stokeslet kernels, following
 * R. Cortez, L. Fauci and A. Medovikov, Phys. Fluids 17, 031504 (2005).
 * --
 * G_ij = [(r^2 + 2d^2) delta_ij + r_i r_j] / (8 pi (r^2 + d^2)^(3/2))
 * All kernels omit the 1/mu viscosity factor.
 */
// ===================================================================
/*
 * Stokeslet.hpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <cmath>

#include "globals.hpp"


template<typename number>
struct Stokeslet
{
    // Single source, R = target - source
    static inline Matrix33<number> Regularized(const Vector3<number>& R, number delta)
    {
        number r2     = R.squaredNorm();
        number d2     = SQR(delta);
        number r_reg3 = std::pow(r2 + d2, (number)1.5);

        number g_diag = r2 + 2.*d2;
        number g_norm = 8.*PI * r_reg3;

        Matrix33<number> G = R * R.transpose();
        G.diagonal().array() += g_diag;

        return G / g_norm;
    }

    // Quadrature-weighted sum over a set of sources
    static inline Matrix33<number> Integrate(const Matrix3X<number>& Sources, const Vector3<number>& Target,
                                             const ArrayX<number>& Weights, number delta)
    {
        Matrix33<number> G_sum = Matrix33<number>::Zero();

        for ( uint idx_src = 0; idx_src < Sources.cols(); ++idx_src )
        {
            G_sum += Weights(idx_src) * Regularized(Target - Sources.col(idx_src), delta);
        }

        return G_sum;
    }

    // Planar singular Stokeslet (I + RR/r^2)/r, without the 1/(8 pi) factor
    static inline Matrix22<number> Planar(const Vector2<number>& R)
    {
        number r = R.norm();

        Vector2<number>  R_hat = R / r;
        Matrix22<number> S     = R_hat * R_hat.transpose();

        S.diagonal().array() += (number)1.;

        return S / r;
    }
};

#endif
