// ===================================================================
/**
 * Quadrature rules on the filament arclength.
 * --
 * Gauss-Legendre nodes are located by Newton iteration on P_n, with
 * P_n' = n (x P_n - P_{n-1}) / (x^2 - 1). Clenshaw-Curtis weights follow
 * L. N. Trefethen, Spectral Methods in MATLAB (SIAM, 2000).
 */
// ===================================================================
/*
 * Quadrature.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <cmath>
#include <stdexcept>

#include "Quadrature.hpp"


namespace
{
    // P_n(x) and P_{n-1}(x) from the three-term recursion
    void LegendrePair(uint n, double x, double* p_n, double* p_nm1)
    {
        double p_l   = x;
        double p_lm1 = 1.;

        for ( uint l = 2; l <= n; ++l )
        {
            double p_lp1 = ((2.*l - 1.) * x * p_l - (l - 1.) * p_lm1) / l;

            p_lm1 = p_l;
            p_l   = p_lp1;
        }

        *p_n   = p_l;
        *p_nm1 = p_lm1;
    }
}


// ============================
/* Gauss-Legendre nodes and weights on [-1, 1] */
// ============================
template<typename number>
void Quadrature<number>::GaussLegendre(uint n, ArrayX<number>* Nodes, ArrayX<number>* Weights)
{
    if ( n == 0 ) throw std::runtime_error("Gauss-Legendre rule needs at least one node");

    Nodes  ->resize(n);
    Weights->resize(n);

    for ( uint idx = 0; idx < n; ++idx )
    {
        // Tricomi initial guess, refined in double precision
        double x  = cos(PI * (idx + 0.75) / (n + 0.5));
        double dx = 1.;

        double p_n;
        double p_nm1;
        double dp;

        uint ctr_newton(0);

        while ( std::abs(dx) > 1e-15 )
        {
            if ( ctr_newton++ > 100 ) throw std::runtime_error("Gauss-Legendre nodes failed to converge");

            LegendrePair(n, x, &p_n, &p_nm1);

            dp = n * (x*p_n - p_nm1) / (x*x - 1.);
            dx = p_n / dp;
            x -= dx;
        }

        LegendrePair(n, x, &p_n, &p_nm1);
        dp = n * (x*p_n - p_nm1) / (x*x - 1.);

        (*Nodes)  (idx) = x;
        (*Weights)(idx) = 2. / ((1. - x*x) * dp*dp);
    }
}

// ============================
/* Clenshaw-Curtis nodes and weights on [-1, 1] - n intervals, n+1 nodes */
// ============================
template<typename number>
void Quadrature<number>::ClenshawCurtis(uint n, ArrayX<number>* Nodes, ArrayX<number>* Weights)
{
    if ( n < 2 ) throw std::runtime_error("Clenshaw-Curtis rule needs at least 2 intervals");

    ArrayX<double> Theta = ArrayX<double>::LinSpaced(n+1, 0., PI);
    ArrayX<double> W     = ArrayX<double>::Zero(n+1);
    ArrayX<double> V     = ArrayX<double>::Ones(n-1);

    // Interior angles
    ArrayX<double> Theta_in = Theta.segment(1, n-1);

    if ( n % 2 == 0 )
    {
        W(0) = 1. / (SQR((double)n) - 1.);
        W(n) = W(0);

        for ( uint k = 1; k < n/2; ++k ) V -= 2. * cos(2.*k * Theta_in) / (4.*SQR((double)k) - 1.);

        V -= cos((double)n * Theta_in) / (SQR((double)n) - 1.);
    }

    else
    {
        W(0) = 1. / SQR((double)n);
        W(n) = W(0);

        for ( uint k = 1; k <= (n-1)/2; ++k ) V -= 2. * cos(2.*k * Theta_in) / (4.*SQR((double)k) - 1.);
    }

    W.segment(1, n-1) = 2. * V / (double)n;

    *Nodes   = cos(Theta).template cast<number>();
    *Weights = W.template cast<number>();
}

// ============================
/* Affine map of a rule from [-1, 1] onto [a, b] */
// ============================
template<typename number>
void Quadrature<number>::Rescale(const ArrayX<number>& Nodes_in, const ArrayX<number>& Weights_in, number a, number b,
                                 ArrayX<number>* Nodes_out, ArrayX<number>* Weights_out)
{
    number half_width = (b-a) / 2.;
    number center     = (b+a) / 2.;

    *Nodes_out   = half_width * Nodes_in + center;
    *Weights_out = half_width * Weights_in;
}

// ============================
/* Sampler constructor */
// ============================
template<typename number>
QuadratureSampler<number>::QuadratureSampler(uint nfine_, const ArrayX<number>& S_edges)
{
    nfine    = nfine_;
    S_edges_ = S_edges;

    if ( S_edges_.size() < 2 ) throw std::runtime_error("Need at least one boundary element to sample");

    Quadrature<number>::GaussLegendre(nfine, &Nodes_, &Weights_);
}

// ============================
/* Quadrature points along element idx_elem of filament fila_id */
// ============================
template<typename number>
void QuadratureSampler<number>::Sample(const ScallopGeometry<number>& Geometry, uint idx_elem, uint fila_id,
                                       Matrix3X<number>* Positions, ArrayX<number>* Weights) const
{
    ArrayX<number> S_fine;

    Quadrature<number>::Rescale(Nodes_, Weights_, S_edges_(idx_elem), S_edges_(idx_elem+1), &S_fine, Weights);

    const Vector3<number>& Hinge   = Geometry.Hinge(fila_id);
    const Vector3<number>& Tangent = Geometry.Tangent(fila_id);

    Positions->resize(3, nfine);

    for ( uint idx_k = 0; idx_k < nfine; ++idx_k )
    {
        number arm = S_fine(idx_k) + Geometry.L/2.;

        Positions->col(idx_k) = Hinge + arm * Tangent;
    }
}

template struct Quadrature<float>;
template struct Quadrature<double>;

template class QuadratureSampler<float>;
template class QuadratureSampler<double>;
