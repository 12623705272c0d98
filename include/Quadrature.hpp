#ifndef QUADRATURE_HPP_
#define QUADRATURE_HPP_

#include "ScallopGeometry.hpp"


template<typename number>
struct Quadrature
{
    static void GaussLegendre (uint, ArrayX<number>*, ArrayX<number>*);
    static void ClenshawCurtis(uint, ArrayX<number>*, ArrayX<number>*);

    static void Rescale(const ArrayX<number>&, const ArrayX<number>&, number, number,
                        ArrayX<number>*, ArrayX<number>*);
};


// Gauss-Legendre sampling of the boundary elements of a filament
template<typename number>
class QuadratureSampler
{
public:
    QuadratureSampler(uint, const ArrayX<number>&);

    uint nfine;

    // Canonical nodes and weights on [-1, 1]
    const ArrayX<number>& Nodes()   const {return Nodes_;}
    const ArrayX<number>& Weights() const {return Weights_;}

    void Sample(const ScallopGeometry<number>&, uint, uint, Matrix3X<number>*, ArrayX<number>*) const;

private:
    ArrayX<number> Nodes_;
    ArrayX<number> Weights_;

    // Element boundaries
    ArrayX<number> S_edges_;
};

#endif
