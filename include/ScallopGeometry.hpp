#ifndef SCALLOP_GEOMETRY_HPP_
#define SCALLOP_GEOMETRY_HPP_

#include "SimParams.hpp"


template<typename number>
class ScallopGeometry
{
public:
    ScallopGeometry(const SimParams<number>&, const ArrayX<number>&, number);

    number L;

    // Prescribed orientation angles and angular velocities
    number theta1;
    number theta1_dot;
    number theta2;
    number theta2_dot;

    // Collocation arclengths in [-L/2, L/2]
    ArrayX<number>   S_col;

    // Unit tangents and hinge anchors
    Vector3<number>  P1;
    Vector3<number>  P2;

    Vector3<number>  R_hinge1;
    Vector3<number>  R_hinge2;

    // Collocation point positions
    Matrix3X<number> R1;
    Matrix3X<number> R2;

    void Update(number, number);

    const Vector3<number>& Hinge  (uint) const;
    const Vector3<number>& Tangent(uint) const;

    inline Vector3<number> Position(uint fila_id, number s) const
    {
        number arm = s + L/2.;

        return Hinge(fila_id) + arm * Tangent(fila_id);
    }

private:
    number theta_A_;
    number theta_0_;
    number tau_;
};

#endif
