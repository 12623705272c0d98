#ifndef SIM_PARAMS_HPP_
#define SIM_PARAMS_HPP_

#include <string>

#include "globals.hpp"


template<typename number>
struct SimParams
{
    SimParams();

    // Prescribed stroke
    number theta_A;
    number theta_0;
    number tau;

    // Filament discretisation
    number L;
    number delta;

    int    n_seg;
    int    n_fine;

    // Slender body theory discretisation
    number a_fil;
    int    n_cc;

    // Time marching
    number dt;
    number T;

    // Tilt angle sweep
    int    n_sweep;
    number theta_0_max;

    int    verbose_every;

    std::string integrator;
    std::string output;

    void Load(const std::string&);
    void Validate() const;
    void ValidateSlenderBody() const;

    uint NumSteps() const;

    // Per-run parameters and output file within a tilt angle sweep
    SimParams<number> SweepRun(uint) const;
    std::string       SweepOutput(uint) const;
};

#endif
