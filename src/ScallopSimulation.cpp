// ===================================================================
/**
 * Time-marching driver - solves the hydrodynamic system once per step
 * and integrates the hinge position. Each step is appended and flushed
 * to the output stream, so that interrupted runs keep all prior steps.
 */
// ===================================================================
/*
 * ScallopSimulation.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <fstream>
#include <iomanip>

#include "ScallopSimulation.hpp"


// ============================
/* Class constructor */
// ============================
template<template<typename number> class SolverType, typename number>
ScallopSimulation<SolverType, number>::ScallopSimulation(const SimParams<number>& Params):
    Solver (Params),
    Params_(Params)
{
    t         = 0.;
    U         = 0.;
    x_hinge   = 0.;

    idx_step_ = 0;
    n_steps_  = Params_.NumSteps();

    use_ab2_  = (Params_.integrator == "ab2");

    U_prev_   = 0.;
    U_sum_    = 0.;
}

// ============================
/* Single time step */
// ============================
template<template<typename number> class SolverType, typename number>
void ScallopSimulation<SolverType, number>::Advance(std::ostream* Output)
{
    if ( Finished() ) throw std::runtime_error("Simulation already reached its end time");

    U = Solver.Step(t, x_hinge);

    // Bootstrap Adams-Bashforth with U_prev = U
    if ( use_ab2_ )
    {
        if ( idx_step_ == 0 ) U_prev_ = U;

        x_hinge += Params_.dt/2. * (3.*U - U_prev_);
    }

    else x_hinge += U * Params_.dt;

    U_prev_  = U;
    U_sum_  += U;

    WriteRecord(Output, t, U, x_hinge);

    // Avoid accumulating round-off errors in t
    ++idx_step_;
    t = idx_step_ * Params_.dt;
}

// ============================
/* Full run with output to filename */
// ============================
template<template<typename number> class SolverType, typename number>
void ScallopSimulation<SolverType, number>::Run(const std::string& filename)
{
    std::ofstream file_out(filename);

    if ( !file_out.good() ) throw std::runtime_error("Couldn't open output file " + filename);

    LogTxt("------------");
    LogGre("Running %u steps of the %s scallop (dt = %g, T = %g)", n_steps_, SolverType<number>::Name(), (double)Params_.dt, (double)Params_.T);
    LogInf("theta_A = %g, theta_0 = %g, tau = %g", (double)Params_.theta_A, (double)Params_.theta_0, (double)Params_.tau);

    while ( !Finished() )
    {
        if ( (Params_.verbose_every > 0) && (idx_step_ % Params_.verbose_every == 0) ) LogInf("%.2f", (double)t);

        Advance(&file_out);
    }

    file_out.close();

    if ( file_out.fail() ) throw std::runtime_error("Couldn't close output file " + filename);

    LogCya("Results saved to %s", filename.c_str());
}

// ============================
/* Output line - t (5 decimals), U and x_hinge (10 decimals) */
// ============================
template<template<typename number> class SolverType, typename number>
void ScallopSimulation<SolverType, number>::WriteRecord(std::ostream* Output, number t_, number U_, number x_)
{
    if ( Output == nullptr ) return;

    *Output << std::fixed
            << std::setprecision(5)  << t_ << ' '
            << std::setprecision(10) << U_ << ' '
            << std::setprecision(10) << x_ << '\n';

    Output->flush();

    if ( !Output->good() ) throw std::runtime_error("Failed to write simulation output");
}

template class ScallopSimulation<BEMSolver, float>;
template class ScallopSimulation<BEMSolver, double>;

template class ScallopSimulation<NonlocalSolver, float>;
template class ScallopSimulation<NonlocalSolver, double>;
