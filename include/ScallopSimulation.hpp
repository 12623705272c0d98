#ifndef SCALLOP_SIMULATION_HPP_
#define SCALLOP_SIMULATION_HPP_

#include <ostream>

#include "Solvers/BEMSolver.hpp"
#include "Solvers/NonlocalSolver.hpp"


template<template<typename number> class SolverType, typename number>
class ScallopSimulation
{
public:
    ScallopSimulation(const SimParams<number>&);

    SolverType<number> Solver;

    // Simulation state
    number t;
    number U;
    number x_hinge;

    inline uint StepIndex() const {return idx_step_;}
    inline uint NumSteps()  const {return n_steps_;}
    inline bool Finished()  const {return idx_step_ >= n_steps_;}

    inline number MeanSpeed() const {return (idx_step_ > 0) ? U_sum_ / idx_step_ : 0.;}

    void Advance(std::ostream* = nullptr);
    void Run(const std::string&);

    static void WriteRecord(std::ostream*, number, number, number);

private:
    SimParams<number> Params_;

    uint   idx_step_;
    uint   n_steps_;

    bool   use_ab2_;

    number U_prev_;
    number U_sum_;
};

#endif
