#ifndef SWEEP_MANAGER_HPP_
#define SWEEP_MANAGER_HPP_

#include <chrono>

#include "ScallopSimulation.hpp"
#include "Utils.hpp"


template<typename number>
class SweepManager
{
public:
    SweepManager(int, int, const SimParams<number>&);
    ~SweepManager();

    void Run();
    void Gather();
    void Save();

private:
    int mpi_rank_;
    int mpi_size_;

    uint runs_done_;

    SimParams<number> Params_;

    std::string data_path_;

    std::chrono::high_resolution_clock::time_point t_start_;
    std::chrono::high_resolution_clock::time_point t_end_;

    std::chrono::duration<double> t_elapsed_;

    ArrayX<number> Theta_0;
    ArrayX<number> X_final;
    ArrayX<number> U_mean;

    std::string OutputPath_(const std::string&) const;
};

#endif
