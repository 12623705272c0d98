// ===================================================================
/**
 * Sweep manager class - distributes independent scallop runs over MPI
 * threads and aggregates their final displacements on the master.
 */
// ===================================================================
/*
 * SweepManager.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <string>
#include <fstream>

#include "SweepManager.hpp"


// ============================
/* Class constructor */
// ============================
template<typename number>
SweepManager<number>::SweepManager(int mpi_rank, int mpi_size, const SimParams<number>& Params)
{
    data_path_ = __DATA_PATH;

    mpi_rank_  = mpi_rank;
    mpi_size_  = mpi_size;

    runs_done_ = 0;

    t_start_   = std::chrono::high_resolution_clock::now();

    // Disable standard output on slave processes
    if ( mpi_rank_ == MPI_MASTER ) setbuf(stdout, NULL);
    else                           fclose(stdout);

    Params.Validate();
    Params_    = Params;

    Theta_0    = ArrayX<number>::Zero(Params_.n_sweep);
    X_final    = ArrayX<number>::Zero(Params_.n_sweep);
    U_mean     = ArrayX<number>::Zero(Params_.n_sweep);

    LogTxt("*****************");
    LogPur("Boundary element simulations of a two-filament scallop");
    LogTxt("Running compiled build %d.%d", __VERSION_MAJOR__, __VERSION_MINOR__);
    LogTxt("Using Eigen vsn. %d.%d.%d", EIGEN_WORLD_VERSION, EIGEN_MAJOR_VERSION, EIGEN_MINOR_VERSION);
    LogTxt("Using the %s solver with %s integration", __SOLVER, Params_.integrator.c_str());

    LogTxt("************");
    LogRed("Running %d sweep run(s) with %d core(s)", Params_.n_sweep, mpi_size_);
}

// ============================
/* Round-robin distribution of the sweep runs */
// ============================
template<typename number>
void SweepManager<number>::Run()
{
    for ( uint idx_run = mpi_rank_; idx_run < (uint)Params_.n_sweep; idx_run += mpi_size_ )
    {
        SimParams<number> Params_run = Params_.SweepRun(idx_run);

        LogTxt("************");
        LogBlu("Run %u out of %d (theta_0 = %g)", idx_run+1, Params_.n_sweep, (double)Params_run.theta_0);

        ScallopSimulation<SOLVER, number> Sim(Params_run);

        Sim.Run(OutputPath_(Params_run.output));

        Theta_0(idx_run) = Params_run.theta_0;
        X_final(idx_run) = Sim.x_hinge;
        U_mean (idx_run) = Sim.MeanSpeed();

        runs_done_++;
    }
}

// ============================
/* MPI aggregation - each run is owned by exactly one thread */
// ============================
template<typename number>
void SweepManager<number>::Gather()
{
    ArrayX<number> Theta_0_ = Theta_0;
    ArrayX<number> X_final_ = X_final;
    ArrayX<number> U_mean_  = U_mean;

    uint runs_done(0);

    MPI_Reduce(Theta_0_.data(), Theta_0.data(), Theta_0.size(), Utils<number>().MPI_type, MPI_SUM, MPI_MASTER, MPI_COMM_WORLD);
    MPI_Reduce(X_final_.data(), X_final.data(), X_final.size(), Utils<number>().MPI_type, MPI_SUM, MPI_MASTER, MPI_COMM_WORLD);
    MPI_Reduce(U_mean_ .data(), U_mean .data(), U_mean .size(), Utils<number>().MPI_type, MPI_SUM, MPI_MASTER, MPI_COMM_WORLD);

    MPI_Reduce(&runs_done_, &runs_done, 1, Utils<uint>().MPI_type, MPI_SUM, MPI_MASTER, MPI_COMM_WORLD);

    if ( (mpi_rank_ == MPI_MASTER) && (runs_done != (uint)Params_.n_sweep) )
    {
        throw std::runtime_error("Only " + std::to_string(runs_done) + " sweep runs completed");
    }
}

// ============================
/* Save aggregated data on master thread */
// ============================
template<typename number>
void SweepManager<number>::Save()
{
    if ( mpi_rank_ == MPI_MASTER )
    {
        std::string   filename = OutputPath_("sweep_summary.out");
        std::ofstream file_sum(filename);

        if ( !file_sum.good() ) throw std::runtime_error("Couldn't open output file " + filename);

        for ( uint idx_run = 0; idx_run < (uint)Params_.n_sweep; ++idx_run )
        {
            file_sum << Theta_0(idx_run) << ' ' << X_final(idx_run) << ' ' << U_mean(idx_run) << std::endl;
        }

        file_sum.close();

        if ( file_sum.fail() ) throw std::runtime_error("Failed to write " + filename);

        LogTxt("------------");
        LogCya("Sweep summary saved to %s", filename.c_str());
    }
}

// ============================
/* Relative paths are resolved in the data directory */
// ============================
template<typename number>
std::string SweepManager<number>::OutputPath_(const std::string& filename) const
{
    if ( !filename.empty() && (filename[0] == '/') ) return filename;

    return data_path_ + "/" + filename;
}

// ============================
/* Class destructor */
// ============================
template<typename number>
SweepManager<number>::~SweepManager()
{
    t_end_     = std::chrono::high_resolution_clock::now();
    t_elapsed_ = t_end_ - t_start_;

    LogTxt("*****************");
    LogBlu("Total runtime: %fs", t_elapsed_.count());
}

template class SweepManager<float>;
template class SweepManager<double>;
