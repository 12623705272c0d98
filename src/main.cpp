// ===================================================================
/**
 * Boundary element simulations of a hinged two-filament scallop at
 * zero Reynolds number, with MPI-distributed tilt angle sweeps.
 * -------
 * Requires working Eigen/OpenMPI installs
 * Usage: scallop [parameter file]
 */
// ===================================================================
/*
 * main.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <mpi.h>

#include "SweepManager.hpp"


int main(int argc, char* argv[])
{
    int mpi_rank;
    int mpi_size;

    // Setup MPI
    MPI_Init(&argc, &argv);

    MPI_Comm_rank(MPI_COMM_WORLD, &mpi_rank);
    MPI_Comm_size(MPI_COMM_WORLD, &mpi_size);

    try
    {
        SimParams<double> Params;

        // Optional run-time overrides of the compiled defaults
        if ( argc > 1 ) Params.Load(argv[1]);

        SweepManager<double> Sweep(mpi_rank, mpi_size, Params);

        // Independent simulations on every thread
        Sweep.Run();

        // Broadcast results to master thread
        Sweep.Gather();

        // Save aggregated data
        Sweep.Save();
    }

    // Treat exceptions as fatal
    catch ( std::exception& e )
    {
        LogErr("%s on thread %d - aborting", e.what(), mpi_rank);

        MPI_Abort(MPI_COMM_WORLD, EXIT_FAILURE);
        exit     (EXIT_FAILURE);
    }

    MPI_Finalize();

    return EXIT_SUCCESS;
}
