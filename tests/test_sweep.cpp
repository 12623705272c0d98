#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

#include <mpi.h>

#include "SweepManager.hpp"
#include "test_helpers.hpp"


namespace
{
    SimParams<double> SweepParams()
    {
        SimParams<double> Params = SmallParams();

        Params.theta_0     = 0.5;
        Params.theta_0_max = 1.5;
        Params.n_sweep     = 2;
        Params.output      = TempPath("sweep_run.txt");

        return Params;
    }

    std::string SummaryPath()
    {
        return std::string(__DATA_PATH) + "/sweep_summary.out";
    }
}


TEST(SweepManager, SummaryHasOneLinePerRun)
{
    SimParams<double> Params = SweepParams();

    std::remove(SummaryPath().c_str());

    {
        SweepManager<double> Sweep(MPI_MASTER, 1, Params);

        Sweep.Run();
        Sweep.Gather();
        Sweep.Save();
    }

    std::vector<std::string> lines = ReadLines(SummaryPath());

    ASSERT_EQ(lines.size(), 2u);

    for ( uint idx_run = 0; idx_run < 2; ++idx_run )
    {
        // Same run outside of the sweep
        SimParams<double> Params_run = Params.SweepRun(idx_run);

        ScallopSimulation<SOLVER, double> Simulation(Params_run);
        while ( !Simulation.Finished() ) Simulation.Advance();

        double theta_0;
        double x_final;
        double U_mean;

        std::istringstream stream(lines[idx_run]);

        ASSERT_TRUE(stream >> theta_0 >> x_final >> U_mean) << lines[idx_run];

        EXPECT_NEAR(theta_0, 0.5 + idx_run, 1e-12);
        EXPECT_NEAR(x_final, Simulation.x_hinge,     1e-5 * std::abs(Simulation.x_hinge)     + 1e-12);
        EXPECT_NEAR(U_mean,  Simulation.MeanSpeed(), 1e-5 * std::abs(Simulation.MeanSpeed()) + 1e-12);

        // Every run writes its own output file
        EXPECT_EQ(ReadLines(Params.SweepOutput(idx_run)).size(), 5u);
    }
}

TEST(SweepManager, IncompleteSweepIsFatal)
{
    SweepManager<double> Sweep(MPI_MASTER, 1, SweepParams());

    EXPECT_THROW(Sweep.Gather(), std::runtime_error);
}

TEST(SweepManager, RejectsInvalidConfiguration)
{
    SimParams<double> Params = SweepParams();
    Params.n_sweep = 0;

    EXPECT_THROW(SweepManager<double>(MPI_MASTER, 1, Params), std::runtime_error);
}


int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);

    MPI_Init(&argc, &argv);

    int status = RUN_ALL_TESTS();

    MPI_Finalize();

    return status;
}
