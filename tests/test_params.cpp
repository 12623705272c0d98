#include <stdexcept>

#include "test_helpers.hpp"


TEST(SimParams, DefaultsReproduceReferenceRun)
{
    SimParams<double> Params;

    EXPECT_DOUBLE_EQ(Params.theta_A, 1.0);
    EXPECT_DOUBLE_EQ(Params.theta_0, 1.0);
    EXPECT_DOUBLE_EQ(Params.L,       1.0);
    EXPECT_DOUBLE_EQ(Params.dt,      0.002);
    EXPECT_DOUBLE_EQ(Params.T,       1.0);
    EXPECT_DOUBLE_EQ(Params.tau,     1.0);
    EXPECT_DOUBLE_EQ(Params.delta,   0.01);

    EXPECT_EQ(Params.n_seg,  100);
    EXPECT_EQ(Params.n_fine, 6);
    EXPECT_EQ(Params.integrator, "euler");

    EXPECT_NO_THROW(Params.Validate());
}

TEST(SimParams, RejectsInvalidConfigurations)
{
    SimParams<double> Params;

    Params = SimParams<double>(); Params.n_seg  = 0;      EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.n_seg  = -4;     EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.n_fine = 0;      EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.delta  = 0.;     EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.delta  = -0.01;  EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.dt     = 0.;     EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.dt     = -0.002; EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.T      = 0.001;  EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.L      = 0.;     EXPECT_THROW(Params.Validate(), std::runtime_error);
    Params = SimParams<double>(); Params.tau    = 0.;     EXPECT_THROW(Params.Validate(), std::runtime_error);

    Params = SimParams<double>(); Params.integrator = "rk4"; EXPECT_THROW(Params.Validate(), std::runtime_error);
}

TEST(SimParams, SlenderBodyChecksAreSeparate)
{
    SimParams<double> Params;

    EXPECT_NO_THROW(Params.ValidateSlenderBody());

    // Only the slender body discretisation needs a radius and Clenshaw-Curtis nodes
    Params.n_cc = 1;
    EXPECT_NO_THROW(Params.Validate());
    EXPECT_THROW(Params.ValidateSlenderBody(), std::runtime_error);

    Params = SimParams<double>();
    Params.a_fil = 0.;
    EXPECT_NO_THROW(Params.Validate());
    EXPECT_THROW(Params.ValidateSlenderBody(), std::runtime_error);

    Params = SimParams<double>();
    Params.a_fil = -0.01;
    EXPECT_THROW(Params.ValidateSlenderBody(), std::runtime_error);
}

TEST(SimParams, StepCountAvoidsRoundOff)
{
    SimParams<double> Params;

    Params.dt = 0.002;

    Params.T = 0.01;  EXPECT_EQ(Params.NumSteps(), 5u);
    Params.T = 1.0;   EXPECT_EQ(Params.NumSteps(), 500u);
    Params.T = 0.011; EXPECT_EQ(Params.NumSteps(), 6u);
    Params.T = 0.002; EXPECT_EQ(Params.NumSteps(), 1u);

    SimParams<float> Params_f;

    Params_f.dt = 0.002f;
    Params_f.T  = 0.01f;

    EXPECT_EQ(Params_f.NumSteps(), 5u);
}

TEST(SimParams, LoadsParameterFile)
{
    std::string filename = TempPath("scallop_params.txt");

    {
        std::ofstream file_par(filename);

        file_par << "# reduced run" << std::endl;
        file_par << std::endl;
        file_par << "theta_A 0.5" << std::endl;
        file_par << "N       40   # boundary elements" << std::endl;
        file_par << "dt      1e-3" << std::endl;
        file_par << "integrator ab2" << std::endl;
        file_par << "output  run.txt" << std::endl;
    }

    SimParams<double> Params;
    Params.Load(filename);

    EXPECT_DOUBLE_EQ(Params.theta_A, 0.5);
    EXPECT_DOUBLE_EQ(Params.dt,      1e-3);
    EXPECT_EQ(Params.n_seg,      40);
    EXPECT_EQ(Params.integrator, "ab2");
    EXPECT_EQ(Params.output,     "run.txt");

    // Untouched values keep their defaults
    EXPECT_DOUBLE_EQ(Params.theta_0, 1.0);
    EXPECT_EQ(Params.n_fine, 6);

    EXPECT_NO_THROW(Params.Validate());
}

TEST(SimParams, RejectsMalformedParameterFiles)
{
    std::string filename = TempPath("scallop_params_bad.txt");

    SimParams<double> Params;

    { std::ofstream file_par(filename); file_par << "viscosity 1.0" << std::endl; }
    EXPECT_THROW(Params.Load(filename), std::runtime_error);

    { std::ofstream file_par(filename); file_par << "dt 0.002abc" << std::endl; }
    EXPECT_THROW(Params.Load(filename), std::runtime_error);

    { std::ofstream file_par(filename); file_par << "N" << std::endl; }
    EXPECT_THROW(Params.Load(filename), std::runtime_error);

    { std::ofstream file_par(filename); file_par << "N 10 20" << std::endl; }
    EXPECT_THROW(Params.Load(filename), std::runtime_error);

    EXPECT_THROW(Params.Load(TempPath("missing_dir/none.txt")), std::runtime_error);
}

TEST(SimParams, SweepRunsSpanTiltRange)
{
    SimParams<double> Params;

    Params.theta_0     = 0.5;
    Params.theta_0_max = 1.5;
    Params.n_sweep     = 3;
    Params.output      = "scallop_results.txt";

    EXPECT_DOUBLE_EQ(Params.SweepRun(0).theta_0, 0.5);
    EXPECT_DOUBLE_EQ(Params.SweepRun(1).theta_0, 1.0);
    EXPECT_DOUBLE_EQ(Params.SweepRun(2).theta_0, 1.5);

    EXPECT_EQ(Params.SweepRun(1).output,  "scallop_results_1.txt");
    EXPECT_EQ(Params.SweepRun(1).n_sweep, 1);

    EXPECT_THROW(Params.SweepRun(3), std::runtime_error);

    Params.output = "results";
    EXPECT_EQ(Params.SweepOutput(2), "results_2");

    Params.n_sweep = 1;
    EXPECT_EQ(Params.SweepOutput(0), "results");
}
