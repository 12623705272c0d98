#ifndef PARAMS_HPP_
#define PARAMS_HPP_


// ============================
/* Simulation options */
// ============================

// Hydrodynamic model to be used - implemented: BEMSolver (regularized Stokeslets), NonlocalSolver (slender body theory)
#define SOLVER      BEMSolver

// Hinge integration scheme - "euler" for explicit Euler or "ab2" for 2nd-order Adams-Bashforth
#define INTEGRATOR  "euler"

// Output file, relative to the data path
#define OUTPUT_FILE "scallop_results.txt"

// Print the current time every VERBOSE_EVERY steps - set to 0 to disable progress logs
#define VERBOSE_EVERY 1


// ============================
/* Model parameters */
// ============================

// Prescribed stroke - theta(t) = THETA_A*sin(2*pi*t/TAU) + THETA_0
#define THETA_A     1.0
#define THETA_0     1.0
#define TAU         1.0

// Filament length and number of boundary elements per filament
#define L_FIL       1.0
#define N_SEG       100

// Regularization length of the Stokeslet kernel
#define DELTA       0.01

// Number of Gauss-Legendre points per boundary element
#define N_FINE      6

// Time step and simulation duration
#define DT          0.002
#define T_SIM       1.0

// Slender body theory parameters - filament radius and number of Clenshaw-Curtis intervals
#define A_FIL       0.01
#define N_CC        101

// Tilt angle sweep - N_SWEEP runs spanning [THETA_0, THETA_0_MAX]
#define N_SWEEP     1
#define THETA_0_MAX 1.0


// ============================
/* Numerical tolerances */
// ============================

// Relative tolerance on the end-time test t < T
#define TOL_TIME    1e-9

#endif
