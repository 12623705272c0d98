// ===================================================================
/**
 * Run-time simulation parameters. Defaults are taken from params.hpp
 * and may be overridden by a plain-text "key value" parameter file.
 */
// ===================================================================
/*
 * SimParams.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "SimParams.hpp"


namespace
{
    // Strict conversion - trailing characters are rejected
    template<typename T>
    T ParseValue(const std::string& key, const std::string& value)
    {
        T result;
        std::istringstream stream(value);

        if ( !(stream >> result) || !(stream >> std::ws).eof() )
        {
            throw std::runtime_error("Invalid value '" + value + "' for parameter " + key);
        }

        return result;
    }
}

// ============================
/* Class constructor */
// ============================
template<typename number>
SimParams<number>::SimParams()
{
    theta_A       = THETA_A;
    theta_0       = THETA_0;
    tau           = TAU;

    L             = L_FIL;
    delta         = DELTA;

    n_seg         = N_SEG;
    n_fine        = N_FINE;

    a_fil         = A_FIL;
    n_cc          = N_CC;

    dt            = DT;
    T             = T_SIM;

    n_sweep       = N_SWEEP;
    theta_0_max   = THETA_0_MAX;

    verbose_every = VERBOSE_EVERY;

    integrator    = INTEGRATOR;
    output        = OUTPUT_FILE;
}

// ============================
/* Parameter file parser */
// ============================
template<typename number>
void SimParams<number>::Load(const std::string& filename)
{
    std::string   line;
    std::ifstream input_file(filename);

    if ( !input_file.good() ) throw std::runtime_error("Couldn't open parameter file " + filename);

    while ( std::getline(input_file, line) )
    {
        // Strip comments
        size_t pos_comment = line.find('#');
        if ( pos_comment != std::string::npos ) line.erase(pos_comment);

        std::string key;
        std::string value;
        std::string extra;

        std::istringstream stream(line);

        if ( !(stream >> key) ) continue;

        if ( !(stream >> value) ) throw std::runtime_error("Missing value for parameter " + key);
        if (   stream >> extra  ) throw std::runtime_error("Too many values for parameter " + key);

        if      ( key == "theta_A" )       theta_A       = ParseValue<number>(key, value);
        else if ( key == "theta_0" )       theta_0       = ParseValue<number>(key, value);
        else if ( key == "tau" )           tau           = ParseValue<number>(key, value);
        else if ( key == "L" )             L             = ParseValue<number>(key, value);
        else if ( key == "delta" )         delta         = ParseValue<number>(key, value);
        else if ( key == "N" )             n_seg         = ParseValue<int>   (key, value);
        else if ( key == "nfine" )         n_fine        = ParseValue<int>   (key, value);
        else if ( key == "a" )             a_fil         = ParseValue<number>(key, value);
        else if ( key == "n_cc" )          n_cc          = ParseValue<int>   (key, value);
        else if ( key == "dt" )            dt            = ParseValue<number>(key, value);
        else if ( key == "T" )             T             = ParseValue<number>(key, value);
        else if ( key == "n_sweep" )       n_sweep       = ParseValue<int>   (key, value);
        else if ( key == "theta_0_max" )   theta_0_max   = ParseValue<number>(key, value);
        else if ( key == "verbose_every" ) verbose_every = ParseValue<int>   (key, value);
        else if ( key == "integrator" )    integrator    = value;
        else if ( key == "output" )        output        = value;

        else throw std::runtime_error("Unknown parameter " + key + " in " + filename);
    }
}

// ============================
/* Pre-flight checks */
// ============================
template<typename number>
void SimParams<number>::Validate() const
{
    if ( n_seg  <= 0 )  throw std::runtime_error("Need a positive number of segments N");
    if ( n_fine <= 0 )  throw std::runtime_error("Need a positive quadrature order nfine");

    if ( !(L     > 0.) ) throw std::runtime_error("Need a positive filament length L");
    if ( !(tau   > 0.) ) throw std::runtime_error("Need a positive oscillation period tau");
    if ( !(delta > 0.) ) throw std::runtime_error("Need a positive regularization length delta");
    if ( !(dt    > 0.) ) throw std::runtime_error("Need a positive time step dt");
    if ( !(T    >= dt) ) throw std::runtime_error("Simulation duration T shorter than dt");

    if ( !std::isfinite(theta_A) || !std::isfinite(theta_0) ) throw std::runtime_error("Non-finite stroke angles");

    if ( n_sweep <= 0 ) throw std::runtime_error("Need a positive number of sweep runs");
    if ( (n_sweep > 1) && !std::isfinite(theta_0_max) ) throw std::runtime_error("Non-finite sweep bound theta_0_max");

    if ( (integrator != "euler") && (integrator != "ab2") ) throw std::runtime_error("Unsupported integrator " + integrator);

    if ( output.empty() ) throw std::runtime_error("Empty output file name");
}

// ============================
/* Checks specific to the slender body discretisation */
// ============================
template<typename number>
void SimParams<number>::ValidateSlenderBody() const
{
    if ( n_cc < 2 )      throw std::runtime_error("Need at least 2 Clenshaw-Curtis intervals");
    if ( !(a_fil > 0.) ) throw std::runtime_error("Need a positive filament radius a");
}

// ============================
/* Number of steps k such that k*dt < T */
// ============================
template<typename number>
uint SimParams<number>::NumSteps() const
{
    number tol = std::max<number>(TOL_TIME, 16.*std::numeric_limits<number>::epsilon());

    return (uint)std::ceil(T/dt - tol);
}

// ============================
/* Tilt angle sweep - evenly spaced theta_0 in [theta_0, theta_0_max] */
// ============================
template<typename number>
SimParams<number> SimParams<number>::SweepRun(uint idx_run) const
{
    if ( idx_run >= (uint)n_sweep ) throw std::runtime_error("Sweep run index out of range");

    SimParams<number> Params_run(*this);

    if ( n_sweep > 1 ) Params_run.theta_0 = theta_0 + (theta_0_max - theta_0) * idx_run / (n_sweep - 1.);

    Params_run.n_sweep = 1;
    Params_run.output  = SweepOutput(idx_run);

    return Params_run;
}

// ============================
/* Run output file - stem_idx.ext within a sweep */
// ============================
template<typename number>
std::string SimParams<number>::SweepOutput(uint idx_run) const
{
    if ( n_sweep <= 1 ) return output;

    size_t pos_ext = output.find_last_of('.');
    size_t pos_dir = output.find_last_of('/');

    if ( (pos_ext == std::string::npos) || ((pos_dir != std::string::npos) && (pos_ext < pos_dir)) )
    {
        return output + "_" + std::to_string(idx_run);
    }

    return output.substr(0, pos_ext) + "_" + std::to_string(idx_run) + output.substr(pos_ext);
}

template struct SimParams<float>;
template struct SimParams<double>;
