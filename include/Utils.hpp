#ifndef UTILS_HPP_
#define UTILS_HPP_

#include <mpi.h>

#include "globals.hpp"


template<typename number>
struct Utils
{
    Utils();

    MPI_Datatype MPI_type;
};

#endif
