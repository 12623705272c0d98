// ===================================================================
/**
 * MPI datatype wrappers for templated reductions.
 */
// ===================================================================
/*
 * Utils.cpp: Version 1.0
 * Created 19/10/2026
 */
// ===================================================================

#include "Utils.hpp"


// ============================
/* Wrappers for MPI datatypes */
// ============================
template<> Utils<float> ::Utils(): MPI_type(MPI_FLOAT)    {}
template<> Utils<double>::Utils(): MPI_type(MPI_DOUBLE)   {}

template<> Utils<uint>  ::Utils(): MPI_type(MPI_UNSIGNED) {}
