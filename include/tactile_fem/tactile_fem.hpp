#pragma once

#include "errors.hpp"
#include "mesh.hpp"
#include "mesh_io.hpp"
#include "primitives.hpp"
#include "material.hpp"
#include "problem.hpp"
#include "stiffness.hpp"
#include "solver.hpp"
#include "surface.hpp"
#include "sensor.hpp"
#include "footprint.hpp"
#include "grid.hpp"
#include "fields.hpp"
#include "result_cache.hpp"
#include "simulator.hpp"

/*
 * TactileFEM: a header-only finite element engine for vision-based tactile
 * sensors: an elastomer pad pressed by rigid indenters.
 *
 * Features:
 *  - Linear tetrahedral elasticity with a pluggable constitutive model.
 *  - Deterministic CSR assembly and a statically condensed solve with
 *    preconditioned conjugate gradient or dense Cholesky.
 *  - Footprint derivation for non-flat indenters loaded from STL or Medit
 *    meshes.
 *  - Depth-field and marker-displacement readouts on fixed sensor grids.
 *  - A write-once, content-addressed on-disk result cache so calibration
 *    sweeps never solve the same (object, E, nu, depth) twice.
 *  - Console output through the shared safe_io utilities (fmt).
 */
