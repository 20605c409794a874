#pragma once

#include "pathtracer/pch.hpp"
#include "pathtracer/types.hpp"

// All samplers draw from the process-wide std::rand stream, the same one
// glm::linearRand reads. Seeding it makes a render reproducible.
void seed_random(unsigned seed);

// Uniform in [0, 1), 1 excluded
oreal uniform01();

// Rejection sampled, uniform inside the unit ball. The loop is not capped;
// each trial is accepted with probability pi/6
ovec3 random_in_unit_sphere();

// Rejection sampled, uniform inside the unit disk in the xy-plane (z = 0)
ovec3 random_in_unit_disk();
