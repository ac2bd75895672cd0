#pragma once

#include "geometry.h"
#include "vec.h"

#include <random>

// Uniformly distributed point on the unit sphere surface.
Vec random_unit_vector(std::mt19937& rng);

// Vertical white-to-blue gradient for rays that leave the scene.
Color sky_color(const Vec& direction);

// Monte-Carlo estimate of the light arriving along ray, bouncing diffusely
// at most depth times. Each bounce halves the RGB; alpha stays 1.
Color trace_color(const Scene& scene, std::mt19937& rng, const Ray& ray, int depth);
