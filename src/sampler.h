#pragma once

#include "geometry.h"
#include "vec.h"

#include <array>
#include <cstdint>
#include <random>

using Rgba8 = std::array<uint8_t, 4>;

// Pinhole camera. viewport is the image plane extent at focal_length.
struct Camera {
    Vec origin;
    double focal_length = 1.0;
    Vec2 viewport{2.0, 2.0};

    // uv in [0,1]^2, (0,0) at the bottom-left of the image plane.
    Ray ray(const Vec2& uv) const;
};

// Piecewise sRGB transfer, scaled by 256 and clamped into a byte.
uint8_t linear_to_srgb_byte(double c);
Rgba8 linear_to_srgb(const Color& c);

// Averages samples jittered inside the pixel footprint starting at uv.
Rgba8 sample_pixel(const Scene& scene, std::mt19937& rng, const Camera& camera,
                   const Vec2& uv, const Vec2& pixel_size,
                   int samples, int max_depth);
