#include "sampler.h"
#include "shader.h"

Ray Camera::ray(const Vec2& uv) const {
    Vec2 p = (uv - Vec2(0.5, 0.5)).cmul(viewport);
    return Ray(origin, Vec(p.x, p.y, -focal_length));
}

uint8_t linear_to_srgb_byte(double c) {
    double s = c <= 0.0031308 ? 12.92 * c : 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
    return (uint8_t)std::clamp(s * 256.0, 0.0, 255.0);
}

Rgba8 linear_to_srgb(const Color& c) {
    return {linear_to_srgb_byte(c.r), linear_to_srgb_byte(c.g),
            linear_to_srgb_byte(c.b), linear_to_srgb_byte(c.a)};
}

Rgba8 sample_pixel(const Scene& scene, std::mt19937& rng, const Camera& camera,
                   const Vec2& uv, const Vec2& pixel_size,
                   int samples, int max_depth) {
    std::uniform_real_distribution<double> jitter(0.0, 1.0);
    Color sum(0, 0, 0, 0);
    for (int s = 0; s < samples; s++) {
        Vec2 offset(jitter(rng), jitter(rng));
        Ray r = camera.ray(uv + offset.cmul(pixel_size));
        sum = sum + trace_color(scene, rng, r, max_depth).clamp01();
    }
    if (samples <= 0) return linear_to_srgb(sum);
    return linear_to_srgb(sum * (1.0 / samples));
}
