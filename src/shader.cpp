#include "shader.h"

#include <limits>

static const double SHADOW_ACNE_T = 0.001;
static const double DIFFUSE_ALBEDO = 0.5;
static const Color SKY_ZENITH(0.25, 0.49, 1.0, 1.0);

Vec random_unit_vector(std::mt19937& rng) {
    std::normal_distribution<double> gauss(0.0, 1.0);
    while (true) {
        Vec v(gauss(rng), gauss(rng), gauss(rng));
        double l2 = v.len2();
        if (l2 > 1e-12) return v / std::sqrt(l2);
    }
}

Color sky_color(const Vec& direction) {
    double t = 0.5 * (direction.norm().y + 1.0);
    return Color(1, 1, 1, 1).lerp(SKY_ZENITH, t);
}

Color trace_color(const Scene& scene, std::mt19937& rng, const Ray& ray, int depth) {
    if (depth <= 0) return Color(0, 0, 0, 1);

    Interval range{SHADOW_ACNE_T, std::numeric_limits<double>::infinity()};
    auto hit = scene.nearest_hit(ray, range);
    if (!hit) return sky_color(ray.direction);

    Ray next(hit->at, hit->normal + random_unit_vector(rng));
    return trace_color(scene, rng, next, depth - 1).scale_rgb(DIFFUSE_ALBEDO);
}
