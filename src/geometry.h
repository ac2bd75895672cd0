#pragma once

#include "vec.h"

#include <limits>
#include <optional>
#include <vector>

struct Ray {
    Vec origin, direction;
    Ray(const Vec& origin, const Vec& direction) : origin(origin), direction(direction) {}
    Vec at(double t) const { return origin + direction * t; }
};

// Half-open parameter range [start, end) along a ray.
struct Interval {
    double start = 0.0;
    double end = std::numeric_limits<double>::infinity();
    bool contains(double t) const { return t >= start && t < end; }
};

enum class Face { Front, Back };

inline Face opposite(Face f) { return f == Face::Front ? Face::Back : Face::Front; }

struct HitReport {
    double t;
    Vec at;
    Vec normal;  // unit length, faces the incoming ray
    Face face;
};

struct Sphere {
    Vec center;
    double radius;

    // Near root only: a ray starting inside the sphere misses it.
    std::optional<HitReport> hit(const Ray& ray, Interval range) const;
};

class Scene {
public:
    Scene() = default;
    explicit Scene(std::vector<Sphere> spheres) : spheres_(std::move(spheres)) {}

    // Closest hit over all spheres with t inside range.
    std::optional<HitReport> nearest_hit(const Ray& ray, Interval range) const;

    const std::vector<Sphere>& spheres() const { return spheres_; }

    // Small sphere at (0,0,-1) resting on a large ground sphere.
    static Scene default_scene();

private:
    std::vector<Sphere> spheres_;
};
