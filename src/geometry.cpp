#include "geometry.h"

std::optional<HitReport> Sphere::hit(const Ray& ray, Interval range) const {
    Vec oc = ray.origin - center;
    double a = ray.direction.len2();
    double b = oc.dot(ray.direction);
    double c = oc.len2() - radius * radius;
    double disc = b*b - a*c;
    if (disc < 0) return std::nullopt;

    double t = (-b - std::sqrt(disc)) / a;
    if (!range.contains(t)) return std::nullopt;

    HitReport h;
    h.t = t;
    h.at = ray.at(t);
    h.normal = (h.at - center) / radius;
    h.face = Face::Front;
    if (h.normal.dot(ray.direction) > 0) {
        h.normal = -h.normal;
        h.face = opposite(h.face);
    }
    return h;
}

std::optional<HitReport> Scene::nearest_hit(const Ray& ray, Interval range) const {
    std::optional<HitReport> best;
    for (const auto& s : spheres_) {
        if (auto h = s.hit(ray, range)) {
            best = h;
            range.end = h->t;
        }
    }
    return best;
}

Scene Scene::default_scene() {
    return Scene({
        Sphere{Vec(0, -100.5, -1), 100.0},
        Sphere{Vec(0, 0, -1), 0.5},
    });
}
