#pragma once

#include <algorithm>
#include <cmath>

struct Vec {
    double x, y, z;
    Vec(double x=0, double y=0, double z=0) : x(x), y(y), z(z) {}
    Vec operator+(const Vec& b) const { return {x+b.x, y+b.y, z+b.z}; }
    Vec operator-(const Vec& b) const { return {x-b.x, y-b.y, z-b.z}; }
    Vec operator-() const { return {-x, -y, -z}; }
    Vec operator*(double s) const { return {x*s, y*s, z*s}; }
    Vec operator/(double s) const { return {x/s, y/s, z/s}; }
    double dot(const Vec& b) const { return x*b.x + y*b.y + z*b.z; }
    double len2() const { return x*x + y*y + z*z; }
    double len() const { return std::sqrt(len2()); }
    Vec norm() const { double d = len(); return d > 0 ? *this * (1.0/d) : Vec(); }
};

struct Vec2 {
    double x, y;
    Vec2(double x=0, double y=0) : x(x), y(y) {}
    Vec2 operator+(const Vec2& b) const { return {x+b.x, y+b.y}; }
    Vec2 operator-(const Vec2& b) const { return {x-b.x, y-b.y}; }
    Vec2 cmul(const Vec2& b) const { return {x*b.x, y*b.y}; }
};

// Linear RGBA.
struct Color {
    double r, g, b, a;
    Color(double r=0, double g=0, double b=0, double a=1) : r(r), g(g), b(b), a(a) {}
    Color operator+(const Color& o) const { return {r+o.r, g+o.g, b+o.b, a+o.a}; }
    Color operator*(double s) const { return {r*s, g*s, b*s, a*s}; }
    Color scale_rgb(double s) const { return {r*s, g*s, b*s, a}; }
    Color clamp01() const {
        return {std::clamp(r, 0.0, 1.0), std::clamp(g, 0.0, 1.0),
                std::clamp(b, 0.0, 1.0), std::clamp(a, 0.0, 1.0)};
    }
    Color lerp(const Color& to, double t) const { return *this * (1.0 - t) + to * t; }
};
