#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

static std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool YamlConfig::load(const char* filename) {
    std::ifstream f(filename);
    if (!f) return false;
    std::stringstream ss;
    ss << f.rdbuf();
    parse(ss.str());
    return true;
}

void YamlConfig::parse(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::string prefix[8];
    while (std::getline(in, line)) {
        // Strip comments
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        std::string trimmed = trim(line);
        if (trimmed.empty()) continue;
        // Indent level
        int indent = 0;
        for (char c : line) { if (c == ' ') indent++; else break; }
        int level = std::min(indent / 2, 7);
        size_t colon = trimmed.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(trimmed.substr(0, colon));
        std::string value = trim(trimmed.substr(colon + 1));
        prefix[level] = key;
        if (value.empty()) continue;  // parent key
        std::string full_key;
        for (int i = 0; i < level; i++) full_key += prefix[i] + ".";
        full_key += key;
        data[full_key] = value;
    }
}

int YamlConfig::get_int(const std::string& key, int def) const {
    auto it = data.find(key);
    if (it == data.end()) return def;
    return (int)std::strtol(it->second.c_str(), nullptr, 10);
}

double YamlConfig::get_double(const std::string& key, double def) const {
    auto it = data.find(key);
    if (it == data.end()) return def;
    return std::strtod(it->second.c_str(), nullptr);
}

bool YamlConfig::get_bool(const std::string& key, bool def) const {
    auto it = data.find(key);
    if (it == data.end()) return def;
    const std::string& v = it->second;
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return def;
}

Vec YamlConfig::get_vec(const std::string& key, Vec def) const {
    auto it = data.find(key);
    if (it == data.end()) return def;
    double x, y, z;
    if (sscanf(it->second.c_str(), "[%lf, %lf, %lf]", &x, &y, &z) == 3)
        return Vec(x, y, z);
    if (sscanf(it->second.c_str(), "[%lf,%lf,%lf]", &x, &y, &z) == 3)
        return Vec(x, y, z);
    return def;
}

std::string YamlConfig::get_string(const std::string& key, const std::string& def) const {
    auto it = data.find(key);
    if (it == data.end()) return def;
    return it->second;
}

// --- Render configuration ---

void RenderConfig::load_from_yaml(const YamlConfig& cfg) {
    update_rate = cfg.get_double("render.update_rate", update_rate);
    samples_per_pixel = cfg.get_int("render.samples_per_pixel", samples_per_pixel);
    max_depth = cfg.get_int("render.max_depth", max_depth);
    threads = cfg.get_int("render.threads", threads);

    origin = cfg.get_vec("camera.origin", origin);
    focal_length = cfg.get_double("camera.focal_length", focal_length);

    trace_batches = cfg.get_bool("logging.trace_batches", trace_batches);
}

std::string RenderConfig::validate() const {
    char msg[128];
    if (!std::isfinite(update_rate) || update_rate <= 0) {
        snprintf(msg, sizeof(msg), "render.update_rate must be positive (got %g)", update_rate);
        return msg;
    }
    if (samples_per_pixel < 1) {
        snprintf(msg, sizeof(msg), "render.samples_per_pixel must be at least 1 (got %d)", samples_per_pixel);
        return msg;
    }
    // Shading recurses once per bounce.
    if (max_depth < 0 || max_depth > 1024) {
        snprintf(msg, sizeof(msg), "render.max_depth must be in [0, 1024] (got %d)", max_depth);
        return msg;
    }
    if (threads < 0) {
        snprintf(msg, sizeof(msg), "render.threads must not be negative (got %d)", threads);
        return msg;
    }
    if (!std::isfinite(focal_length) || focal_length <= 0) {
        snprintf(msg, sizeof(msg), "camera.focal_length must be positive (got %g)", focal_length);
        return msg;
    }
    return "";
}

// --- Viewer configuration ---

void ViewerConfig::load_from_yaml(const YamlConfig& cfg) {
    width = cfg.get_int("window.width", width);
    height = cfg.get_int("window.height", height);
    title = cfg.get_string("window.title", title);
    overlay = cfg.get_bool("window.overlay", overlay);
}

std::string ViewerConfig::validate() const {
    if (width <= 0 || height <= 0) {
        char msg[96];
        snprintf(msg, sizeof(msg), "window size must be positive (got %dx%d)", width, height);
        return msg;
    }
    return "";
}
