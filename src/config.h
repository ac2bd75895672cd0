#pragma once

#include "vec.h"

#include <map>
#include <string>

#define LIVETRACE_CONFIG_VERSION "livetrace@1"

// --- Minimal YAML reader (no external deps) ---
//
// Indentation-based key/value pairs only. Nested keys are flattened with '.',
// so
//   render:
//     samples_per_pixel: 8
// is stored as "render.samples_per_pixel" -> "8". '#' starts a comment.

struct YamlConfig {
    std::map<std::string, std::string> data;

    bool load(const char* filename);
    void parse(const std::string& text);

    int get_int(const std::string& key, int def) const;
    double get_double(const std::string& key, double def) const;
    bool get_bool(const std::string& key, bool def) const;
    Vec get_vec(const std::string& key, Vec def) const;
    std::string get_string(const std::string& key, const std::string& def = "") const;
};

// Fixed for the lifetime of one render job.
struct RenderConfig {
    double update_rate = 30.0;   // target batch flushes per second
    int samples_per_pixel = 16;
    int max_depth = 16;
    int threads = 0;             // 0 = hardware concurrency

    Vec origin{0, 0, 0};
    double focal_length = 1.0;

    bool trace_batches = false;

    void load_from_yaml(const YamlConfig& cfg);

    // Empty when valid, otherwise a description of the first bad value.
    std::string validate() const;

    double target_interval() const { return 1.0 / update_rate; }
};

struct ViewerConfig {
    int width = 960, height = 540;
    std::string title = "livetrace";
    bool overlay = true;

    void load_from_yaml(const YamlConfig& cfg);
    std::string validate() const;
};
