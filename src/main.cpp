#include "config.h"
#include "viewer.h"

#include <cstdio>
#include <string>

int main(int argc, char* argv[]) {
    RenderConfig render;
    ViewerConfig viewer;

    if (argc > 2) {
        fprintf(stderr, "Usage: %s [config.yaml]\n", argv[0]);
        return 1;
    }
    if (argc == 2) {
        const char* config_file = argv[1];
        YamlConfig yaml;
        if (!yaml.load(config_file)) {
            fprintf(stderr, "Error: could not load %s\n", config_file);
            return 1;
        }
        std::string version = yaml.get_string("version");
        if (version != LIVETRACE_CONFIG_VERSION) {
            fprintf(stderr, "Error: unsupported config version '%s' (expected %s)\n",
                    version.c_str(), LIVETRACE_CONFIG_VERSION);
            return 1;
        }
        render.load_from_yaml(yaml);
        viewer.load_from_yaml(yaml);
        printf("Loaded config: %s\n", config_file);
    }

    std::string err = render.validate();
    if (err.empty()) err = viewer.validate();
    if (!err.empty()) {
        fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    printf("livetrace\n");
    printf("  %d samples/pixel, max depth %d, %.0f updates/s\n",
           render.samples_per_pixel, render.max_depth, render.update_rate);
    if (render.threads > 0)
        printf("  Using %d threads\n", render.threads);
    fflush(stdout);

    return viewer_main(render, viewer);
}
