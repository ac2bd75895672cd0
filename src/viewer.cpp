#include "viewer.h"
#include "frame_buffer.h"
#include "geometry.h"
#include "render_job.h"

#include <SDL2/SDL.h>
#include <GL/glew.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <vector>

// ---------------------------------------------------------------------------
// Render target backed by the window
// ---------------------------------------------------------------------------

class WindowSurface : public RenderTarget {
public:
    WindowSurface(FrameBuffer& frame, Uint32 redraw_event)
        : frame_(frame), redraw_event_(redraw_event) {}

    SurfaceSize current_surface_size() override { return frame_.size(); }

    // SDL_PushEvent is safe to call from the render thread.
    void request_redraw() override {
        SDL_Event ev;
        SDL_zero(ev);
        ev.type = redraw_event_;
        if (SDL_PushEvent(&ev) < 0)
            fprintf(stderr, "SDL_PushEvent error: %s\n", SDL_GetError());
    }

    FrameLock lock_frame_buffer() override { return frame_.lock(); }

private:
    FrameBuffer& frame_;
    Uint32 redraw_event_;
};

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

struct ViewerState {
    SDL_Window* window = nullptr;
    RenderConfig config;
    bool show_overlay = true;

    std::shared_ptr<const Scene> scene;
    FrameBuffer frame;
    std::unique_ptr<WindowSurface> surface;
    RenderJob job;

    // Presented texture
    GLuint tex = 0;
    SurfaceSize tex_size;

    const char* status = "starting";
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static SurfaceSize drawable_size(SDL_Window* window) {
    int w, h;
    SDL_GL_GetDrawableSize(window, &w, &h);
    return SurfaceSize{w, h};
}

static void upload_frame(ViewerState& s) {
    SurfaceSize size = s.frame.size();
    std::vector<uint8_t> px = s.frame.snapshot();
    if (px.size() != size.byte_length() || size.width == 0 || size.height == 0) return;

    if (!s.tex || s.tex_size != size) {
        if (s.tex) glDeleteTextures(1, &s.tex);
        glGenTextures(1, &s.tex);
        glBindTexture(GL_TEXTURE_2D, s.tex);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, size.width, size.height, 0,
                     GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
        s.tex_size = size;
    }
    glBindTexture(GL_TEXTURE_2D, s.tex);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, size.width, size.height,
                    GL_RGBA, GL_UNSIGNED_BYTE, px.data());
}

static void trigger_render(ViewerState& s) {
    s.job.restart(s.scene, *s.surface, s.config);
    s.status = "rendering";
}

static void handle_resize(ViewerState& s) {
    SurfaceSize size = drawable_size(s.window);
    if (size == s.frame.size()) return;
    s.frame.resize(size);
    trigger_render(s);
}

// ---------------------------------------------------------------------------
// Panel: render status
// ---------------------------------------------------------------------------

static void panel_status(ViewerState& s) {
    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowBgAlpha(0.75f);
    ImGui::Begin("Render", nullptr, ImGuiWindowFlags_AlwaysAutoResize);

    SurfaceSize size = s.frame.size();
    ImGui::Text("%dx%d  %d spp  depth %d", size.width, size.height,
                s.config.samples_per_pixel, s.config.max_depth);

    bool active = s.job.is_running();
    if (active) {
        if (ImGui::Button("Cancel", ImVec2(80, 0)))
            s.job.request_cancel();
    } else {
        if (ImGui::Button("Render", ImVec2(80, 0)))
            trigger_render(s);
    }
    ImGui::SameLine();
    int total = s.job.rows_total();
    float pct = total > 0 ? (float)s.job.rows_done() / (float)total : 0.0f;
    ImGui::ProgressBar(pct, ImVec2(200, 0), s.status);

    ImGui::End();
}

static void update_status(ViewerState& s) {
    if (s.job.is_running()) return;
    auto outcome = s.job.last_outcome();
    if (outcome) s.status = to_string(*outcome);
}

// ---------------------------------------------------------------------------
// Main loop
// ---------------------------------------------------------------------------

static void run_loop(ViewerState& s, Uint32 redraw_event) {
    bool running = true;
    while (running) {
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            ImGui_ImplSDL2_ProcessEvent(&ev);
            if (ev.type == SDL_QUIT)
                running = false;
            if (ev.type == SDL_WINDOWEVENT && ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
                handle_resize(s);
            if (ev.type == SDL_KEYDOWN && !ImGui::GetIO().WantCaptureKeyboard) {
                if (ev.key.keysym.sym == SDLK_ESCAPE) running = false;
                if (ev.key.keysym.sym == SDLK_r) trigger_render(s);
            }
            if (ev.type == redraw_event)
                upload_frame(s);
        }

        update_status(s);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        if (s.tex) {
            ImGuiIO& io = ImGui::GetIO();
            ImGui::GetBackgroundDrawList()->AddImage((ImTextureID)(intptr_t)s.tex,
                                                     ImVec2(0, 0), io.DisplaySize);
        }
        if (s.show_overlay)
            panel_status(s);

        SurfaceSize disp = drawable_size(s.window);
        glViewport(0, 0, disp.width, disp.height);
        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(s.window);
    }
}

int viewer_main(const RenderConfig& render, const ViewerConfig& viewer) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }

    Uint32 redraw_event = SDL_RegisterEvents(1);
    if (redraw_event == (Uint32)-1) {
        fprintf(stderr, "SDL_RegisterEvents error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(viewer.title.c_str(),
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        viewer.width, viewer.height,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_ctx = SDL_GL_CreateContext(window);
    if (!gl_ctx) {
        fprintf(stderr, "SDL_GL_CreateContext error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_ctx);
    SDL_GL_SetSwapInterval(1);

    glewExperimental = GL_TRUE;
    GLenum glewErr = glewInit();
    if (glewErr != GLEW_OK) {
        fprintf(stderr, "glewInit error: %s\n", glewGetErrorString(glewErr));
        SDL_GL_DeleteContext(gl_ctx);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr; // Don't save layout to file
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 2.0f;
    style.FrameRounding = 2.0f;

    ImGui_ImplSDL2_InitForOpenGL(window, gl_ctx);
    ImGui_ImplOpenGL3_Init("#version 330");

    int rc = 0;
    {
        ViewerState state;
        state.window = window;
        state.config = render;
        state.show_overlay = viewer.overlay;
        state.scene = std::make_shared<const Scene>(Scene::default_scene());
        state.surface = std::make_unique<WindowSurface>(state.frame, redraw_event);

        try {
            state.frame.resize(drawable_size(window));
            trigger_render(state);
            run_loop(state, redraw_event);
            state.job.cancel_and_join();
        } catch (const std::exception& e) {
            fprintf(stderr, "Render job failed: %s\n", e.what());
            rc = 1;
        }
        if (state.tex) glDeleteTextures(1, &state.tex);
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_ctx);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return rc;
}
