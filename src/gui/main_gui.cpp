// ShyRadar GUI - radar surface over the simulated adapter
// Uses Dear ImGui with the SDL2 platform and SDL_Renderer backends

#include "radar_app.hpp"
#include "shyradar/logging.hpp"

#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_sdlrenderer2.h"

#include <SDL.h>

#include <cstdio>
#include <cstring>
#include <string>

static void printGuiUsage(const char* prog) {
    std::fprintf(stderr, "Usage: %s [-c settings.ini] [-d users.ini] [-s scenario.scn] [-v] [--software]\n",
                 prog);
}

int main(int argc, char* argv[]) {
    shyradar::gui::RadarApp::Options opts;
    bool force_software_renderer = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "-d" && i + 1 < argc) {
            opts.directory_path = argv[++i];
        } else if (arg == "-s" && i + 1 < argc) {
            opts.scenario_path = argv[++i];
        } else if (arg == "-v") {
            shyradar::setLogLevel(shyradar::LogLevel::DEBUG);
        } else if (arg == "--software") {
            force_software_renderer = true;
        } else if (arg == "-h" || arg == "--help") {
            printGuiUsage(argv[0]);
            return 0;
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            printGuiUsage(argv[0]);
            return 1;
        }
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        const char* sdl_err = SDL_GetError();
        std::fprintf(stderr, "Error: SDL_Init failed: %s\n", sdl_err ? sdl_err : "<unknown>");
        return 1;
    }
    LOG_ENGINE(DEBUG, "SDL initialized");

    SDL_Window* window = nullptr;
    SDL_Renderer* sdl_renderer = nullptr;

    auto failStartup = [&](const std::string& msg) -> int {
        std::fprintf(stderr, "Error: %s\n", msg.c_str());
        if (sdl_renderer) {
            SDL_DestroyRenderer(sdl_renderer);
        }
        if (window) {
            SDL_DestroyWindow(window);
        }
        SDL_Quit();
        return 1;
    };

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    window = SDL_CreateWindow(
        "ShyRadar",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        1000, 640,
        window_flags
    );
    if (!window) {
        const char* sdl_err = SDL_GetError();
        return failStartup(std::string("SDL_CreateWindow failed: ") + (sdl_err ? sdl_err : "<unknown>"));
    }

    if (!force_software_renderer) {
        sdl_renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!sdl_renderer) {
            LOG_ENGINE(WARN, "Accelerated SDL renderer unavailable: %s", SDL_GetError());
        }
    }
    if (!sdl_renderer) {
        sdl_renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!sdl_renderer) {
        const char* sdl_err = SDL_GetError();
        return failStartup(std::string("SDL_CreateRenderer failed: ") + (sdl_err ? sdl_err : "<unknown>"));
    }

    SDL_RendererInfo renderer_info{};
    if (SDL_GetRendererInfo(sdl_renderer, &renderer_info) == 0) {
        LOG_ENGINE(INFO, "SDL renderer: %s", renderer_info.name ? renderer_info.name : "<unnamed>");
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    // Dark theme
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;

    if (!ImGui_ImplSDL2_InitForSDLRenderer(window, sdl_renderer)) {
        ImGui::DestroyContext();
        return failStartup("ImGui_ImplSDL2_InitForSDLRenderer failed");
    }
    if (!ImGui_ImplSDLRenderer2_Init(sdl_renderer)) {
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        return failStartup("ImGui_ImplSDLRenderer2_Init failed");
    }

    {
        shyradar::gui::RadarApp app(opts);

        bool running = true;
        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL2_ProcessEvent(&event);

                if (event.type == SDL_QUIT) {
                    running = false;
                }
                if (event.type == SDL_WINDOWEVENT &&
                    event.window.event == SDL_WINDOWEVENT_CLOSE &&
                    event.window.windowID == SDL_GetWindowID(window)) {
                    running = false;
                }
            }

            ImGui_ImplSDLRenderer2_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            app.render();

            ImGui::Render();
            SDL_SetRenderDrawColor(sdl_renderer, 26, 26, 31, 255);
            SDL_RenderClear(sdl_renderer);
            ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), sdl_renderer);
            SDL_RenderPresent(sdl_renderer);
        }
    }

    // Cleanup
    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(sdl_renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
