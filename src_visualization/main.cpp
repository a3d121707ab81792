// Ant Colony Q-Learning with SDL2 Visualization
// Runs the same engine as the headless versions, plus a map editor and a
// rewind timeline

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../src_headless/common/config.hpp"
#include "../src_headless/common/game_manager.hpp"
#include "../src_headless/common/map_editor.hpp"
#include "color.hpp"
#include "config.hpp"

enum class Screen : int {
    EDITOR = 0,
    GAME = 1
};

// ============================================================================
// View Class - SDL2 Visualization
// ============================================================================

class View {
   public:
    SDL_Window* window;
    SDL_Renderer* renderer;
    TTF_Font* font;
    bool running;
    bool paused;
    bool painting;
    bool show_food_trails;
    bool show_nest_trails;
    bool reported_finish;
    int cell_size;
    int simulation_speed;
    double simulation_time_ms;
    uint64_t simulated_ticks;

    SimulationConfig config;
    Screen screen;
    std::optional<AntsGameManager> manager;
    std::optional<MapEditor> editor;

    View(const SimulationConfig& config)
        : window(nullptr),
          renderer(nullptr),
          font(nullptr),
          running(true),
          paused(true),
          painting(false),
          show_food_trails(true),
          show_nest_trails(true),
          reported_finish(false),
          cell_size(MIN_CELL_SIZE),
          simulation_speed(static_cast<int>(std::min<uint32_t>(std::max<uint32_t>(config.simulation_speed, 1), MAX_SIMULATION_SPEED))),
          simulation_time_ms(0),
          simulated_ticks(0),
          config(config),
          screen(Screen::GAME) {
        uint32_t longest = std::max(config.grid_width, config.grid_height);
        cell_size = std::max(MIN_CELL_SIZE, std::min(MAX_CELL_SIZE, static_cast<int>(MAX_BOARD_PIXELS / longest)));
    }

    ~View() {
        cleanup();
    }

    bool init() {
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            std::cerr << "SDL init failed: " << SDL_GetError() << std::endl;
            return false;
        }

        if (TTF_Init() < 0) {
            std::cerr << "TTF init failed: " << TTF_GetError() << std::endl;
            return false;
        }

        int window_width = std::max(640, static_cast<int>(config.grid_width) * cell_size);
        int window_height = static_cast<int>(config.grid_height) * cell_size + HUD_HEIGHT;

        window = SDL_CreateWindow(
            "Ant Colony Q-Learning (Visualization)",
            SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
            window_width, window_height,
            SDL_WINDOW_SHOWN);

        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
        if (!renderer) {
            renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

        const char* font_paths[] = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
            nullptr};

        for (int i = 0; font_paths[i] != nullptr; ++i) {
            font = TTF_OpenFont(font_paths[i], 14);
            if (font)
                break;
        }

        if (!font) {
            std::cerr << "Warning: Could not load font, HUD will be disabled" << std::endl;
        }

        return true;
    }

    void cleanup() {
        if (font)
            TTF_CloseFont(font);
        if (renderer)
            SDL_DestroyRenderer(renderer);
        if (window)
            SDL_DestroyWindow(window);
        font = nullptr;
        renderer = nullptr;
        window = nullptr;
        TTF_Quit();
        SDL_Quit();
    }

    // ------------------------------------------------------------------------
    // Simulation control
    // ------------------------------------------------------------------------

    void newRandomGame() {
        manager.emplace(AntsGameManager::random(config.grid_width, config.grid_height, make_colony(config), config));
        screen = Screen::GAME;
        paused = true;
        reported_finish = false;
        simulation_time_ms = 0;
        simulated_ticks = 0;
    }

    void openEditor() {
        editor.emplace(config.grid_width, config.grid_height);
        screen = Screen::EDITOR;
        paused = true;
        painting = false;
    }

    void launchEditedMap() {
        if (!editor || !editor->is_valid())
            return;

        manager.emplace(editor->get_width(), editor->get_height(), editor->to_tiles(), make_colony(config), config);
        editor.reset();
        screen = Screen::GAME;
        paused = true;
        reported_finish = false;
        simulation_time_ms = 0;
        simulated_ticks = 0;
    }

    void rewindTo(size_t tick) {
        if (!manager)
            return;
        paused = true;
        manager->restore_snapshot(tick);
        reported_finish = false;
    }

    void stepSimulation() {
        if (!manager || paused)
            return;

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < simulation_speed; ++i) {
            if (manager->is_game_finished() || manager->current_tick() >= config.max_ticks)
                break;
            manager->game_step();
            simulated_ticks++;
        }
        auto end = std::chrono::high_resolution_clock::now();
        simulation_time_ms += std::chrono::duration<double, std::milli>(end - start).count();

        if (manager->is_game_finished() && !reported_finish) {
            reported_finish = true;
            paused = true;
            std::cout << "\n=== Simulation Complete ===" << std::endl;
            std::cout << "Finished at tick " << manager->current_tick() << std::endl;
            std::cout << "Food stored in nest: " << manager->get_grid().nest_stored_food().value_or(0) << std::endl;
            if (simulated_ticks > 0)
                std::cout << "Average time per tick: " << (simulation_time_ms / simulated_ticks) << " ms" << std::endl;
        }
    }

    // ------------------------------------------------------------------------
    // Input
    // ------------------------------------------------------------------------

    void handleEvents() {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            } else if (event.type == SDL_KEYDOWN) {
                if (event.key.keysym.sym == SDLK_ESCAPE || event.key.keysym.sym == SDLK_q) {
                    running = false;
                } else if (screen == Screen::EDITOR) {
                    handleEditorKey(event.key.keysym.sym);
                } else {
                    handleGameKey(event.key.keysym.sym);
                }
            } else if (screen == Screen::EDITOR) {
                handleEditorMouse(event);
            }
        }
    }

    void handleGameKey(SDL_Keycode key) {
        switch (key) {
            case SDLK_SPACE:
                if (manager)
                    paused = !paused;
                break;
            case SDLK_LEFT:
                if (manager && manager->current_tick() > manager->history_begin())
                    rewindTo(manager->current_tick() - 1);
                break;
            case SDLK_RIGHT:
                if (manager && manager->current_tick() + 1 < manager->history_end())
                    rewindTo(manager->current_tick() + 1);
                break;
            case SDLK_HOME:
                if (manager)
                    rewindTo(manager->history_begin());
                break;
            case SDLK_END:
                if (manager)
                    rewindTo(manager->history_end() - 1);
                break;
            case SDLK_UP:
                simulation_speed = std::min(simulation_speed * 2, MAX_SIMULATION_SPEED);
                break;
            case SDLK_DOWN:
                simulation_speed = std::max(simulation_speed / 2, 1);
                break;
            case SDLK_f:
                show_food_trails = !show_food_trails;
                break;
            case SDLK_n:
                show_nest_trails = !show_nest_trails;
                break;
            case SDLK_r:
                config.seed++;
                newRandomGame();
                break;
            case SDLK_e:
                openEditor();
                break;
        }
    }

    void handleEditorKey(SDL_Keycode key) {
        switch (key) {
            case SDLK_1:
                editor->select(TileType::DEFAULT);
                break;
            case SDLK_2:
                editor->select(TileType::WALL);
                break;
            case SDLK_3:
                editor->select(TileType::NEST);
                break;
            case SDLK_4:
                editor->select(TileType::FOOD_SOURCE);
                break;
            case SDLK_5:
                editor->select(TileType::DEATH_ZONE);
                break;
            case SDLK_c:
                editor->clear();
                break;
            case SDLK_RETURN:
            case SDLK_KP_ENTER:
                launchEditedMap();
                break;
        }
    }

    void handleEditorMouse(const SDL_Event& event) {
        if (event.type == SDL_MOUSEBUTTONDOWN && event.button.button == SDL_BUTTON_LEFT) {
            painting = true;
            paintAt(event.button.x, event.button.y);
        } else if (event.type == SDL_MOUSEBUTTONUP && event.button.button == SDL_BUTTON_LEFT) {
            painting = false;
        } else if (event.type == SDL_MOUSEMOTION && painting) {
            paintAt(event.motion.x, event.motion.y);
        }
    }

    void paintAt(int px, int py) {
        if (px < 0 || py < HUD_HEIGHT)
            return;
        editor->paint(static_cast<uint32_t>(px / cell_size), static_cast<uint32_t>((py - HUD_HEIGHT) / cell_size));
    }

    // ------------------------------------------------------------------------
    // Rendering
    // ------------------------------------------------------------------------

    void setColor(const rgb& color) {
        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    }

    // Square of the given fraction of a cell, centered in it
    void fillCell(uint32_t x, uint32_t y, double fraction) {
        int size = std::max(1, static_cast<int>(cell_size * fraction));
        int offset = (cell_size - size) / 2;
        SDL_Rect rect = {static_cast<int>(x) * cell_size + offset, HUD_HEIGHT + static_cast<int>(y) * cell_size + offset,
                         size, size};
        SDL_RenderFillRect(renderer, &rect);
    }

    void render() {
        setColor(background_color());
        SDL_RenderClear(renderer);

        if (screen == Screen::EDITOR && editor) {
            renderEditor();
        } else if (manager) {
            renderBoard();
        }

        renderHUD();

        SDL_RenderPresent(renderer);
    }

    void renderEditor() {
        for (uint32_t y = 0; y < editor->get_height(); y++) {
            for (uint32_t x = 0; x < editor->get_width(); x++) {
                setColor(tile_color(editor->get_tile(x, y)));
                fillCell(x, y, 0.9);
            }
        }
    }

    void renderBoard() {
        const Grid& grid = manager->get_grid();

        // Terrain
        for (uint32_t y = 0; y < grid.get_height(); y++) {
            for (uint32_t x = 0; x < grid.get_width(); x++) {
                TileType type = grid.get_tile(x, y)->type;
                if (type == TileType::WALL || type == TileType::DEATH_ZONE) {
                    setColor(tile_color(type));
                } else {
                    setColor(tile_color(TileType::DEFAULT));
                }
                fillCell(x, y, 0.95);
            }
        }

        if (show_food_trails)
            renderPheromones(manager->get_pheromones_food(), pheromone_color(AntMode::FINDING));
        if (show_nest_trails)
            renderPheromones(manager->get_pheromones_nest(), pheromone_color(AntMode::RETURNING));

        // Nest and food sources
        for (const Tile& tile : grid.get_tiles()) {
            if (tile.is_nest()) {
                setColor(tile_color(TileType::NEST));
                fillCell(tile.position.x, tile.position.y, 0.5);
            } else if (tile.type == TileType::FOOD_SOURCE) {
                setColor(tile.food > 0 ? tile_color(TileType::FOOD_SOURCE) : rgb(90, 90, 90));
                fillCell(tile.position.x, tile.position.y, 0.7);
            }
        }

        renderAnts();
    }

    void renderPheromones(const PheromoneMap& map, const rgb& base) {
        const Grid& grid = manager->get_grid();
        for (uint32_t y = 0; y < map.get_height(); y++) {
            for (uint32_t x = 0; x < map.get_width(); x++) {
                if (!grid.is_walkable(x, y))
                    continue;

                double max_q = std::max(0.0, map.get_max_q(x, y));
                if (max_q <= PHEROMONE_OVERLAY_MIN)
                    continue;

                double ratio = std::min(1.0, max_q / PHEROMONE_OVERLAY_SCALE);
                setColor(base.with_alpha(static_cast<int>(std::sqrt(ratio) * PHEROMONE_OVERLAY_ALPHA)));
                fillCell(x, y, 1.0);
            }
        }
    }

    void renderAnts() {
        for (const Ant& ant : manager->get_ants()) {
            if (!ant.position)
                continue;

            setColor(ant_outline_color(ant));
            fillCell(ant.position->x, ant.position->y, 0.55);
            setColor(ant_color(ant));
            fillCell(ant.position->x, ant.position->y, 0.4);

            if (ant.current_charge > 0) {
                int size = std::max(2, cell_size / 5);
                SDL_Rect rect = {static_cast<int>(ant.position->x) * cell_size + cell_size - size - 1,
                                 HUD_HEIGHT + static_cast<int>(ant.position->y) * cell_size + 1, size, size};
                setColor(rgb(0, 255, 0));
                SDL_RenderFillRect(renderer, &rect);
            }
        }
    }

    void renderHUD() {
        if (!font)
            return;

        SDL_Color white = {255, 255, 255, 255};
        SDL_Color yellow = {255, 255, 0, 255};
        SDL_Color red = {255, 80, 80, 255};

        char text[256];

        if (screen == Screen::EDITOR && editor) {
            snprintf(text, sizeof(text), "Map editor | Brush: %s | Nests: %u/1",
                     tile_type_name(editor->get_selected()), editor->get_nest_count());
            renderText(text, 10, 10, white);

            renderText("1=Default 2=Wall 3=Nest 4=Food 5=Danger | Mouse=Paint, C=Clear, ENTER=Launch, Q=Quit",
                       10, 30, white);

            std::string error = editor->get_validation_error();
            if (error.empty()) {
                renderText("Ready, press ENTER to launch", 10, 50, yellow);
            } else {
                renderText(error.c_str(), 10, 50, red);
            }
            return;
        }

        if (!manager)
            return;

        const Grid& grid = manager->get_grid();
        bool finished = manager->is_game_finished();

        snprintf(text, sizeof(text),
                 "Tick: %zu / %zu | Nest: %u | Food left: %llu | Ants: %zu | Speed: %dx | %s",
                 manager->current_tick(), manager->history_end() - 1, grid.nest_stored_food().value_or(0),
                 static_cast<unsigned long long>(grid.total_food_remaining()), manager->active_ant_count(),
                 simulation_speed, finished ? "FINISHED" : (paused ? "PAUSED" : "RUNNING"));
        renderText(text, 10, 10, finished ? yellow : white);

        snprintf(text, sizeof(text),
                 "Controls: SPACE=Pause, LEFT/RIGHT=Step history, HOME/END=First/Last, UP/DOWN=Speed");
        renderText(text, 10, 30, white);

        snprintf(text, sizeof(text),
                 "F=Food trails (%s), N=Nest trails (%s), R=New map, E=Editor, Q=Quit",
                 show_food_trails ? "on" : "off", show_nest_trails ? "on" : "off");
        renderText(text, 10, 50, white);

        if (simulated_ticks > 0) {
            snprintf(text, sizeof(text), "Avg tick: %.3f ms | Alpha %.2f Gamma %.2f Epsilon %.2f",
                     simulation_time_ms / simulated_ticks, config.alpha, config.gamma, config.epsilon);
            renderText(text, 10, 70, white);
        }
    }

    void renderText(const char* text, int x, int y, SDL_Color color) {
        SDL_Surface* surface = TTF_RenderText_Blended(font, text, color);
        if (surface) {
            SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
            if (texture) {
                SDL_Rect dst = {x, y, surface->w, surface->h};
                SDL_RenderCopy(renderer, texture, nullptr, &dst);
                SDL_DestroyTexture(texture);
            }
            SDL_FreeSurface(surface);
        }
    }

    void run(bool start_in_editor) {
        const int FRAME_DELAY = 1000 / TARGET_FPS;

        std::cout << "=== Ant Colony Q-Learning (Visualization) ===" << std::endl;
        std::cout << "Grid: " << config.grid_width << "x" << config.grid_height << std::endl;
        std::cout << "Ants: " << config.num_explorers << " explorers, " << config.num_pickers << " pickers, "
                  << config.num_fighters << " fighters" << std::endl;
        std::cout << "Random seed: " << config.seed << std::endl;
        std::cout << std::endl;
        std::cout << "Controls:" << std::endl;
        std::cout << "  SPACE      - Pause/Resume" << std::endl;
        std::cout << "  LEFT/RIGHT - One tick back/forward in history" << std::endl;
        std::cout << "  HOME/END   - First/last recorded tick" << std::endl;
        std::cout << "  UP/DOWN    - Speed" << std::endl;
        std::cout << "  F/N        - Toggle food/nest trails" << std::endl;
        std::cout << "  R          - New random map" << std::endl;
        std::cout << "  E          - Map editor" << std::endl;
        std::cout << "  Q/ESC      - Quit" << std::endl;
        std::cout << "==============================================" << std::endl;

        if (start_in_editor) {
            openEditor();
        } else {
            newRandomGame();
        }

        while (running) {
            Uint32 frame_start = SDL_GetTicks();

            handleEvents();
            stepSimulation();
            render();

            Uint32 frame_time = SDL_GetTicks() - frame_start;
            if (frame_time < static_cast<Uint32>(FRAME_DELAY)) {
                SDL_Delay(FRAME_DELAY - frame_time);
            }
        }
    }
};

int main(int argc, char* argv[]) {
    SimulationConfig config;
    std::vector<std::string> extra;
    if (!parse_args(argc, argv, config, &extra))
        return 0;

    bool start_in_editor = false;
    for (const std::string& arg : extra) {
        if (arg == "--editor") {
            start_in_editor = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
        }
    }

    std::string error;
    if (!config.validate(&error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        std::cerr << "Use --help to list the available options" << std::endl;
        return 1;
    }

    View view(config);
    if (!view.init()) {
        std::cerr << "Failed to initialize view" << std::endl;
        return 1;
    }

    view.run(start_in_editor);

    return 0;
}
