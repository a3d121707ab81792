#pragma once

#include <cmath>

#include "../src_headless/common/ant.hpp"
#include "../src_headless/common/tile.hpp"

struct hsv {
    double h;  // angle in degrees
    double s;  // a fraction between 0 and 1
    double v;  // a fraction between 0 and 1
};

struct rgb {
    int r, g, b, a;

    rgb() : r(255), g(255), b(255), a(255) {}
    rgb(int r_in, int g_in, int b_in, int alpha = 255) : r(r_in), g(g_in), b(b_in), a(alpha) {}

    rgb(hsv c, int alpha = 255) : a(alpha) {
        double hh = std::fmod(c.h < 0.0 ? c.h + 360.0 : c.h, 360.0) / 60.0;
        int sector = static_cast<int>(hh);
        double ff = hh - sector;
        double p = c.v * (1.0 - c.s);
        double q = c.v * (1.0 - c.s * ff);
        double t = c.v * (1.0 - c.s * (1.0 - ff));

        // Channel values for the six hue sectors
        const double table[6][3] = {{c.v, t, p}, {q, c.v, p}, {p, c.v, t}, {p, q, c.v}, {t, p, c.v}, {c.v, p, q}};
        const double* channels = table[sector % 6];
        r = static_cast<int>(channels[0] * 255);
        g = static_cast<int>(channels[1] * 255);
        b = static_cast<int>(channels[2] * 255);
    }

    rgb with_alpha(int alpha) const { return rgb(r, g, b, alpha); }
};

inline rgb background_color() {
    return rgb(30, 30, 30);
}

inline rgb tile_color(TileType type) {
    switch (type) {
        case TileType::DEFAULT:
            return rgb(40, 40, 40);
        case TileType::WALL:
            return rgb(128, 128, 128);
        case TileType::NEST:
            return rgb(255, 215, 0);
        case TileType::FOOD_SOURCE:
            return rgb(0, 200, 0);
        case TileType::DEATH_ZONE:
            return rgb(139, 0, 0);
    }
    return rgb();
}

// Food trails brown, nest trails pink
inline rgb pheromone_color(AntMode mode) {
    return mode == AntMode::FINDING ? rgb(139, 69, 19) : rgb(255, 105, 180);
}

// Body color shows the mode
inline rgb ant_color(const Ant& ant) {
    return ant.mode == AntMode::FINDING ? rgb(255, 255, 255) : rgb(255, 255, 0);
}

// Outline hue tells the types apart
inline rgb ant_outline_color(const Ant& ant) {
    switch (ant.type) {
        case AntType::EXPLORER:
            return rgb(hsv{200.0, 0.8, 0.9});
        case AntType::FIGHTER:
            return rgb(hsv{0.0, 0.8, 0.9});
        case AntType::PICKER:
            return rgb(hsv{30.0, 0.8, 0.6});
    }
    return rgb(0, 0, 0);
}
