#pragma once

// Window configuration - the board is scaled to fit
#define MAX_BOARD_PIXELS 960
#define MIN_CELL_SIZE 4
#define MAX_CELL_SIZE 48
#define HUD_HEIGHT 100

#define TARGET_FPS 60
#define MAX_SIMULATION_SPEED 64  // Ticks per frame

// Pheromone overlays: values at or above this scale are fully opaque
#define PHEROMONE_OVERLAY_SCALE 50.0
#define PHEROMONE_OVERLAY_MIN 0.1  // Hidden below this value
#define PHEROMONE_OVERLAY_ALPHA 200
