#pragma once

// Tabular Q-learning hyperparameters
struct QLearningParams {
    double alpha;    // Learning rate
    double gamma;    // Discount factor
    double epsilon;  // Exploration rate

    QLearningParams(double alpha = 0.1, double gamma = 0.99, double epsilon = 0.05)
        : alpha(alpha), gamma(gamma), epsilon(epsilon) {}

    // alpha * (reward + gamma * max_next - current)
    double compute_delta(double current_q, double reward, double max_next_q) const {
        return alpha * (reward + gamma * max_next_q - current_q);
    }
};
