#include "study/calibration.hpp"

#include "debug_log.hpp"
#include "psychometrics/pcm.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace study {

namespace {

struct Observation {
  std::size_t item = 0;
  int category = 0;
};

struct ItemAccumulator {
  double grad_difficulty = 0.0;
  double hess_difficulty = 0.0;
  std::vector<double> grad_steps;
  std::vector<double> hess_steps;
};

double clamp_step(double step, double max_step) {
  return std::clamp(step, -max_step, max_step);
}

} // namespace

CalibrationReport calibrate_item_bank(const ItemBank& bank,
                                      const std::vector<CalibrationResponse>& responses,
                                      const CalibrationOptions& options) {
  if (options.difficulty_prior_sd <= 0.0 || options.threshold_prior_sd <= 0.0 ||
      options.ability_prior_sd <= 0.0) {
    throw std::invalid_argument("calibrate_item_bank: prior standard deviations must be positive");
  }
  if (options.max_step <= 0.0) {
    throw std::invalid_argument("calibrate_item_bank: max_step must be positive");
  }

  std::vector<ItemMetadata> items = bank.items();
  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < items.size(); ++i) {
    index.emplace(items[i].item_id, i);
  }

  CalibrationReport report;
  std::map<std::pair<std::string, std::string>, std::vector<Observation>> groups;
  std::vector<int> counts(items.size(), 0);
  for (const auto& response : responses) {
    auto it = index.find(response.item_id);
    if (it == index.end()) {
      if (std::find(report.unknown_items.begin(), report.unknown_items.end(), response.item_id) ==
          report.unknown_items.end()) {
        report.unknown_items.push_back(response.item_id);
      }
      continue;
    }
    const ItemMetadata& item = items[it->second];
    const int m = psychometrics::category_count(item);
    Observation obs;
    obs.item = it->second;
    obs.category = psychometrics::score_to_category(response.score_fraction, m);
    groups[{response.learner_id, item.topic_id}].push_back(obs);
    ++counts[it->second];
    ++report.responses_used;
  }

  // Polytomous items get explicit step parameters so they can move.
  for (std::size_t i = 0; i < items.size(); ++i) {
    auto& item = items[i];
    if (counts[i] > 0 && item.score_categories > 1 && item.category_thresholds.empty()) {
      item.category_thresholds.assign(static_cast<std::size_t>(item.score_categories), 0.0);
    }
  }

  const auto& grid = psychometrics::theta_grid();
  std::array<double, psychometrics::kGridPoints> log_prior{};
  for (std::size_t g = 0; g < grid.size(); ++g) {
    log_prior[g] = psychometrics::normal_log_density(grid[g], 0.0, options.ability_prior_sd);
  }

  const double difficulty_precision = 1.0 / (options.difficulty_prior_sd * options.difficulty_prior_sd);
  const double step_precision = 1.0 / (options.threshold_prior_sd * options.threshold_prior_sd);

  for (int iteration = 1; iteration <= options.max_iterations; ++iteration) {
    std::vector<ItemAccumulator> acc(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
      const std::size_t steps = items[i].category_thresholds.size();
      acc[i].grad_steps.assign(steps, 0.0);
      acc[i].hess_steps.assign(steps, 0.0);
    }

    // E-step: posterior over the grid for every learner/topic group.
    for (const auto& kv : groups) {
      std::array<double, psychometrics::kGridPoints> weights = log_prior;
      for (const auto& obs : kv.second) {
        const ItemMetadata& item = items[obs.item];
        const auto tau = psychometrics::effective_thresholds(item);
        for (std::size_t g = 0; g < grid.size(); ++g) {
          weights[g] += psychometrics::category_log_probabilities(grid[g], item.difficulty,
                                                                  tau)[static_cast<std::size_t>(obs.category)];
        }
      }
      const double max_log = *std::max_element(weights.begin(), weights.end());
      if (!std::isfinite(max_log)) {
        continue;
      }
      double total = 0.0;
      for (auto& w : weights) {
        w = std::exp(w - max_log);
        total += w;
      }
      if (!(total > 0.0) || !std::isfinite(total)) {
        continue;
      }
      for (auto& w : weights) {
        w /= total;
      }

      for (const auto& obs : kv.second) {
        const ItemMetadata& item = items[obs.item];
        const auto tau = psychometrics::effective_thresholds(item);
        auto& a = acc[obs.item];
        for (std::size_t g = 0; g < grid.size(); ++g) {
          const auto probs = psychometrics::category_probabilities(grid[g], item.difficulty, tau);
          double mean = 0.0;
          double second = 0.0;
          for (std::size_t k = 0; k < probs.size(); ++k) {
            mean += static_cast<double>(k) * probs[k];
            second += static_cast<double>(k * k) * probs[k];
          }
          const double variance = std::max(0.0, second - mean * mean);
          a.grad_difficulty += weights[g] * (mean - static_cast<double>(obs.category));
          a.hess_difficulty -= weights[g] * variance;

          // P(X >= j) accumulated from the top category down.
          double tail = 0.0;
          for (std::size_t j = probs.size() - 1; j >= 1; --j) {
            tail += probs[j];
            if (j - 1 < a.grad_steps.size()) {
              const double reached = obs.category >= static_cast<int>(j) ? 1.0 : 0.0;
              a.grad_steps[j - 1] += weights[g] * (tail - reached);
              a.hess_steps[j - 1] -= weights[g] * tail * (1.0 - tail);
            }
          }
        }
      }
    }

    // M-step: one damped Newton step per parameter, with Gaussian shrinkage.
    double change = 0.0;
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (counts[i] == 0) {
        continue;
      }
      auto& item = items[i];
      const auto& a = acc[i];

      const double grad = a.grad_difficulty - item.difficulty * difficulty_precision;
      const double hess = a.hess_difficulty - difficulty_precision;
      const double step = clamp_step(-grad / hess, options.max_step);
      if (std::isfinite(step)) {
        item.difficulty += step;
        change = std::max(change, std::fabs(step));
      }

      for (std::size_t j = 0; j < item.category_thresholds.size(); ++j) {
        double& tau = item.category_thresholds[j];
        const double g = a.grad_steps[j] - tau * step_precision;
        const double h = a.hess_steps[j] - step_precision;
        const double s = clamp_step(-g / h, options.max_step);
        if (std::isfinite(s)) {
          tau += s;
          change = std::max(change, std::fabs(s));
        }
      }
    }

    report.iterations = iteration;
    report.last_change = change;
    if (debug_flag_enabled("STUDY_DEBUG_ENGINE")) {
      debug_line("calibration", "iteration " + std::to_string(iteration) + " max change " +
                                    std::to_string(change));
    }
    if (change < options.tolerance) {
      report.converged = true;
      break;
    }
  }

  for (std::size_t i = 0; i < items.size(); ++i) {
    items[i].calibration_count += counts[i];
  }
  report.bank = ItemBank(bank.version() + 1, std::move(items));
  return report;
}

ItemBank refit_item_bank(const ItemBank& bank, const std::vector<CalibrationResponse>& responses,
                         const CalibrationOptions& options) {
  return calibrate_item_bank(bank, responses, options).bank;
}

} // namespace study
