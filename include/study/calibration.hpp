#pragma once

#include "item_bank.hpp"

#include <string>
#include <vector>

namespace study {

struct CalibrationResponse {
  std::string learner_id;
  std::string item_id;
  double score_fraction = 0.0;
};

struct CalibrationOptions {
  int max_iterations = 25;
  double tolerance = 1e-4;
  double max_step = 0.5;               // damping of each Newton step
  double difficulty_prior_sd = 1.0;    // shrinkage of difficulty toward 0
  double threshold_prior_sd = 1.0;
  double ability_prior_sd = 1.0;
};

struct CalibrationReport {
  ItemBank bank;
  int iterations = 0;
  bool converged = false;
  double last_change = 0.0;
  std::size_t responses_used = 0;
  std::vector<std::string> unknown_items;
};

// Marginal maximum likelihood (EM over the ability grid) for the partial
// credit parameters. Learners are modelled per topic.
CalibrationReport calibrate_item_bank(const ItemBank& bank,
                                      const std::vector<CalibrationResponse>& responses,
                                      const CalibrationOptions& options = {});

// New snapshot with version + 1; the input bank is left untouched.
ItemBank refit_item_bank(const ItemBank& bank, const std::vector<CalibrationResponse>& responses,
                         const CalibrationOptions& options = {});

} // namespace study
