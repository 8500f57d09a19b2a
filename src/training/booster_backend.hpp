#ifndef BOOSTER_BACKEND_HPP
#define BOOSTER_BACKEND_HPP

#include <map>
#include <string>

namespace training {

// Metric name -> value after one boosting round
struct RoundEvaluation {
  std::map<std::string, double> train;
  std::map<std::string, double> validation;
};

// A gradient boosting engine driven one round at a time.
class IBoosterBackend {
public:
  virtual ~IBoosterBackend() = default;
  virtual const char *get_name() const = 0;

  // Adds one boosting round. Returns true when the engine cannot grow the
  // ensemble any further; the round is then not part of the model, unless
  // it is the first one, whose constant trees are kept.
  virtual bool update_one_round() = 0;

  virtual RoundEvaluation evaluate() const = 0;

  // Text model holding only the first `num_rounds` rounds
  virtual std::string export_model(int num_rounds) const = 0;
};

} // namespace training

#endif // BOOSTER_BACKEND_HPP
