#include "trueskill.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <numeric>
#include <unordered_map>

#include "internal/rating/gaussian.hpp"
#include "internal/util/errors.hpp"

namespace gaitrank::rating {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// ---------------------------------------------------------------------
// Truncation corrections (win: diff > margin, draw: |diff| <= margin)
// ---------------------------------------------------------------------

double VWin(double diff, double margin) {
  const double x     = diff - margin;
  const double denom = Cdf(x);
  return denom != 0.0 ? Pdf(x) / denom : -x;
}

double WWin(double diff, double margin) {
  const double x = diff - margin;
  const double v = VWin(diff, margin);
  const double w = v * (v + x);
  if (0.0 < w && w < 1.0) return w;
  throw util::RatingUpdateError("truncation update out of range (win)");
}

double VDraw(double diff, double margin) {
  const double abs_diff = std::fabs(diff);
  const double a        = margin - abs_diff;
  const double b        = -margin - abs_diff;
  const double denom    = Cdf(a) - Cdf(b);
  const double numer    = Pdf(b) - Pdf(a);
  return (denom != 0.0 ? numer / denom : a) * (diff < 0.0 ? -1.0 : 1.0);
}

double WDraw(double diff, double margin) {
  const double abs_diff = std::fabs(diff);
  const double a        = margin - abs_diff;
  const double b        = -margin - abs_diff;
  const double denom    = Cdf(a) - Cdf(b);
  if (denom == 0.0) throw util::RatingUpdateError("tied finish cannot be rated without a draw margin");
  const double v = VDraw(abs_diff, margin);
  return v * v + (a * Cdf(a) - b * Cdf(b)) / denom;
}

using VFunc = double (*)(double, double);

// ---------------------------------------------------------------------
// Factor graph
// ---------------------------------------------------------------------

class Factor;

// A variable's value is the product of all messages it has received.
class Variable {
 public:
  const Gaussian& Value() const {
    return value_;
  }

  Gaussian& Message(const Factor* factor) {
    return messages_[factor];
  }

  double Set(const Gaussian& next) {
    const double d = Delta(next);
    value_         = next;
    return d;
  }

  double UpdateMessage(const Factor* factor, const Gaussian& message) {
    const Gaussian old = messages_[factor];
    messages_[factor]  = message;
    return Set(value_ / old * message);
  }

  double UpdateValue(const Factor* factor, const Gaussian& value) {
    const Gaussian old = messages_[factor];
    messages_[factor]  = value * old / value_;
    return Set(value);
  }

 private:
  double Delta(const Gaussian& other) const {
    const double pi_delta = std::fabs(value_.pi - other.pi);
    if (pi_delta == kInf) return 0.0;
    return std::max(std::fabs(value_.tau - other.tau), std::sqrt(pi_delta));
  }

  Gaussian                                    value_;
  std::unordered_map<const Factor*, Gaussian> messages_;
};

class Factor {
 public:
  explicit Factor(std::vector<Variable*> vars) : vars_(std::move(vars)) {
    for (auto* v : vars_) v->Message(this) = Gaussian{};
  }
  virtual ~Factor() = default;

 protected:
  std::vector<Variable*> vars_;
};

class PriorFactor final : public Factor {
 public:
  PriorFactor(Variable* var, Belief prior, double dynamic) : Factor({var}), prior_(prior), dynamic_(dynamic) {
  }

  double Down() {
    const double sigma = std::sqrt(prior_.sigma * prior_.sigma + dynamic_ * dynamic_);
    return vars_[0]->UpdateValue(this, Gaussian::FromMuSigma(prior_.mu, sigma));
  }

 private:
  Belief prior_;
  double dynamic_;
};

class LikelihoodFactor final : public Factor {
 public:
  LikelihoodFactor(Variable* mean, Variable* value, double variance) : Factor({mean, value}), variance_(variance) {
  }

  double Down() {
    return Pass(vars_[0], vars_[1]);
  }

  double Up() {
    return Pass(vars_[1], vars_[0]);
  }

 private:
  double Pass(Variable* from, Variable* to) {
    const Gaussian msg = from->Value() / from->Message(this);
    const double   a   = 1.0 / (1.0 + variance_ * msg.pi);
    return to->UpdateMessage(this, Gaussian{a * msg.pi, a * msg.tau});
  }

  double variance_;
};

// sum = Σ coeffs[i] * terms[i]
class SumFactor final : public Factor {
 public:
  SumFactor(Variable* sum, std::vector<Variable*> terms, std::vector<double> coeffs)
      : Factor(Concat(sum, terms)), sum_(sum), terms_(std::move(terms)), coeffs_(std::move(coeffs)) {
  }

  double Down() {
    std::vector<Gaussian> msgs;
    for (auto* t : terms_) msgs.push_back(t->Message(this));
    return Update(sum_, terms_, msgs, coeffs_);
  }

  // Solve for terms_[index] given the sum and the other terms.
  double Up(std::size_t index) {
    const double        coeff = coeffs_[index];
    std::vector<double> coeffs;
    for (std::size_t x = 0; x < coeffs_.size(); ++x) {
      if (coeff == 0.0) {
        coeffs.push_back(0.0);
      } else if (x == index) {
        coeffs.push_back(1.0 / coeff);
      } else {
        coeffs.push_back(-coeffs_[x] / coeff);
      }
    }

    std::vector<Variable*> vals = terms_;
    vals[index]                 = sum_;
    std::vector<Gaussian> msgs;
    for (auto* v : vals) msgs.push_back(v->Message(this));
    return Update(terms_[index], vals, msgs, coeffs);
  }

  std::size_t TermCount() const {
    return terms_.size();
  }

 private:
  static std::vector<Variable*> Concat(Variable* sum, const std::vector<Variable*>& terms) {
    std::vector<Variable*> all{sum};
    all.insert(all.end(), terms.begin(), terms.end());
    return all;
  }

  double Update(Variable* var, const std::vector<Variable*>& vals, const std::vector<Gaussian>& msgs, const std::vector<double>& coeffs) {
    double pi_inv = 0.0;
    double mu     = 0.0;
    for (std::size_t i = 0; i < vals.size(); ++i) {
      const Gaussian div = vals[i]->Value() / msgs[i];
      mu += coeffs[i] * div.Mu();
      if (pi_inv == kInf) continue;
      if (div.pi == 0.0) {
        pi_inv = kInf;
      } else {
        pi_inv += coeffs[i] * coeffs[i] / div.pi;
      }
    }
    if (pi_inv == 0.0) throw util::RatingUpdateError("degenerate sum factor");
    const double pi = 1.0 / pi_inv;
    return var->UpdateMessage(this, Gaussian{pi, pi * mu});
  }

  Variable*              sum_;
  std::vector<Variable*> terms_;
  std::vector<double>    coeffs_;
};

class TruncateFactor final : public Factor {
 public:
  TruncateFactor(Variable* var, VFunc v, VFunc w, double margin) : Factor({var}), v_(v), w_(w), margin_(margin) {
  }

  double Up() {
    Variable*      var     = vars_[0];
    const Gaussian div     = var->Value() / var->Message(this);
    const double   sqrt_pi = std::sqrt(div.pi);
    const double   arg     = div.tau / sqrt_pi;
    const double   margin  = margin_ * sqrt_pi;
    const double   v       = v_(arg, margin);
    const double   w       = w_(arg, margin);
    const double   denom   = 1.0 - w;
    if (!std::isfinite(v) || denom == 0.0) throw util::RatingUpdateError("truncation update is not finite");
    return var->UpdateValue(this, Gaussian{div.pi / denom, (div.tau + sqrt_pi * v) / denom});
  }

 private:
  VFunc  v_;
  VFunc  w_;
  double margin_;
};

} // namespace

TrueSkill::TrueSkill(config::TrueSkillSettings settings) : settings_(settings) {
}

double TrueSkill::DrawMargin() const {
  if (settings_.draw_probability <= 0.0) return 0.0;
  // two one-member teams meet at each truncation factor
  return Ppf((settings_.draw_probability + 1.0) / 2.0) * std::sqrt(2.0) * settings_.beta;
}

std::vector<Belief> TrueSkill::Rate(const std::vector<Belief>& priors, const std::vector<int>& ranks) const {
  if (priors.size() != ranks.size()) throw util::InvalidArgument("priors and ranks differ in size");
  if (priors.size() < 2) throw util::InvalidArgument("a rating update needs at least two competitors");

  const std::size_t n = priors.size();

  // finishing order, stable for equal ranks
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return ranks[a] < ranks[b]; });

  std::vector<Variable> rating_vars(n);
  std::vector<Variable> perf_vars(n);
  std::vector<Variable> team_perf_vars(n);
  std::vector<Variable> team_diff_vars(n - 1);

  std::vector<std::unique_ptr<PriorFactor>>      rating_layer;
  std::vector<std::unique_ptr<LikelihoodFactor>> perf_layer;
  std::vector<std::unique_ptr<SumFactor>>        team_perf_layer;
  std::vector<std::unique_ptr<SumFactor>>        team_diff_layer;
  std::vector<std::unique_ptr<TruncateFactor>>   trunc_layer;

  const double variance = settings_.beta * settings_.beta;
  for (std::size_t i = 0; i < n; ++i) {
    rating_layer.push_back(std::make_unique<PriorFactor>(&rating_vars[i], priors[order[i]], settings_.tau));
    perf_layer.push_back(std::make_unique<LikelihoodFactor>(&rating_vars[i], &perf_vars[i], variance));
    team_perf_layer.push_back(std::make_unique<SumFactor>(&team_perf_vars[i], std::vector<Variable*>{&perf_vars[i]}, std::vector<double>{1.0}));
  }

  const double margin = DrawMargin();
  for (std::size_t i = 0; i + 1 < n; ++i) {
    team_diff_layer.push_back(std::make_unique<SumFactor>(
        &team_diff_vars[i], std::vector<Variable*>{&team_perf_vars[i], &team_perf_vars[i + 1]}, std::vector<double>{1.0, -1.0}));

    const bool draw = ranks[order[i]] == ranks[order[i + 1]];
    trunc_layer.push_back(std::make_unique<TruncateFactor>(&team_diff_vars[i], draw ? &VDraw : &VWin, draw ? &WDraw : &WWin, margin));
  }

  // messages down from the priors
  for (auto& f : rating_layer) f->Down();
  for (auto& f : perf_layer) f->Down();
  for (auto& f : team_perf_layer) f->Down();

  // iterate along the difference chain
  const std::size_t diff_len = team_diff_layer.size();
  for (uint32_t iteration = 0; iteration < settings_.max_iterations; ++iteration) {
    double delta = 0.0;
    if (diff_len == 1) {
      team_diff_layer[0]->Down();
      delta = trunc_layer[0]->Up();
    } else {
      for (std::size_t x = 0; x + 1 < diff_len; ++x) {
        team_diff_layer[x]->Down();
        delta = std::max(delta, trunc_layer[x]->Up());
        team_diff_layer[x]->Up(1);
      }
      for (std::size_t x = diff_len - 1; x > 0; --x) {
        team_diff_layer[x]->Down();
        delta = std::max(delta, trunc_layer[x]->Up());
        team_diff_layer[x]->Up(0);
      }
    }
    if (delta <= settings_.convergence_delta) break;
  }

  // messages back up to the skills
  team_diff_layer.front()->Up(0);
  team_diff_layer.back()->Up(1);
  for (auto& f : team_perf_layer) {
    for (std::size_t x = 0; x < f->TermCount(); ++x) f->Up(x);
  }
  for (auto& f : perf_layer) f->Up();

  std::vector<Belief> posteriors(n);
  for (std::size_t i = 0; i < n; ++i) {
    const Gaussian& g = rating_vars[i].Value();
    const double    mu = g.Mu();
    const double    sigma = g.Sigma();
    if (!std::isfinite(mu) || !std::isfinite(sigma) || sigma <= 0.0) {
      throw util::RatingUpdateError("rating update produced a non-finite belief");
    }
    posteriors[order[i]] = Belief{mu, sigma};
  }
  return posteriors;
}

} // namespace gaitrank::rating
