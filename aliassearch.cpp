#include "aliassearch.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>
#include <omp.h>

namespace aliassearch {

char operator_char(Operator op) {
  switch (op) {
    case Operator::Add: return '+';
    case Operator::Sub: return '-';
    case Operator::Mul: return '*';
    case Operator::Div: return '/';
  }
  return '?';
}

std::string Expr::wrapped() const {
  if (kind == ExprKind::Literal)
    return text;
  return "(" + text + ")";
}

Expr make_literal(const std::string &digits) {
  return Expr{digits, ExprKind::Literal};
}

Expr make_neg_literal(const std::string &digits) {
  return Expr{"-" + digits, ExprKind::NegLiteral};
}

static Expr composite(const std::string &a, Operator op, const std::string &b) {
  std::string text;
  text.reserve(a.size() + b.size() + 1);
  text += a;
  text += operator_char(op);
  text += b;
  return Expr{std::move(text), ExprKind::Composite};
}

Expr make_composite(const Expr &left, Operator op, const Expr &right) {
  return composite(left.wrapped(), op, right.wrapped());
}

// ---- SolutionSet ----

void SolutionSet::add(value_t value, Expr expr) {
  auto it = index_.find(value);
  if (it == index_.end()) {
    index_.emplace(value, entries_.size());
    entries_.push_back(Entry{value, {std::move(expr)}});
    return;
  }
  auto &exprs = entries_[it->second].exprs;
  for (const auto &e : exprs)
    if (e.text == expr.text) return;
  exprs.push_back(std::move(expr));
  std::stable_sort(exprs.begin(), exprs.end(), [](const Expr &a, const Expr &b) {
    return a.length() < b.length();
  });
  if (exprs.size() > keep_top_k_)
    exprs.resize(keep_top_k_);
}

void SolutionSet::prune(std::size_t max_values) {
  if (entries_.size() <= max_values) return;
  std::stable_sort(entries_.begin(), entries_.end(), [](const Entry &a, const Entry &b) {
    return a.exprs.front().length() < b.exprs.front().length();
  });
  entries_.erase(entries_.begin() + max_values, entries_.end());
  index_.clear();
  for (std::size_t i = 0; i < entries_.size(); i++)
    index_.emplace(entries_[i].value, i);
}

const SolutionSet::Entry *SolutionSet::find(value_t value) const {
  auto it = index_.find(value);
  return it == index_.end() ? nullptr : &entries_[it->second];
}

// ---- IntervalSolver ----

IntervalSolver::IntervalSolver(std::string digits, const Options &opts)
  : digits_(std::move(digits)), n_(digits_.size()), opts_(opts),
    memo_(n_ * n_, SolutionSet(opts.keep_top_k_by_len)) {}

static value_t parse_digits(const std::string &s, std::size_t l, std::size_t r) {
  value_t v = 0;
  for (std::size_t i = l; i <= r; i++) v = v * 10 + (s[i] - '0');
  return v;
}

void IntervalSolver::combine(const SolutionSet &left, const SolutionSet &right, SolutionSet &out) const {
  // operand texts of the right side are reused for every left expression
  std::vector<std::vector<std::string>> right_wrapped;
  right_wrapped.reserve(right.size());
  for (const auto &eR : right) {
    std::vector<std::string> w;
    for (const auto &e : eR.exprs) w.push_back(e.wrapped());
    right_wrapped.push_back(std::move(w));
  }

  for (const auto &eL : left) {
    const value_t v1 = eL.value;
    std::vector<std::string> left_wrapped;
    for (const auto &e : eL.exprs) left_wrapped.push_back(e.wrapped());

    std::size_t j = 0;
    for (const auto &eR : right) {
      const value_t v2 = eR.value;
      const auto &bs = right_wrapped[j++];

      // division only when exact
      const bool div_ok = v2 != 0 && v1 % v2 == 0;

      for (const auto &a : left_wrapped) {
        for (const auto &b : bs) {
          out.add(v1 + v2, composite(a, Operator::Add, b));
          out.add(v1 - v2, composite(a, Operator::Sub, b));
          out.add(v1 * v2, composite(a, Operator::Mul, b));
          if (div_ok) out.add(v1 / v2, composite(a, Operator::Div, b));
        }
      }
    }
  }
}

void IntervalSolver::solve_interval(std::size_t l, std::size_t r) {
  SolutionSet res(opts_.keep_top_k_by_len);

  // leaf: s[l..r] read as one number, leading zeros allowed ("05" -> 5)
  const std::string leaf = digits_.substr(l, r - l + 1);
  const value_t leaf_value = parse_digits(digits_, l, r);
  res.add(leaf_value, make_literal(leaf));
  if (opts_.allow_unary_minus && leaf_value != 0)
    res.add(-leaf_value, make_neg_literal(leaf));

  // every split point is one way to place the outermost parens
  for (std::size_t k = l; k < r; k++)
    combine(memo_[slot(l, k)], memo_[slot(k + 1, r)], res);

  res.prune(opts_.max_results_per_node);
  memo_[slot(l, r)] = std::move(res);
}

void IntervalSolver::run() {
  if (done_) return;
  const int threads = opts_.threads > 0 ? opts_.threads : omp_get_max_threads();

  for (std::size_t length = 1; length <= n_; length++) {
    if (opts_.verbose)
      std::fprintf(stderr, "Solving intervals of length %zu...\n", length);
    const long count = static_cast<long>(n_ - length + 1);

    // an exception may not leave the parallel region; keep the first one
    std::exception_ptr failure;
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long l = 0; l < count; l++) {
      try {
        solve_interval(static_cast<std::size_t>(l), static_cast<std::size_t>(l) + length - 1);
      } catch (...) {
        #pragma omp critical
        {
          if (!failure) failure = std::current_exception();
        }
      }
    }
    if (failure) std::rethrow_exception(failure);

    if (opts_.verbose) {
      std::size_t cached = 0;
      for (std::size_t l = 0; l + length <= n_; l++)
        cached += memo_[slot(l, l + length - 1)].size();
      std::fprintf(stderr, "Cached %zu values.\n", cached);
    }
  }
  done_ = true;
}

const SolutionSet &IntervalSolver::solve(std::size_t l, std::size_t r) const {
  if (!done_ || l > r || r >= n_)
    throw std::out_of_range("interval not solved");
  return memo_[slot(l, r)];
}

// ---- result assembly ----

std::string strip_outer_parens(const std::string &expr) {
  if (expr.size() < 3 || expr.front() != '(' || expr.back() != ')')
    return expr;
  if (expr.find_first_of("()", 1) != expr.size() - 1)
    return expr;
  return expr.substr(1, expr.size() - 2);
}

AliasMap assemble(const SolutionSet &root, const std::string &seed) {
  AliasMap aliases;
  for (const auto &entry : root) {
    if (entry.value < 0) continue;
    auto &out = aliases[entry.value];
    for (const auto &e : entry.exprs) {
      std::string expr = strip_outer_parens(e.text);
      if (std::find(out.begin(), out.end(), expr) == out.end())
        out.push_back(std::move(expr));
    }
  }
  if (aliases.find(1) == aliases.end())
    aliases[1] = {seed + "/" + seed};
  return aliases;
}

// ---- entry point ----

void validate(const std::string &seed, const Options &opts) {
  if (seed.empty() || seed.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument("seed must be a positive decimal integer: \"" + seed + "\"");
  if (seed.find_first_not_of('0') == std::string::npos)
    throw std::invalid_argument("seed must not be zero (all-zero seeds have no seed/seed alias for 1): \"" + seed + "\"");
  if (seed.size() > max_seed_digits)
    throw std::invalid_argument("seed has more than " + std::to_string(max_seed_digits) + " digits");
  if (opts.keep_top_k_by_len < 1)
    throw std::invalid_argument("keep_top_k_by_len must be at least 1");
  if (opts.max_results_per_node < 1)
    throw std::invalid_argument("max_results_per_node must be at least 1");
  if (opts.threads < 0)
    throw std::invalid_argument("threads must not be negative");
}

AliasMap generate_aliases(const std::string &seed, const Options &opts) {
  validate(seed, opts);
  IntervalSolver solver(seed, opts);
  solver.run();
  return assemble(solver.solve(0, seed.size() - 1), seed);
}

AliasMap generate_aliases(uint64_t seed, const Options &opts) {
  return generate_aliases(std::to_string(seed), opts);
}

} // namespace aliassearch
