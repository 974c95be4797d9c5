#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace aliassearch {

using value_t = int64_t;

// Longest accepted seed. An expression over d digits stays below 10^d in
// magnitude, so no intermediate value can overflow value_t.
constexpr std::size_t max_seed_digits = 18;

struct Options {
  bool allow_unary_minus = true;
  std::size_t keep_top_k_by_len = 3;      // expressions kept per value
  std::size_t max_results_per_node = 20000; // distinct values kept per interval
  int threads = 0;                        // 0 = OpenMP default
  bool verbose = false;
};

enum class ExprKind : uint8_t {
  Literal,     // 35
  NegLiteral,  // -35
  Composite    // a+b, (a)*(b), ...
};

enum class Operator : uint8_t { Add, Sub, Mul, Div };

char operator_char(Operator op);

struct Expr {
  std::string text;
  ExprKind kind;

  // Text as it must appear when used as an operand.
  std::string wrapped() const;
  std::size_t length() const { return text.size(); }
};

Expr make_literal(const std::string &digits);
Expr make_neg_literal(const std::string &digits);
Expr make_composite(const Expr &left, Operator op, const Expr &right);

// value -> the few shortest distinct expressions yielding it.
// Values are kept in discovery order; that order breaks ties when pruning
// and fixes the order candidates are generated in by the parent interval.
class SolutionSet {
public:
  struct Entry {
    value_t value;
    std::vector<Expr> exprs;  // never empty, sorted by length
  };

  explicit SolutionSet(std::size_t keep_top_k = 3) : keep_top_k_(keep_top_k) {}

  void add(value_t value, Expr expr);
  void prune(std::size_t max_values);

  const Entry *find(value_t value) const;
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
  std::size_t keep_top_k_;
  std::vector<Entry> entries_;
  std::unordered_map<value_t, std::size_t> index_;
};

// Memoized interval search over one seed. The whole table is filled by
// run(); intervals of equal length are independent and solved in parallel.
class IntervalSolver {
public:
  IntervalSolver(std::string digits, const Options &opts);

  // Exceptions from any interval (std::bad_alloc for oversized searches)
  // propagate to the caller; the solver is left unsolved.
  void run();
  // Requires run(). 0 <= l <= r < digits().size().
  const SolutionSet &solve(std::size_t l, std::size_t r) const;
  const std::string &digits() const { return digits_; }

private:
  std::size_t slot(std::size_t l, std::size_t r) const { return l * n_ + r; }
  void solve_interval(std::size_t l, std::size_t r);
  void combine(const SolutionSet &left, const SolutionSet &right, SolutionSet &out) const;

  std::string digits_;
  std::size_t n_;
  Options opts_;
  std::vector<SolutionSet> memo_;
  bool done_ = false;
};

using AliasMap = std::map<value_t, std::vector<std::string>>;

// Strips one outer "(...)" pair when the content has no parens of its own.
std::string strip_outer_parens(const std::string &expr);

AliasMap assemble(const SolutionSet &root, const std::string &seed);

// Throws std::invalid_argument when the seed or the options are unusable.
// Every all-zero seed ("0", "00", ...) is rejected, not only "0": the
// fallback alias seed/seed would divide by zero.
void validate(const std::string &seed, const Options &opts);

AliasMap generate_aliases(const std::string &seed, const Options &opts = Options());
AliasMap generate_aliases(uint64_t seed, const Options &opts = Options());

} // namespace aliassearch
