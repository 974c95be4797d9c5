#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "aliassearch.hpp"

namespace bpo = boost::program_options;
using namespace aliassearch;

static void print_aliases(value_t value, const std::vector<std::string> &exprs) {
  std::printf("%lld:", static_cast<long long>(value));
  for (std::size_t i = 0; i < exprs.size(); i++)
    std::printf("%s %s", i == 0 ? "" : ",", exprs[i].c_str());
  std::printf("\n");
}

int main(int argc, char **argv) {
  bpo::options_description options("Options"), hidden("Hidden"), all_options("All Options");
  options.add_options()
  ("help,h", "Shows this help")
  ("keep,k", bpo::value<std::size_t>()->default_value(3), "Expressions kept per value, shortest first.")
  ("max-results,m", bpo::value<std::size_t>()->default_value(20000), "Distinct values kept per digit interval.")
  ("no-unary-minus", "Do not negate digit groups.")
  ("threads,j", bpo::value<int>()->default_value(0), "Worker threads (0 = OpenMP default).")
  ("value,v", bpo::value<std::vector<long long>>(), "Only print the aliases of this value (repeatable).")
  ("quiet,q", "Suppress progress reporting.");
  hidden.add_options()("seed", bpo::value<std::string>());
  bpo::positional_options_description positional;
  positional.add("seed", 1);
  all_options.add(options).add(hidden);

  bpo::variables_map vm;
  try {
    bpo::store(bpo::command_line_parser(argc, argv).options(all_options).positional(positional).run(), vm);
    bpo::notify(vm);
  } catch (std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  if (vm.count("help") || !vm.count("seed")) {
    std::cout << "Usage: aliassearch [options] <seed>\n" << options << std::endl;
    return vm.count("help") ? 0 : 1;
  }

  Options opts;
  opts.keep_top_k_by_len = vm["keep"].as<std::size_t>();
  opts.max_results_per_node = vm["max-results"].as<std::size_t>();
  opts.allow_unary_minus = !vm.count("no-unary-minus");
  opts.threads = vm["threads"].as<int>();
  opts.verbose = !vm.count("quiet");

  const std::string seed = vm["seed"].as<std::string>();
  AliasMap aliases;
  try {
    aliases = generate_aliases(seed, opts);
  } catch (std::exception &e) {
    std::cerr << "Invalid input: " << e.what() << std::endl;
    return 1;
  }

  if (vm.count("value")) {
    for (const auto v : vm["value"].as<std::vector<long long>>()) {
      auto found = aliases.find(static_cast<value_t>(v));
      if (found != aliases.end())
        print_aliases(found->first, found->second);
      else
        std::printf("%lld: <none>\n", v);
    }
  } else {
    for (const auto &kv : aliases)
      print_aliases(kv.first, kv.second);
  }

  std::fprintf(stderr, "found: %zu\n", aliases.size());
  return 0;
}
