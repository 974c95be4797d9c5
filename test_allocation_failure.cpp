#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <new>

#include "aliassearch.hpp"
#include "test_support.hpp"

using namespace aliassearch;
using namespace aliassearch::test;

// Global allocator that can be told to fail, so an out-of-memory search can
// be reproduced inside the worker threads.
static std::atomic<bool> fail_allocations{false};

void *operator new(std::size_t size) {
  if (fail_allocations.load()) throw std::bad_alloc();
  if (void *p = std::malloc(size ? size : 1)) return p;
  throw std::bad_alloc();
}

void operator delete(void *p) noexcept { std::free(p); }
void operator delete(void *p, std::size_t) noexcept { std::free(p); }

static void test_bad_alloc_reaches_caller() {
  std::printf("Testing allocation failure inside the interval search...\n");
  Options opts;
  opts.threads = 4;
  IntervalSolver solver("7846", opts);

  bool caught = false;
  fail_allocations = true;
  try {
    solver.run();
  } catch (const std::bad_alloc &) {
    caught = true;
  }
  fail_allocations = false;
  check(caught, __LINE__);

  bool unsolved = false;
  try {
    solver.solve(0, 3);
  } catch (const std::out_of_range &) {
    unsolved = true;
  }
  check(unsolved, __LINE__);

  // a fresh search works once memory is back
  const AliasMap aliases = generate_aliases("7846", opts);
  check(aliases.count(7846) == 1, __LINE__);
}

int main() {
  std::cout << "Testing allocation failure...\n";
  try {
    test_bad_alloc_reaches_caller();
  } catch (const std::exception &e) {
    fail_allocations = false;
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
  return report("test_allocation_failure");
}
