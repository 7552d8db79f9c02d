#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <random>
#include <string>

namespace tasktide::bench {

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  const double per_sec = total > 0 ? 1e6 * static_cast<double>(iterations) / static_cast<double>(total)
                                   : 0.0;
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << " ops_per_sec=" << per_sec << "\n";
}

// Scratch directory removed on scope exit.
class BenchDir {
public:
  explicit BenchDir(const std::string &prefix) {
    static std::mt19937_64 rng{std::random_device{}()};
    path_ = std::filesystem::temp_directory_path() / (prefix + "-" + std::to_string(rng()));
    std::filesystem::create_directories(path_);
  }
  ~BenchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  BenchDir(const BenchDir &) = delete;
  BenchDir &operator=(const BenchDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace tasktide::bench
