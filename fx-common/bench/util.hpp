#ifndef FX_PARSER_BENCH_UTIL_HPP
#define FX_PARSER_BENCH_UTIL_HPP

#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include <string>
#include <vector>

class ParserBenchmarkReporter : public benchmark::ConsoleReporter {
 public:
  bool ReportContext(const Context& context) override {
    bool result = ConsoleReporter::ReportContext(context);

    // 加入自訂的 header
    fmt::print("{}\n", std::string(60, '='));
    fmt::print("FIX Parser Benchmark Results\n");
    fmt::print("{}\n", std::string(60, '='));

    return result;
  }

  void ReportRuns(const std::vector<Run>& reports) override {
    for (const auto& run : reports) {
      if (run.error_occurred) continue;

      fmt::print("{}\n", run.benchmark_name());
      fmt::print("{}\n", std::string(60, '-'));

      double ns_per_op = run.GetAdjustedRealTime();
      fmt::print("{:<12} {:>10.2f}ns    {}\n", "latency", ns_per_op,
                 "Average time per message");

      auto print_rate = [&](const char* name, double scale, const char* unit) {
        auto it = run.counters.find(name);
        if (it != run.counters.end()) {
          fmt::print("{:<12} {:>10.2f}{}\n", name,
                     static_cast<double>(it->second) / scale, unit);
        }
      };

      print_rate("bytes_per_second", 1024.0 * 1024.0, " MiB/s");
      print_rate("items_per_second", 1e6, " M msg/s");
      print_rate("fields", 1.0, "");

      fmt::print("{:-^60}\n", "");

      // 公式: (1 sec / latency_ns) * 10^9 / 10^6 = 1000 / latency_ns
      if (ns_per_op > 0) {
        fmt::print("Throughput: {:.2f} M ops/s\n", 1000.0 / ns_per_op);
      }
    }
  }
};

#endif
