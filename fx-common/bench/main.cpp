#include <benchmark/benchmark.h>

#include "fx/log.hpp"
#include "util.hpp"

int main(int argc, char** argv) {
  // 診斷輸出會干擾量測
  fx::log::Logger::set_level(fx::log::Level::Off);

  benchmark::Initialize(&argc, argv);
  if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }

  ParserBenchmarkReporter reporter;
  benchmark::RunSpecifiedBenchmarks(&reporter);
  benchmark::Shutdown();

  return 0;
}
