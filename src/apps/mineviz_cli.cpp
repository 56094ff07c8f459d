#include "mineviz_core/pipeline.hpp"
#include "mineviz_core/version.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  std::cout << "mineviz native CLI\n";
  std::cout << "version=" << mineviz::core::version() << "\n";
  if (argc < 2) {
    std::cerr << "usage: mineviz_cli <case_file> [out_dir]\n";
    return 2;
  }

  const std::string case_path = argv[1];
  const std::string out_dir = argc > 2 ? argv[2] : "mineviz_out";
  try {
    const mineviz::core::RunSummary summary = mineviz::core::run_case(case_path, out_dir);
    std::cout << "status=" << summary.status << "\n";
    std::cout << "case_type=" << summary.case_type << "\n";
    std::cout << "run_log=" << summary.run_log << "\n";
    for (const auto& output : summary.outputs) {
      std::cout << "output=" << output.string() << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
