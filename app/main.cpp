#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "io/config_io.hpp"
#include "io/dataset_writer.hpp"
#include "io/table_source.hpp"
#include "pipeline/dataset_assembler.hpp"

int main(int argc, char** argv) {
  // Usage:
  //   ./flight_transit_cli <config.json> <output_dir> <input.csv> [<input.csv> ...]
  if (argc < 4) {
    std::cerr << "usage: " << argv[0] << " <config.json> <output_dir> <input.csv> [...]\n";
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string output_dir = argv[2];
  std::vector<std::string> inputs(argv + 3, argv + argc);

  try {
    // 1) configuration
    const transit::RunConfig cfg = transit::io::ConfigIO::Load(config_path);
    std::cout << "config " << transit::io::ConfigIO::ToJson(cfg).dump() << "\n";

    // 2) source tables -> dataset
    transit::io::CsvTableSource source(std::move(inputs));
    transit::DatasetAssembler assembler(cfg, &std::cout);
    const transit::AssemblyContext ctx = assembler.Assemble(source);

    // 3) output (dataset_raw.csv + dataset_clean.csv)
    transit::io::DatasetWriter::WriteAll(ctx, output_dir);

    std::cout << "Done. " << ctx.samples.size() << " samples (" << ctx.stats << ") written to: "
              << output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
