#include "io/config_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/errors.hpp"
#include "common/run_config.hpp"

namespace fs = std::filesystem;

namespace transit::io {

namespace {

using json = nlohmann::json;

std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw ConfigError("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const json::exception& e) {
    throw ConfigError("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

OutlierFilters ParseFilters(const json& node) {
  if (node.is_null()) return {};
  if (node.is_boolean()) {
    return node.get<bool>() ? OutlierFilters::Default() : OutlierFilters{};
  }
  if (node.is_string()) {
    const auto name = node.get<std::string>();
    if (name == "default") return OutlierFilters::Default();
    if (name == "none") return {};
    throw ConfigError("unknown outlier_filters preset: " + name);
  }
  if (!node.is_object()) {
    throw ConfigError("outlier_filters must be an object, a preset name or a boolean");
  }

  OutlierFilters f;
  f.enabled = true;
  for (auto it = node.begin(); it != node.end(); ++it) {
    const json& range = it.value();
    if (!range.is_array() || range.size() != 2 || !range[0].is_number() || !range[1].is_number()) {
      throw ConfigError("outlier filter for " + it.key() + " must be [min, max]");
    }
    f.ranges[it.key()] = ColumnRange{range[0].get<double>(), range[1].get<double>()};
  }
  return f;
}

} // namespace

RunConfig ConfigIO::FromJson(const json& root) {
  if (!root.is_object()) throw ConfigError("config root must be a JSON object");

  RunConfig cfg;
  try {
    const json ref = root.value("reference", json::object());
    cfg.reference.lat_deg = ref.value("latitude", cfg.reference.lat_deg);
    cfg.reference.lon_deg = ref.value("longitude", cfg.reference.lon_deg);

    if (!root.contains("band")) throw ConfigError("missing required key: band");
    const json& band = root["band"];
    if (!band.is_object() || !band.contains("inner_nm") || !band.contains("outer_nm")) {
      throw ConfigError("band needs both inner_nm and outer_nm");
    }
    cfg.band = DistanceBand{band["inner_nm"].get<double>(), band["outer_nm"].get<double>()};

    if (root.contains("batch_size")) {
      const json& bs = root["batch_size"];
      if (!bs.is_number_integer() || bs.get<long long>() <= 0) {
        throw ConfigError("batch_size must be a positive integer");
      }
      cfg.batch_size = static_cast<std::size_t>(bs.get<long long>());
    }

    if (root.contains("group_by")) {
      cfg.group_by = ParseGroupingKey(root["group_by"].get<std::string>());
    }

    if (root.contains("outlier_filters")) {
      cfg.outlier_filters = ParseFilters(root["outlier_filters"]);
    }
  } catch (const json::exception& e) {
    // type_error from value()/get() on a wrongly typed key
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }

  ValidateRunConfig(cfg);
  return cfg;
}

RunConfig ConfigIO::Load(const std::string& path) {
  return FromJson(ParseJson(ReadAllText(path), path));
}

json ConfigIO::ToJson(const RunConfig& cfg) {
  json root;
  root["reference"] = {{"latitude", cfg.reference.lat_deg}, {"longitude", cfg.reference.lon_deg}};
  if (cfg.band) {
    root["band"] = {{"inner_nm", cfg.band->inner_nm}, {"outer_nm", cfg.band->outer_nm}};
  }
  root["batch_size"] = cfg.batch_size;
  root["group_by"] = ToString(cfg.group_by);
  if (cfg.outlier_filters.enabled) {
    json filters = json::object();
    for (const auto& kv : cfg.outlier_filters.ranges) {
      filters[kv.first] = {kv.second.min_exclusive, kv.second.max_inclusive};
    }
    root["outlier_filters"] = filters;
  } else {
    root["outlier_filters"] = "none";
  }
  return root;
}

} // namespace transit::io
