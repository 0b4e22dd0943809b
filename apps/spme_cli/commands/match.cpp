#include "match.h"

#include "match_logic.h"
#include "spme/app/json_codec.h"
#include "spme/core/clock.h"
#include "spme/core/id_generator.h"
#include "spme/core/services.h"
#include "spme/storage/audit_log.h"
#include "spme/storage/feature_cache.h"
#include "spme/storage/sqlite/sqlite_audit_log.h"
#include "spme/storage/sqlite/sqlite_db.h"
#include "spme/storage/sqlite/sqlite_feature_cache.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Flag values are kept raw and applied on top of the --config file afterwards.
struct MatchCliConfig {
  std::optional<std::string> input_path;
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;
  std::optional<spme::matching::MatchMode> mode;
  std::optional<double> threshold;
  std::optional<spme::matching::BlockingStrategy> blocking;
  std::optional<spme::similarity::HashAlgorithm> hash_algorithm;
  std::optional<std::size_t> workers;
  bool strip_noise{false};
  bool include_pairs{true};
  bool include_features{false};
  bool show_audit{false};
  bool help{false};
};

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::vector<spme::apps::Option<MatchCliConfig>> match_options() {
  return {
      {"--input", true, "Product batch JSON file ('-' for stdin)",
       [](MatchCliConfig& c, const std::string& v) {
         c.input_path = v;
         return true;
       }},
      {"--config", true, "MatchConfig JSON file",
       [](MatchCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--db", true, "SQLite database for the feature cache and audit log",
       [](MatchCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--mode", true, "Matching mode (text|image|hybrid)",
       [](MatchCliConfig& c, const std::string& v) {
         c.mode = spme::matching::match_mode_from_string(v);
         if (!c.mode.has_value()) {
           std::cerr << "Invalid --mode: " << v << " (valid: text, image, hybrid)\n";
           return false;
         }
         return true;
       }},
      {"--threshold", true, "Match threshold in [0,1] (default: preset for the mode)",
       [](MatchCliConfig& c, const std::string& v) {
         try {
           std::size_t used = 0;
           c.threshold = std::stod(v, &used);
           if (used != v.size()) {
             throw std::invalid_argument(v);
           }
         } catch (const std::exception&) {
           std::cerr << "Invalid --threshold: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--blocking", true, "Candidate blocking (none|first_bigram|price_band)",
       [](MatchCliConfig& c, const std::string& v) {
         c.blocking = spme::matching::blocking_from_string(v);
         if (!c.blocking.has_value()) {
           std::cerr << "Invalid --blocking: " << v
                     << " (valid: none, first_bigram, price_band)\n";
           return false;
         }
         return true;
       }},
      {"--hash", true, "Perceptual hash for product images (dhash|ahash)",
       [](MatchCliConfig& c, const std::string& v) {
         c.hash_algorithm = spme::similarity::hash_algorithm_from_string(v);
         if (!c.hash_algorithm.has_value()) {
           std::cerr << "Invalid --hash: " << v << " (valid: dhash, ahash)\n";
           return false;
         }
         return true;
       }},
      {"--workers", true, "Scoring threads (0 = hardware concurrency)",
       [](MatchCliConfig& c, const std::string& v) {
         try {
           std::size_t used = 0;
           const unsigned long workers = std::stoul(v, &used);
           if (used != v.size()) {
             throw std::invalid_argument(v);
           }
           c.workers = workers;
         } catch (const std::exception&) {
           std::cerr << "Invalid --workers: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--strip-noise", false, "Strip Chinese function characters from names",
       [](MatchCliConfig& c, const std::string&) {
         c.strip_noise = true;
         return true;
       }},
      {"--no-pairs", false, "Omit pair scores from the output",
       [](MatchCliConfig& c, const std::string&) {
         c.include_pairs = false;
         return true;
       }},
      {"--features", false, "Include derived features (normalized names, hashes)",
       [](MatchCliConfig& c, const std::string&) {
         c.include_features = true;
         return true;
       }},
      {"--show-audit", false, "Print the audit trail of the run to stderr",
       [](MatchCliConfig& c, const std::string&) {
         c.show_audit = true;
         return true;
       }},
      {"--help", false, "Show this help",
       [](MatchCliConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_match(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = match_options();
  const auto parsed = spme::apps::parse_options(argc, argv, options, 2);
  const auto& cli = parsed.config;

  if (cli.help) {
    spme::apps::print_usage(std::cout, "spme_cli match --input <file> [options]", options);
    return 0;
  }
  if (!parsed.ok()) {
    return 1;
  }
  if (!cli.input_path.has_value()) {
    std::cerr << "Error: --input <file> is required\n";
    return 1;
  }

  MatchRunOptions run_options;
  if (cli.config_path.has_value()) {
    const auto text = read_file(cli.config_path.value());
    if (!text.has_value()) {
      std::cerr << "Error: cannot read config file " << cli.config_path.value() << "\n";
      return 1;
    }
    const auto j = nlohmann::json::parse(text.value(), nullptr, false);
    if (j.is_discarded()) {
      std::cerr << "Error: config file is not valid JSON\n";
      return 1;
    }
    auto config = spme::app::config_from_json(j);
    if (!config.has_value()) {
      std::cerr << "Error: invalid config: " << config.error() << "\n";
      return 1;
    }
    run_options.config = config.take_value();
  }

  auto& config = run_options.config;
  if (cli.mode.has_value()) {
    config.mode = cli.mode.value();
  }
  if (cli.threshold.has_value()) {
    config.threshold = cli.threshold;
  }
  if (cli.blocking.has_value()) {
    config.blocking = cli.blocking.value();
  }
  if (cli.hash_algorithm.has_value()) {
    config.hash_algorithm = cli.hash_algorithm.value();
  }
  if (cli.workers.has_value()) {
    config.worker_count = cli.workers.value();
  }
  if (cli.strip_noise) {
    config.normalizer.strip_noise_words = true;
  }
  run_options.output.include_pair_scores = cli.include_pairs;
  run_options.output.include_features = cli.include_features;
  run_options.show_audit = cli.show_audit;

  std::string batch_text;
  if (cli.input_path.value() == "-") {
    std::ostringstream buffer;
    buffer << std::cin.rdbuf();
    batch_text = buffer.str();
  } else {
    const auto text = read_file(cli.input_path.value());
    if (!text.has_value()) {
      std::cerr << "Error: cannot read input file " << cli.input_path.value() << "\n";
      return 1;
    }
    batch_text = text.value();
  }

  spme::core::SystemIdGenerator id_gen;
  spme::core::SystemClock clock;

  if (cli.db_path.has_value()) {
    auto db_result = spme::storage::sqlite::SqliteDb::open(cli.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }

    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v2();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }

    spme::storage::sqlite::SqliteAuditLog audit_log(db);
    spme::storage::sqlite::SqliteFeatureCache feature_cache(db);
    spme::core::Services services{audit_log, feature_cache};
    return run_match_batch(batch_text, run_options, services, id_gen, clock, std::cout, std::cerr);
  }

  spme::storage::InMemoryAuditLog audit_log;
  spme::storage::InMemoryFeatureCache feature_cache;
  spme::core::Services services{audit_log, feature_cache};
  return run_match_batch(batch_text, run_options, services, id_gen, clock, std::cout, std::cerr);
}
