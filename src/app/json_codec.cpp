#include "spme/app/json_codec.h"

#include <cstdint>
#include <optional>

namespace spme::app {

namespace {

using ProductsResult = core::Result<std::vector<domain::RawProduct>, matching::MatchError>;

bool present(const nlohmann::json& record, const char* key) {
  return record.contains(key) && !record.at(key).is_null();
}

// read_id accepts strings and integers; integer ids come from numeric import keys.
std::optional<std::string> read_id(const nlohmann::json& record, const char* key) {
  if (!present(record, key)) {
    return std::nullopt;
  }
  const auto& value = record.at(key);
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<std::uint64_t>());
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  return std::nullopt;
}

// read_optional_string stores the field into out; returns false on a type error.
bool read_optional_string(const nlohmann::json& record, const char* key,
                          std::optional<std::string>& out) {
  if (!present(record, key)) {
    return true;
  }
  if (!record.at(key).is_string()) {
    return false;
  }
  out = record.at(key).get<std::string>();
  return true;
}

// An image is either {"path": "<file>"} or {"bytes": [<encoded file bytes>]}.
std::optional<std::string> read_image(const nlohmann::json& value, domain::ImageRef& image) {
  if (!value.is_object()) {
    return "image must be an object";
  }

  if (present(value, "path")) {
    if (!value.at("path").is_string()) {
      return "image.path must be a string";
    }
    image.path = value.at("path").get<std::string>();
  }

  if (present(value, "bytes")) {
    const auto& bytes = value.at("bytes");
    if (!bytes.is_array()) {
      return "image.bytes must be an array";
    }
    image.bytes.reserve(bytes.size());
    for (const auto& byte : bytes) {
      if (!byte.is_number_unsigned() || byte.get<std::uint64_t>() > 255) {
        return "image.bytes must hold integers in [0,255]";
      }
      image.bytes.push_back(static_cast<std::uint8_t>(byte.get<std::uint64_t>()));
    }
  }

  if (!image.valid()) {
    return "image needs exactly one non-empty 'path' or 'bytes'";
  }
  return std::nullopt;
}

std::optional<std::string> read_product(const nlohmann::json& record,
                                        domain::RawProduct& product) {
  if (!record.is_object()) {
    return "record must be an object";
  }

  const auto id = read_id(record, "id");
  if (!id.has_value()) {
    return "missing or non-scalar field 'id'";
  }
  product.product_id = core::ProductId{id.value()};

  const auto supplier = read_id(record, "supplier_id");
  if (!supplier.has_value()) {
    return "missing or non-scalar field 'supplier_id'";
  }
  product.supplier_id = core::SupplierId{supplier.value()};

  if (!present(record, "name") || !record.at("name").is_string()) {
    return "missing or non-string field 'name'";
  }
  product.name = record.at("name").get<std::string>();

  if (!present(record, "price") || !record.at("price").is_number()) {
    return "missing or non-numeric field 'price'";
  }
  product.price.amount = record.at("price").get<double>();

  std::optional<std::string> currency;
  if (!read_optional_string(record, "currency", currency)) {
    return "field 'currency' must be a string";
  }
  if (currency.has_value()) {
    product.price.currency = currency.value();
  }

  std::optional<std::string> url;
  if (!read_optional_string(record, "url", url)) {
    return "field 'url' must be a string";
  }
  product.url = url.value_or("");

  if (!read_optional_string(record, "english_name", product.english_name)) {
    return "field 'english_name' must be a string";
  }
  if (!read_optional_string(record, "normalized_name", product.normalized_name)) {
    return "field 'normalized_name' must be a string";
  }

  std::optional<std::string> hash_hex;
  std::optional<std::string> hash_algorithm;
  if (!read_optional_string(record, "image_hash", hash_hex) ||
      !read_optional_string(record, "image_hash_algorithm", hash_algorithm)) {
    return "fields 'image_hash' and 'image_hash_algorithm' must be strings";
  }
  if (hash_hex.has_value()) {
    auto parsed = domain::PerceptualHash::from_hex(hash_hex.value(), hash_algorithm.value_or(""));
    if (!parsed.has_value()) {
      return "image_hash: " + parsed.error();
    }
    product.image_hash = parsed.take_value();
  }

  if (present(record, "image")) {
    domain::ImageRef image;
    if (auto error = read_image(record.at("image"), image); error.has_value()) {
      return error;
    }
    product.image = std::move(image);
  }

  return std::nullopt;
}

bool read_double(const nlohmann::json& j, const char* key, double& out) {
  if (!j.contains(key)) {
    return true;
  }
  if (!j.at(key).is_number()) {
    return false;
  }
  out = j.at(key).get<double>();
  return true;
}

bool read_size(const nlohmann::json& j, const char* key, std::size_t& out) {
  if (!j.contains(key)) {
    return true;
  }
  if (!j.at(key).is_number_unsigned()) {
    return false;
  }
  out = j.at(key).get<std::size_t>();
  return true;
}

}  // namespace

ProductsResult products_from_json(const nlohmann::json& j) {
  const nlohmann::json* records = &j;
  if (j.is_object() && j.contains("products")) {
    records = &j.at("products");
  }
  if (!records->is_array()) {
    return ProductsResult::err(matching::MatchError{
        matching::MatchErrorKind::kMalformedInput,
        "product batch must be an array or an object with a 'products' array", std::nullopt, ""});
  }

  std::vector<domain::RawProduct> products;
  products.reserve(records->size());
  for (std::size_t i = 0; i < records->size(); ++i) {
    const auto& record = records->at(i);
    domain::RawProduct product;
    if (auto error = read_product(record, product); error.has_value()) {
      return ProductsResult::err(matching::MatchError{
          matching::MatchErrorKind::kMalformedInput,
          "record " + std::to_string(i) + ": " + error.value(), i, product.product_id.value});
    }
    products.push_back(std::move(product));
  }

  return ProductsResult::ok(std::move(products));
}

nlohmann::json warning_to_json(const domain::DataQualityWarning& warning) {
  nlohmann::json j;
  j["kind"] = std::string(domain::warning_kind_to_string(warning.kind));
  j["message"] = warning.message;
  j["refs"] = warning.refs;
  return j;
}

nlohmann::json pair_score_to_json(const domain::PairScore& score) {
  nlohmann::json j;
  j["product_a_id"] = score.product_a_id.value;
  j["product_b_id"] = score.product_b_id.value;
  j["text_similarity"] = score.text_similarity;
  j["image_similarity"] = score.image_similarity.has_value()
                              ? nlohmann::json(score.image_similarity.value())
                              : nlohmann::json(nullptr);
  j["hybrid_score"] = score.hybrid_score;
  j["is_match"] = score.is_match;
  return j;
}

nlohmann::json group_to_json(const domain::MatchingGroup& group) {
  nlohmann::json j;
  j["group_id"] = group.group_id.value;
  j["status"] = std::string(domain::group_status_to_string(group.status));

  nlohmann::json members = nlohmann::json::array();
  for (const auto& id : group.members) {
    members.push_back(id.value);
  }
  j["members"] = members;

  j["representative_name"] = group.representative_name;
  j["representative_product_id"] = group.representative_product_id.value;
  j["min_price"] = group.min_price;
  j["max_price"] = group.max_price;
  j["avg_price"] = group.avg_price;
  j["currency"] = group.currency;
  j["best_member_id"] = group.best_member_id.value;
  j["best_supplier_id"] = group.best_supplier_id.value;
  j["confidence_score"] = group.confidence_score;
  j["scored_pair_count"] = group.scored_pair_count;

  nlohmann::json warnings = nlohmann::json::array();
  for (const auto& warning : group.warnings) {
    warnings.push_back(warning_to_json(warning));
  }
  j["warnings"] = warnings;

  nlohmann::json ranked = nlohmann::json::array();
  for (const auto& member : group.comparison.ranked_members) {
    nlohmann::json m;
    m["rank"] = member.rank;
    m["product_id"] = member.product_id.value;
    m["supplier_id"] = member.supplier_id.value;
    m["name"] = member.name;
    m["url"] = member.url;
    m["price"] = member.price.amount;
    m["currency"] = member.price.currency;
    ranked.push_back(m);
  }
  j["price_comparison"] = {
      {"savings_absolute", group.comparison.savings_absolute},
      {"savings_percent", group.comparison.savings_percent},
      {"ranked_members", ranked},
  };

  return j;
}

nlohmann::json stats_to_json(const matching::RunStats& stats) {
  return {
      {"product_count", stats.product_count},
      {"naive_pair_count", stats.naive_pair_count},
      {"candidate_pair_count", stats.candidate_pair_count},
      {"pruned_pair_count", stats.pruned_pair_count},
      {"matched_pair_count", stats.matched_pair_count},
      {"group_count", stats.group_count},
      {"multi_member_group_count", stats.multi_member_group_count},
      {"worker_count", stats.worker_count},
      {"name_cache_hits", stats.name_cache_hits},
      {"hash_cache_hits", stats.hash_cache_hits},
      {"hashes_computed", stats.hashes_computed},
  };
}

nlohmann::json run_result_to_json(const matching::MatchRunResult& result,
                                  const ResultJsonOptions& options) {
  nlohmann::json j;
  j["threshold"] = result.threshold;
  j["stats"] = stats_to_json(result.stats);

  nlohmann::json groups = nlohmann::json::array();
  for (const auto& group : result.groups) {
    groups.push_back(group_to_json(group));
  }
  j["groups"] = groups;

  nlohmann::json warnings = nlohmann::json::array();
  for (const auto& warning : result.warnings) {
    warnings.push_back(warning_to_json(warning));
  }
  j["warnings"] = warnings;

  if (options.include_pair_scores) {
    nlohmann::json scores = nlohmann::json::array();
    for (const auto& score : result.pair_scores) {
      scores.push_back(pair_score_to_json(score));
    }
    j["pair_scores"] = scores;
  }

  if (options.include_features) {
    nlohmann::json features = nlohmann::json::array();
    for (const auto& f : result.features) {
      nlohmann::json fj;
      fj["product_id"] = f.product_id.value;
      fj["normalized_name"] = f.normalized_name;
      if (f.image_hash.has_value()) {
        fj["image_hash"] = f.image_hash->to_hex();
        fj["image_hash_algorithm"] = f.image_hash->algorithm;
      } else {
        fj["image_hash"] = nullptr;
      }
      features.push_back(fj);
    }
    j["features"] = features;
  }

  return j;
}

nlohmann::json match_error_to_json(const matching::MatchError& error) {
  nlohmann::json j;
  j["kind"] = std::string(matching::match_error_kind_to_string(error.kind));
  j["message"] = error.message;
  if (error.record_index.has_value()) {
    j["record_index"] = error.record_index.value();
  }
  if (!error.product_id.empty()) {
    j["product_id"] = error.product_id;
  }
  return j;
}

nlohmann::json config_to_json(const matching::MatchConfig& config) {
  nlohmann::json j;
  j["mode"] = std::string(matching::match_mode_to_string(config.mode));
  j["threshold"] =
      config.threshold.has_value() ? nlohmann::json(config.threshold.value()) : nullptr;
  j["text_weights"] = {
      {"char_jaccard", config.text_weights.char_jaccard},
      {"bigram", config.text_weights.bigram},
      {"trigram", config.text_weights.trigram},
  };
  j["hybrid_weights"] = {
      {"text", config.hybrid_weights.text},
      {"image", config.hybrid_weights.image},
  };
  j["blocking"] = std::string(matching::blocking_to_string(config.blocking));
  j["hash_algorithm"] = std::string(similarity::hash_algorithm_to_string(config.hash_algorithm));
  j["hash_grid"] = config.hash_grid;
  j["worker_count"] = config.worker_count;
  j["parallel_threshold"] = config.parallel_threshold;
  j["auto_confirm_threshold"] = config.auto_confirm_threshold;
  j["strip_noise_words"] = config.normalizer.strip_noise_words;
  return j;
}

core::Result<matching::MatchConfig, std::string> config_from_json(const nlohmann::json& j) {
  using R = core::Result<matching::MatchConfig, std::string>;

  if (!j.is_object()) {
    return R::err("config must be a JSON object");
  }

  matching::MatchConfig config;

  if (j.contains("mode")) {
    const auto mode =
        j.at("mode").is_string() ? matching::match_mode_from_string(j.at("mode").get<std::string>())
                                 : std::nullopt;
    if (!mode.has_value()) {
      return R::err("mode must be one of text, image, hybrid");
    }
    config.mode = mode.value();
  }

  if (present(j, "threshold")) {
    if (!j.at("threshold").is_number()) {
      return R::err("threshold must be a number");
    }
    config.threshold = j.at("threshold").get<double>();
  }

  if (j.contains("text_weights")) {
    const auto& tw = j.at("text_weights");
    if (!tw.is_object() || !read_double(tw, "char_jaccard", config.text_weights.char_jaccard) ||
        !read_double(tw, "bigram", config.text_weights.bigram) ||
        !read_double(tw, "trigram", config.text_weights.trigram)) {
      return R::err("text_weights must be an object of numbers");
    }
  }

  if (j.contains("hybrid_weights")) {
    const auto& hw = j.at("hybrid_weights");
    if (!hw.is_object() || !read_double(hw, "text", config.hybrid_weights.text) ||
        !read_double(hw, "image", config.hybrid_weights.image)) {
      return R::err("hybrid_weights must be an object of numbers");
    }
  }

  if (j.contains("blocking")) {
    const auto blocking = j.at("blocking").is_string()
                              ? matching::blocking_from_string(j.at("blocking").get<std::string>())
                              : std::nullopt;
    if (!blocking.has_value()) {
      return R::err("blocking must be one of none, first_bigram, price_band");
    }
    config.blocking = blocking.value();
  }

  if (j.contains("hash_algorithm")) {
    const auto algorithm =
        j.at("hash_algorithm").is_string()
            ? similarity::hash_algorithm_from_string(j.at("hash_algorithm").get<std::string>())
            : std::nullopt;
    if (!algorithm.has_value()) {
      return R::err("hash_algorithm must be one of dhash, ahash");
    }
    config.hash_algorithm = algorithm.value();
  }

  if (!read_size(j, "hash_grid", config.hash_grid) ||
      !read_size(j, "worker_count", config.worker_count) ||
      !read_size(j, "parallel_threshold", config.parallel_threshold)) {
    return R::err("hash_grid, worker_count and parallel_threshold must be non-negative integers");
  }

  if (!read_double(j, "auto_confirm_threshold", config.auto_confirm_threshold)) {
    return R::err("auto_confirm_threshold must be a number");
  }

  if (j.contains("strip_noise_words")) {
    if (!j.at("strip_noise_words").is_boolean()) {
      return R::err("strip_noise_words must be a boolean");
    }
    config.normalizer.strip_noise_words = j.at("strip_noise_words").get<bool>();
  }

  const auto valid = matching::validate_config(config);
  if (!valid.has_value()) {
    return R::err(valid.error());
  }
  return R::ok(std::move(config));
}

}  // namespace spme::app
