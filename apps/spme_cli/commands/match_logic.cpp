#include "match_logic.h"

#include "spme/app/app_service.h"

#include <nlohmann/json.hpp>

#include <ostream>

int run_match_batch(const std::string& batch_text, const MatchRunOptions& options,
                    spme::core::Services& services, spme::core::IIdGenerator& id_gen,
                    spme::core::IClock& clock, std::ostream& out, std::ostream& err) {
  const auto batch = nlohmann::json::parse(batch_text, nullptr, false);
  if (batch.is_discarded()) {
    err << "Error: input is not valid JSON\n";
    return 1;
  }

  auto products = spme::app::products_from_json(batch);
  if (!products.has_value()) {
    out << nlohmann::json{{"error", spme::app::match_error_to_json(products.error())}}.dump(2)
        << "\n";
    err << "Error: " << products.error().message << "\n";
    return 1;
  }

  spme::app::MatchingPipelineRequest request;
  request.products = products.take_value();
  request.config = options.config;

  const auto response = spme::app::run_matching_pipeline(request, services, id_gen, clock);

  if (response.ok()) {
    out << spme::app::run_result_to_json(response.result.value(), options.output).dump(2) << "\n";
    const auto& stats = response.result->stats;
    err << "Matched " << stats.product_count << " products into " << stats.group_count
        << " groups (" << stats.multi_member_group_count << " multi-supplier, "
        << response.result->warnings.size() << " warnings)\n";
  } else {
    out << nlohmann::json{{"error", spme::app::match_error_to_json(response.error.value())}}.dump(
               2)
        << "\n";
    err << "Error: " << response.error->message << "\n";
  }

  if (options.show_audit) {
    err << "\n--- Audit Trail (trace_id=" << response.trace_id << ") ---\n";
    for (const auto& event : spme::app::fetch_audit_trace(response.trace_id, services)) {
      err << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
    }
  }

  return response.ok() ? 0 : 1;
}
