#include "spme/app/app_service.h"

#include "spme/app/json_codec.h"
#include "spme/core/ids.h"

#include <nlohmann/json.hpp>

namespace spme::app {

namespace {

void emit(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const std::string& event_type,
          const nlohmann::json& payload, std::vector<std::string> refs = {}) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

}  // namespace

MatchingPipelineResponse run_matching_pipeline(const MatchingPipelineRequest& req,
                                               core::Services& services,
                                               core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id =
      req.trace_id.has_value() ? req.trace_id.value() : core::new_trace_id(id_gen).value;

  emit(services, id_gen, clock, trace_id, "RunStarted",
       {
           {"source", "app_service"},
           {"operation", "matching_pipeline"},
           {"product_count", req.products.size()},
           {"config", config_to_json(req.config)},
       });

  const matching::MatchingEngine engine(req.config);
  storage::IFeatureCache* cache = req.use_feature_cache ? &services.feature_cache : nullptr;
  auto outcome = engine.run(req.products, req.cancellation, cache);

  MatchingPipelineResponse response;
  response.trace_id = trace_id;

  if (!outcome.has_value()) {
    const auto& error = outcome.error();
    switch (error.kind) {
      case matching::MatchErrorKind::kCancelled:
        emit(services, id_gen, clock, trace_id, "RunCancelled", {{"status", "cancelled"}});
        break;
      case matching::MatchErrorKind::kMalformedInput:
        emit(services, id_gen, clock, trace_id, "InputRejected", match_error_to_json(error),
             error.product_id.empty() ? std::vector<std::string>{}
                                      : std::vector<std::string>{error.product_id});
        emit(services, id_gen, clock, trace_id, "RunFailed",
             {{"status", "failed"}, {"kind", "malformed_input"}});
        break;
      case matching::MatchErrorKind::kInvalidConfig:
        emit(services, id_gen, clock, trace_id, "RunFailed",
             {{"status", "failed"}, {"kind", "invalid_config"}, {"message", error.message}});
        break;
    }
    response.error = error;
    return response;
  }

  auto result = outcome.take_value();

  emit(services, id_gen, clock, trace_id, "CandidatesGenerated",
       {
           {"naive_pair_count", result.stats.naive_pair_count},
           {"candidate_pair_count", result.stats.candidate_pair_count},
           {"pruned_pair_count", result.stats.pruned_pair_count},
           {"blocking", std::string(matching::blocking_to_string(req.config.blocking))},
       });

  for (const auto& warning : result.warnings) {
    emit(services, id_gen, clock, trace_id, "DataQualityWarning", warning_to_json(warning),
         warning.refs);
  }

  std::vector<std::string> group_ids;
  group_ids.reserve(result.groups.size());
  for (const auto& group : result.groups) {
    if (group.members.size() > 1) {
      group_ids.push_back(group.group_id.value);
    }
  }
  emit(services, id_gen, clock, trace_id, "GroupsBuilt",
       {
           {"threshold", result.threshold},
           {"group_count", result.stats.group_count},
           {"multi_member_group_count", result.stats.multi_member_group_count},
           {"matched_pair_count", result.stats.matched_pair_count},
       },
       group_ids);

  emit(services, id_gen, clock, trace_id, "RunCompleted",
       {{"status", "success"}, {"stats", stats_to_json(result.stats)}});

  response.result = std::move(result);
  return response;
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace spme::app
