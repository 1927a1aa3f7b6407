#include "internal.hpp"

#include <spdlog/spdlog.h>

namespace completion_repair {

const std::vector<Sanitizer>& default_sanitizers() {
  static const std::vector<Sanitizer> stages = {
      {"extractJsonSpan", extract_json_span},
      {"normalizeCharacters", normalize_characters},
      {"stripComments", strip_comments},
      {"removeLlmMetadata", remove_llm_metadata_properties},
      {"removeStrayCommentary", remove_stray_commentary},
      {"fixPropertyNames", fix_property_names},
      {"fixSeparators", fix_separators},
      {"insertMissingCommas", insert_missing_commas},
      {"removeTrailingCommas", remove_trailing_commas},
      {"closeTruncatedStructures", close_truncated_structures},
      {"fixStringCorruption", fix_string_corruption},
      {"customRules", apply_custom_rules},
  };
  return stages;
}

SanitizerPipeline::SanitizerPipeline() : stages_(default_sanitizers()) {}

SanitizerPipeline::SanitizerPipeline(std::vector<Sanitizer> stages) : stages_(std::move(stages)) {}

PipelineRun SanitizerPipeline::run(const std::string& raw, const SanitizerConfig& config) const {
  PipelineRun run;
  run.content = raw;
  auto log = logger();

  for (const auto& stage : stages_) {
    PipelineStep step;
    step.sanitizer = stage.name;
    if (stage.apply) {
      SanitizerResult r = stage.apply(run.content, config);
      step.changed = r.changed;
      step.diagnostics = r.diagnostics;
      if (r.changed) {
        run.repaired = true;
        run.content = std::move(r.content);
        if (log) log->debug("sanitizer {} changed content: {}", stage.name, r.description);
      }
    }
    for (const auto& d : step.diagnostics) run.diagnostics.push_back(stage.name + ": " + d);
    run.steps.push_back(std::move(step));
  }
  return run;
}

PipelineRun sanitize_completion(const std::string& raw, const SanitizerConfig& config) {
  static const SanitizerPipeline pipeline;
  return pipeline.run(raw, config);
}

}  // namespace completion_repair
