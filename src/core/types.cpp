#include "promptvault/core/types.hpp"

namespace promptvault {

auto phase_to_string(Phase phase) -> std::string_view {
    switch (phase) {
        case Phase::PrimaMateria: return "prima-materia";
        case Phase::Solutio:      return "solutio";
        case Phase::Coagulatio:   return "coagulatio";
    }
    return "prima-materia";
}

auto parse_phase(std::string_view name) -> std::optional<Phase> {
    if (name == "prima-materia" || name == "idea")   return Phase::PrimaMateria;
    if (name == "solutio" || name == "human")        return Phase::Solutio;
    if (name == "coagulatio" || name == "precision") return Phase::Coagulatio;
    return std::nullopt;
}

auto relationship_type_to_string(RelationshipType type) -> std::string_view {
    switch (type) {
        case RelationshipType::DerivedFrom: return "derived_from";
        case RelationshipType::SimilarTo:   return "similar_to";
        case RelationshipType::InspiredBy:  return "inspired_by";
        case RelationshipType::MergedWith:  return "merged_with";
    }
    return "derived_from";
}

auto parse_relationship_type(std::string_view name) -> std::optional<RelationshipType> {
    if (name == "derived_from") return RelationshipType::DerivedFrom;
    if (name == "similar_to")   return RelationshipType::SimilarTo;
    if (name == "inspired_by")  return RelationshipType::InspiredBy;
    if (name == "merged_with")  return RelationshipType::MergedWith;
    return std::nullopt;
}

auto timestamp_to_ms(Timestamp ts) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()
    ).count();
}

auto ms_to_timestamp(int64_t ms) -> Timestamp {
    return Timestamp{std::chrono::milliseconds{ms}};
}

void to_json(json& j, const Candidate& c) {
    j = json{
        {"id", c.id},
        {"content", c.content},
        {"content_hash", c.content_hash},
        {"phase", c.phase},
        {"provider", c.provider},
        {"model", c.model},
        {"temperature", c.temperature},
        {"max_tokens", c.max_tokens},
        {"actual_tokens", c.actual_tokens},
        {"tags", c.tags},
        {"relevance_score", c.relevance_score},
        {"usage_count", c.usage_count},
        {"created_at", timestamp_to_ms(c.created_at)},
        {"updated_at", timestamp_to_ms(c.updated_at)},
    };
    if (c.embedding_model) j["embedding_model"] = *c.embedding_model;
    if (c.embedding_dimensions) j["embedding_dimensions"] = *c.embedding_dimensions;
    if (c.last_used_at) j["last_used_at"] = timestamp_to_ms(*c.last_used_at);
}

void from_json(const json& j, Candidate& c) {
    if (j.contains("id")) j.at("id").get_to(c.id);
    j.at("content").get_to(c.content);
    j.at("phase").get_to(c.phase);
    j.at("provider").get_to(c.provider);
    j.at("model").get_to(c.model);
    c.temperature = j.value("temperature", 0.7);
    c.max_tokens = j.value("max_tokens", 2000);
    c.actual_tokens = j.value("actual_tokens", 0);
    if (j.contains("tags")) j.at("tags").get_to(c.tags);
    if (j.contains("embedding")) c.embedding = j.at("embedding").get<std::vector<float>>();
    if (j.contains("embedding_model")) c.embedding_model = j.at("embedding_model").get<std::string>();
    if (j.contains("embedding_dimensions")) c.embedding_dimensions = j.at("embedding_dimensions").get<int>();
    c.relevance_score = j.value("relevance_score", 1.0);
    c.usage_count = j.value("usage_count", int64_t{0});
    if (j.contains("created_at")) c.created_at = ms_to_timestamp(j.at("created_at").get<int64_t>());
    if (j.contains("updated_at")) c.updated_at = ms_to_timestamp(j.at("updated_at").get<int64_t>());
    if (j.contains("last_used_at")) c.last_used_at = ms_to_timestamp(j.at("last_used_at").get<int64_t>());
}

void to_json(json& j, const Relationship& r) {
    j = json{
        {"source_id", r.source_id},
        {"target_id", r.target_id},
        {"relationship_type", r.type},
        {"strength", r.strength},
        {"context", r.context},
        {"created_at", timestamp_to_ms(r.created_at)},
    };
}

void from_json(const json& j, Relationship& r) {
    j.at("source_id").get_to(r.source_id);
    j.at("target_id").get_to(r.target_id);
    j.at("relationship_type").get_to(r.type);
    r.strength = j.value("strength", 0.5);
    r.context = j.value("context", std::string{});
    if (j.contains("created_at")) r.created_at = ms_to_timestamp(j.at("created_at").get<int64_t>());
}

} // namespace promptvault
