#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace promptvault {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

/// Upper bound on accepted embedding dimensionality.
inline constexpr std::size_t kMaxEmbeddingDimensions = 8192;

/// Pipeline stage that produced a candidate.
enum class Phase {
    PrimaMateria,
    Solutio,
    Coagulatio,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Phase, {
    {Phase::PrimaMateria, "prima-materia"},
    {Phase::Solutio, "solutio"},
    {Phase::Coagulatio, "coagulatio"},
})

auto phase_to_string(Phase phase) -> std::string_view;

/// Parses a phase name. Accepts the legacy names "idea", "human" and
/// "precision" as aliases.
auto parse_phase(std::string_view name) -> std::optional<Phase>;

/// Directed edge kinds between two candidates.
enum class RelationshipType {
    DerivedFrom,
    SimilarTo,
    InspiredBy,
    MergedWith,
};

NLOHMANN_JSON_SERIALIZE_ENUM(RelationshipType, {
    {RelationshipType::DerivedFrom, "derived_from"},
    {RelationshipType::SimilarTo, "similar_to"},
    {RelationshipType::InspiredBy, "inspired_by"},
    {RelationshipType::MergedWith, "merged_with"},
})

auto relationship_type_to_string(RelationshipType type) -> std::string_view;
auto parse_relationship_type(std::string_view name) -> std::optional<RelationshipType>;

/// A generated-text candidate and everything persisted alongside it.
struct Candidate {
    std::string id;
    std::string content;
    std::string content_hash;
    Phase phase = Phase::PrimaMateria;
    std::string provider;
    std::string model;
    double temperature = 0.7;
    int max_tokens = 2000;
    int actual_tokens = 0;
    std::set<std::string> tags;

    std::optional<std::vector<float>> embedding;
    std::optional<std::string> embedding_model;
    std::optional<int> embedding_dimensions;

    double relevance_score = 1.0;
    int64_t usage_count = 0;
    std::optional<Timestamp> last_used_at;

    Timestamp created_at{};
    Timestamp updated_at{};

    [[nodiscard]] auto has_embedding() const -> bool { return embedding.has_value(); }
};

/// Serializes a candidate for display. The embedding vector itself is
/// omitted; only its model and dimensions are emitted.
void to_json(json& j, const Candidate& c);
void from_json(const json& j, Candidate& c);

struct Relationship {
    std::string source_id;
    std::string target_id;
    RelationshipType type = RelationshipType::DerivedFrom;
    double strength = 0.5;
    std::string context;
    Timestamp created_at{};
};

void to_json(json& j, const Relationship& r);
void from_json(const json& j, Relationship& r);

auto timestamp_to_ms(Timestamp ts) -> int64_t;
auto ms_to_timestamp(int64_t ms) -> Timestamp;

} // namespace promptvault
