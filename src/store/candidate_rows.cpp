#include "candidate_rows.hpp"

#include <cstring>

#include "promptvault/core/logger.hpp"

namespace promptvault::store::detail {

auto serialize_embedding(const std::vector<float>& vec) -> std::string {
    std::string blob(vec.size() * sizeof(float), '\0');
    std::memcpy(blob.data(), vec.data(), blob.size());
    return blob;
}

auto deserialize_embedding(const void* blob, size_t bytes) -> std::vector<float> {
    size_t count = bytes / sizeof(float);
    std::vector<float> vec(count);
    if (count > 0) {
        std::memcpy(vec.data(), blob, count * sizeof(float));
    }
    return vec;
}

auto tags_to_json(const std::set<std::string>& tags) -> Result<std::string> {
    try {
        return json(tags).dump();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Tags are not valid UTF-8", e.what()));
    }
}

auto tags_from_json(const std::string& text) -> std::set<std::string> {
    auto parsed = json::parse(text, nullptr, false);
    std::set<std::string> tags;
    if (!parsed.is_array()) {
        LOG_WARN("Ignoring malformed tags column: {}", text);
        return tags;
    }
    for (const auto& tag : parsed) {
        if (tag.is_string()) tags.insert(tag.get<std::string>());
    }
    return tags;
}

auto read_candidate(SQLite::Statement& stmt) -> Candidate {
    Candidate c;
    c.id = stmt.getColumn(0).getString();
    c.content = stmt.getColumn(1).getString();
    c.content_hash = stmt.getColumn(2).getString();

    auto phase_name = stmt.getColumn(3).getString();
    if (auto phase = parse_phase(phase_name)) {
        c.phase = *phase;
    } else {
        LOG_WARN("Record {} has unknown phase '{}'", c.id, phase_name);
    }

    c.provider = stmt.getColumn(4).getString();
    c.model = stmt.getColumn(5).getString();
    c.temperature = stmt.getColumn(6).getDouble();
    c.max_tokens = stmt.getColumn(7).getInt();
    c.actual_tokens = stmt.getColumn(8).getInt();
    c.tags = tags_from_json(stmt.getColumn(9).getString());

    auto blob = stmt.getColumn(10);
    if (!blob.isNull()) {
        c.embedding = deserialize_embedding(blob.getBlob(),
                                            static_cast<size_t>(blob.getBytes()));
        c.embedding_model = stmt.getColumn(11).getString();
        c.embedding_dimensions = stmt.getColumn(12).getInt();
    }

    c.relevance_score = stmt.getColumn(13).getDouble();
    c.usage_count = stmt.getColumn(14).getInt64();
    if (!stmt.getColumn(15).isNull()) {
        c.last_used_at = ms_to_timestamp(stmt.getColumn(15).getInt64());
    }
    c.created_at = ms_to_timestamp(stmt.getColumn(16).getInt64());
    c.updated_at = ms_to_timestamp(stmt.getColumn(17).getInt64());
    return c;
}

auto delete_candidate(SQLite::Database& conn, const std::string& id) -> int {
    SQLite::Statement edges(conn,
        "DELETE FROM prompt_relationships WHERE source_id = ? OR target_id = ?");
    edges.bind(1, id);
    edges.bind(2, id);
    int removed_edges = edges.exec();

    SQLite::Statement row(conn, "DELETE FROM prompts WHERE id = ?");
    row.bind(1, id);
    int removed = row.exec();
    if (removed > 0) {
        LOG_DEBUG("Deleted record {} and {} edge(s)", id, removed_edges);
    }
    return removed;
}

auto count_edges_by_type(SQLite::Database& conn) -> std::map<std::string, int64_t> {
    std::map<std::string, int64_t> counts;
    for (auto type : {RelationshipType::DerivedFrom, RelationshipType::SimilarTo,
                      RelationshipType::InspiredBy, RelationshipType::MergedWith}) {
        counts.emplace(relationship_type_to_string(type), 0);
    }

    SQLite::Statement stmt(conn,
        "SELECT relationship_type, COUNT(*) FROM prompt_relationships "
        "GROUP BY relationship_type");
    while (stmt.executeStep()) {
        counts[stmt.getColumn(0).getString()] = stmt.getColumn(1).getInt64();
    }
    return counts;
}

auto escape_like(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        if (ch == '%' || ch == '_' || ch == '\\') out += '\\';
        out += ch;
    }
    return out;
}

auto validate_filter(const SearchFilter& filter) -> VoidResult {
    if (filter.min_relevance &&
        !(*filter.min_relevance >= 0.0 && *filter.min_relevance <= 1.0)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "min_relevance must be within [0, 1]",
            std::to_string(*filter.min_relevance)));
    }
    return {};
}

auto build_filter(const SearchFilter& filter) -> FilterClause {
    FilterClause clause;
    std::vector<std::string> parts;

    if (filter.query && !filter.query->empty()) {
        parts.emplace_back("content LIKE ? ESCAPE '\\'");
        clause.params.emplace_back("%" + escape_like(*filter.query) + "%");
    }
    if (filter.phase) {
        parts.emplace_back("phase = ?");
        clause.params.emplace_back(std::string(phase_to_string(*filter.phase)));
    }
    if (filter.provider) {
        parts.emplace_back("provider = ?");
        clause.params.emplace_back(*filter.provider);
    }
    if (filter.model) {
        parts.emplace_back("model = ?");
        clause.params.emplace_back(*filter.model);
    }
    if (!filter.tags.empty()) {
        std::string in = "EXISTS (SELECT 1 FROM json_each(prompts.tags) WHERE json_each.value IN (";
        bool first = true;
        for (const auto& tag : filter.tags) {
            in += first ? "?" : ", ?";
            first = false;
            clause.params.emplace_back(tag);
        }
        in += "))";
        parts.push_back(std::move(in));
    }
    if (filter.created_after) {
        parts.emplace_back("created_at >= ?");
        clause.params.emplace_back(timestamp_to_ms(*filter.created_after));
    }
    if (filter.min_relevance) {
        parts.emplace_back("relevance_score >= ?");
        clause.params.emplace_back(*filter.min_relevance);
    }
    if (filter.has_embedding) {
        parts.emplace_back(*filter.has_embedding ? "embedding IS NOT NULL"
                                                 : "embedding IS NULL");
    }

    if (parts.empty()) {
        clause.sql = "1";
        return clause;
    }
    clause.sql = "(";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) clause.sql += " AND ";
        clause.sql += parts[i];
    }
    clause.sql += ")";
    return clause;
}

auto bind_params(SQLite::Statement& stmt, const std::vector<BindValue>& params,
                 int first_index) -> int {
    int index = first_index;
    for (const auto& param : params) {
        std::visit([&](const auto& value) { stmt.bind(index, value); }, param);
        ++index;
    }
    return index;
}

} // namespace promptvault::store::detail
