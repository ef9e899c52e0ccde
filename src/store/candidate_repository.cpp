#include "promptvault/store/candidate_repository.hpp"
#include "promptvault/core/logger.hpp"
#include "promptvault/core/utils.hpp"

#include <cmath>

#include "candidate_rows.hpp"

namespace promptvault::store {

auto validate_embedding(const std::optional<std::vector<float>>& embedding,
                        const std::optional<std::string>& model,
                        const std::optional<int>& dimensions) -> VoidResult {
    if (!embedding) {
        if (model || dimensions) {
            return std::unexpected(make_error(ErrorCode::Conflict,
                "Embedding metadata set without an embedding"));
        }
        return {};
    }

    if (embedding->empty() || embedding->size() > kMaxEmbeddingDimensions) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Embedding dimensionality out of range",
            std::to_string(embedding->size())));
    }
    for (float v : *embedding) {
        if (!std::isfinite(v)) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Embedding contains non-finite values"));
        }
    }
    if (!model || model->empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Embedding requires a model name"));
    }
    if (!dimensions || *dimensions <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Embedding requires positive dimensions"));
    }
    if (static_cast<size_t>(*dimensions) != embedding->size()) {
        return std::unexpected(make_error(ErrorCode::Conflict,
            "Embedding length does not match declared dimensions",
            std::to_string(embedding->size()) + " != " + std::to_string(*dimensions)));
    }
    return {};
}

CandidateRepository::CandidateRepository(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

auto CandidateRepository::create(const Candidate& candidate)
    -> awaitable<Result<std::string>> {
    if (candidate.content.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Content must not be empty"));
    }
    if (!(candidate.relevance_score >= 0.0 && candidate.relevance_score <= 1.0)) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "relevance_score must be within [0, 1]",
            std::to_string(candidate.relevance_score)));
    }
    if (candidate.usage_count < 0) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "usage_count must not be negative"));
    }
    if (auto valid = validate_embedding(candidate.embedding, candidate.embedding_model,
                                        candidate.embedding_dimensions);
        !valid) {
        LOG_WARN("Rejected record: {}", valid.error().what());
        co_return make_fail(valid.error());
    }

    auto tags = detail::tags_to_json(candidate.tags);
    if (!tags) {
        LOG_WARN("Rejected record: {}", tags.error().what());
        co_return make_fail(tags.error());
    }

    auto id = utils::generate_uuid();
    auto now = utils::timestamp_ms();
    auto created = candidate.created_at.time_since_epoch().count() != 0
        ? timestamp_to_ms(candidate.created_at)
        : now;

    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "INSERT INTO prompts (" + std::string(detail::kCandidateColumns) + ") "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

        stmt.bind(1, id);
        stmt.bind(2, candidate.content);
        stmt.bind(3, utils::sha256(candidate.content));
        stmt.bind(4, std::string(phase_to_string(candidate.phase)));
        stmt.bind(5, candidate.provider);
        stmt.bind(6, candidate.model);
        stmt.bind(7, candidate.temperature);
        stmt.bind(8, candidate.max_tokens);
        stmt.bind(9, candidate.actual_tokens);
        stmt.bind(10, *tags);

        if (candidate.embedding) {
            auto blob = detail::serialize_embedding(*candidate.embedding);
            stmt.bind(11, blob.data(), static_cast<int>(blob.size()));
            stmt.bind(12, *candidate.embedding_model);
            stmt.bind(13, *candidate.embedding_dimensions);
        } else {
            stmt.bind(11);
            stmt.bind(12);
            stmt.bind(13);
        }

        stmt.bind(14, candidate.relevance_score);
        stmt.bind(15, candidate.usage_count);
        if (candidate.last_used_at) {
            stmt.bind(16, timestamp_to_ms(*candidate.last_used_at));
        } else {
            stmt.bind(16);
        }
        stmt.bind(17, created);
        stmt.bind(18, now);

        stmt.exec();
        LOG_DEBUG("Created record {} ({}, {})", id, phase_to_string(candidate.phase),
                  candidate.provider);
        co_return id;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to create record: {}", e.what());
        co_return make_fail(to_error(e, "Failed to create record"));
    }
}

auto CandidateRepository::get(std::string_view id) -> awaitable<Result<Candidate>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT " + std::string(detail::kCandidateColumns) +
            " FROM prompts WHERE id = ?");
        stmt.bind(1, std::string(id));

        if (!stmt.executeStep()) {
            co_return make_fail(make_error(ErrorCode::NotFound, "Record not found",
                                           std::string(id)));
        }
        co_return detail::read_candidate(stmt);
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to get record {}: {}", id, e.what());
        co_return make_fail(to_error(e, "Failed to get record"));
    }
}

auto CandidateRepository::update(std::string_view id, const CandidateUpdate& changes)
    -> awaitable<Result<void>> {
    if (changes.content && changes.content->empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Content must not be empty"));
    }
    if (changes.embedding) {
        const auto& e = *changes.embedding;
        if (auto valid = validate_embedding(e.embedding, e.model, e.dimensions); !valid) {
            LOG_WARN("Rejected embedding update for {}: {}", id, valid.error().what());
            co_return make_fail(valid.error());
        }
    }

    std::optional<std::string> tags;
    if (changes.tags) {
        auto encoded = detail::tags_to_json(*changes.tags);
        if (!encoded) {
            LOG_WARN("Rejected tag update for {}: {}", id, encoded.error().what());
            co_return make_fail(encoded.error());
        }
        tags = std::move(*encoded);
    }

    std::string sql = "UPDATE prompts SET updated_at = ?";
    if (changes.content) sql += ", content = ?, content_hash = ?";
    if (changes.tags) sql += ", tags = ?";
    if (changes.temperature) sql += ", temperature = ?";
    if (changes.max_tokens) sql += ", max_tokens = ?";
    if (changes.actual_tokens) sql += ", actual_tokens = ?";
    if (changes.embedding) sql += ", embedding = ?, embedding_model = ?, embedding_dimensions = ?";
    sql += " WHERE id = ?";

    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(), sql);
        int index = 1;
        stmt.bind(index++, utils::timestamp_ms());
        if (changes.content) {
            stmt.bind(index++, *changes.content);
            stmt.bind(index++, utils::sha256(*changes.content));
        }
        if (tags) stmt.bind(index++, *tags);
        if (changes.temperature) stmt.bind(index++, *changes.temperature);
        if (changes.max_tokens) stmt.bind(index++, *changes.max_tokens);
        if (changes.actual_tokens) stmt.bind(index++, *changes.actual_tokens);
        std::string blob;
        if (changes.embedding) {
            blob = detail::serialize_embedding(changes.embedding->embedding);
            stmt.bind(index++, blob.data(), static_cast<int>(blob.size()));
            stmt.bind(index++, changes.embedding->model);
            stmt.bind(index++, changes.embedding->dimensions);
        }
        stmt.bind(index, std::string(id));

        if (stmt.exec() == 0) {
            co_return make_fail(make_error(ErrorCode::NotFound, "Record not found",
                                           std::string(id)));
        }
        LOG_DEBUG("Updated record {}", id);
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to update record {}: {}", id, e.what());
        co_return make_fail(to_error(e, "Failed to update record"));
    }
}

auto CandidateRepository::remove(std::string_view id) -> awaitable<Result<void>> {
    auto guard = db_->lock();
    try {
        SQLite::Transaction txn(db_->connection());
        if (detail::delete_candidate(db_->connection(), std::string(id)) == 0) {
            co_return make_fail(make_error(ErrorCode::NotFound, "Record not found",
                                           std::string(id)));
        }
        txn.commit();
        co_return ok_result();
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to delete record {}: {}", id, e.what());
        co_return make_fail(to_error(e, "Failed to delete record"));
    }
}

auto CandidateRepository::record_usage(std::string_view id) -> awaitable<Result<int64_t>> {
    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);

        auto now = utils::timestamp_ms();
        SQLite::Statement bump(conn,
            "UPDATE prompts SET usage_count = usage_count + 1, last_used_at = ?, "
            "updated_at = ? WHERE id = ?");
        bump.bind(1, now);
        bump.bind(2, now);
        bump.bind(3, std::string(id));
        if (bump.exec() == 0) {
            co_return make_fail(make_error(ErrorCode::NotFound, "Record not found",
                                           std::string(id)));
        }

        SQLite::Statement read(conn, "SELECT usage_count FROM prompts WHERE id = ?");
        read.bind(1, std::string(id));
        read.executeStep();
        int64_t usage = read.getColumn(0).getInt64();

        txn.commit();
        co_return usage;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to record usage for {}: {}", id, e.what());
        co_return make_fail(to_error(e, "Failed to record usage"));
    }
}

auto CandidateRepository::find_by_content_hash(std::string_view hash, int limit)
    -> awaitable<Result<std::vector<Candidate>>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT " + std::string(detail::kCandidateColumns) +
            " FROM prompts WHERE content_hash = ? ORDER BY created_at ASC, id ASC LIMIT ?");
        stmt.bind(1, std::string(hash));
        stmt.bind(2, effective_limit(limit));

        std::vector<Candidate> results;
        while (stmt.executeStep()) {
            results.push_back(detail::read_candidate(stmt));
        }
        co_return results;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to look up content hash {}: {}", hash, e.what());
        co_return make_fail(to_error(e, "Failed to look up content hash"));
    }
}

auto CandidateRepository::count() -> awaitable<Result<size_t>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(), "SELECT COUNT(*) FROM prompts");
        stmt.executeStep();
        co_return static_cast<size_t>(stmt.getColumn(0).getInt64());
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to count records: {}", e.what());
        co_return make_fail(to_error(e, "Failed to count records"));
    }
}

} // namespace promptvault::store
