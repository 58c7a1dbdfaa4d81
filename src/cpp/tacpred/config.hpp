#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tacpred
{

enum class TaskKind
{
    BASE_TACTIC,
    LOCAL_ARGUMENT,
    GLOBAL_ARGUMENT,
};

enum class QueryKeyMethod
{
    BROADCAST_RAGGED,
    RAGGED_TO_DENSE_TO_RAGGED,
};

/// Throws std::invalid_argument for an unknown name.
TaskKind parseTaskKind(const std::string& name);
const char* taskKindName(TaskKind kind);

QueryKeyMethod parseQueryKeyMethod(const std::string& name);

/// Everything a prediction task is built from. Assembled once; tasks copy it.
struct TaskConfig
{
    TaskKind kind{TaskKind::BASE_TACTIC};
    int hidden_size{0};
    int tactic_embedding_size{0};
    bool unit_norm_embs{false};
    float arguments_loss_coefficient{1.0f};
    bool dynamic_global_context{false};
    bool global_cosine_similarity{false};
    bool sum_loss_over_tactic{false};
    QueryKeyMethod query_key_method{QueryKeyMethod::BROADCAST_RAGGED};

    /// Parse a flat JSON object (see loadTaskConfig for the keys).
    static TaskConfig fromJson(const std::string& json);
};

/// Dataset-wide constants shared by the encoder and the tasks.
struct GraphConstants
{
    int64_t tactic_num{0};
    int64_t node_label_num{0};
    std::vector<int64_t> tactic_index_to_numargs;
    /// Node labels that form the global argument vocabulary, in id order.
    std::vector<int64_t> global_context;

    int64_t globalContextSize() const { return static_cast<int64_t>(global_context.size()); }
    int64_t maxArguments() const;

    static GraphConstants fromJson(const std::string& json);

    /// Throws std::invalid_argument when the arity table does not cover every tactic.
    void validate() const;
};

/// Reads a task config JSON file:
///   prediction_task_type, hidden_size, tactic_embedding_size (required),
///   unit_norm_embs, arguments_loss_coefficient, dynamic_global_context,
///   global_cosine_similarity, sum_loss_over_tactic, query_key_method (optional).
TaskConfig loadTaskConfig(const std::string& path);

/// Reads graph constants JSON:
///   tactic_num, node_label_num, tactic_index_to_numargs, global_context.
GraphConstants loadGraphConstants(const std::string& path);

} // namespace tacpred
