#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace tacpred
{

namespace
{

// Minimal reader for flat JSON objects: top-level keys with string, number,
// bool or int-array values. Nested objects are not supported.

void skipWhitespace(const std::string& json, size_t& pos)
{
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
}

std::optional<size_t> findValue(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    size_t pos = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        throw std::runtime_error("Missing ':' after key in config: " + key);
    pos++;
    skipWhitespace(json, pos);
    return pos;
}

size_t requireValue(const std::string& json, const std::string& key)
{
    auto pos = findValue(json, key);
    if (!pos)
        throw std::runtime_error("Key not found in config: " + key);
    return *pos;
}

std::string parseJsonString(const std::string& json, size_t& pos, const std::string& key)
{
    if (pos >= json.size() || json[pos] != '"')
        throw std::runtime_error("Expected a string value for config key: " + key);
    pos++;
    std::string result;
    while (pos < json.size() && json[pos] != '"')
    {
        if (json[pos] == '\\')
        {
            pos++;
            if (pos < json.size()) result += json[pos];
        }
        else
        {
            result += json[pos];
        }
        pos++;
    }
    pos++;
    return result;
}

int64_t parseJsonInt(const std::string& json, size_t& pos, const std::string& key)
{
    size_t start = pos;
    if (pos < json.size() && json[pos] == '-') pos++;
    while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) pos++;
    if (start == pos)
        throw std::runtime_error("Expected an integer value for config key: " + key);
    return std::stoll(json.substr(start, pos - start));
}

double parseJsonNumber(const std::string& json, size_t& pos, const std::string& key)
{
    size_t start = pos;
    while (pos < json.size()
           && (std::isdigit(static_cast<unsigned char>(json[pos])) || json[pos] == '-' || json[pos] == '+'
               || json[pos] == '.' || json[pos] == 'e' || json[pos] == 'E'))
        pos++;
    if (start == pos)
        throw std::runtime_error("Expected a number value for config key: " + key);
    return std::stod(json.substr(start, pos - start));
}

bool parseJsonBool(const std::string& json, size_t& pos, const std::string& key)
{
    if (json.compare(pos, 4, "true") == 0)
    {
        pos += 4;
        return true;
    }
    if (json.compare(pos, 5, "false") == 0)
    {
        pos += 5;
        return false;
    }
    throw std::runtime_error("Expected true/false for config key: " + key);
}

std::vector<int64_t> parseIntArray(const std::string& json, size_t& pos, const std::string& key)
{
    std::vector<int64_t> result;
    if (pos >= json.size() || json[pos] != '[')
        throw std::runtime_error("Expected '[' for config key: " + key);
    pos++;
    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == ']')
    {
        pos++;
        return result;
    }
    while (true)
    {
        skipWhitespace(json, pos);
        result.push_back(parseJsonInt(json, pos, key));
        skipWhitespace(json, pos);
        if (pos >= json.size())
            throw std::runtime_error("Unterminated array for config key: " + key);
        if (json[pos] == ']')
            break;
        if (json[pos] != ',')
            throw std::runtime_error("Expected ',' or ']' in array for config key: " + key);
        pos++;
    }
    pos++;
    return result;
}

std::string readJsonString(const std::string& json, const std::string& key)
{
    size_t pos = requireValue(json, key);
    return parseJsonString(json, pos, key);
}

int64_t readJsonInt(const std::string& json, const std::string& key)
{
    size_t pos = requireValue(json, key);
    return parseJsonInt(json, pos, key);
}

float readJsonFloat(const std::string& json, const std::string& key, float fallback)
{
    auto pos = findValue(json, key);
    if (!pos) return fallback;
    return static_cast<float>(parseJsonNumber(json, *pos, key));
}

bool readJsonBool(const std::string& json, const std::string& key, bool fallback)
{
    auto pos = findValue(json, key);
    if (!pos) return fallback;
    return parseJsonBool(json, *pos, key);
}

std::vector<int64_t> readJsonIntArray(const std::string& json, const std::string& key)
{
    size_t pos = requireValue(json, key);
    return parseIntArray(json, pos, key);
}

std::string readFile(const std::string& path, const char* what)
{
    std::ifstream f(path);
    if (!f) throw std::runtime_error(std::string("Failed to open ") + what + ": " + path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // anonymous namespace

// ============================================================================
// Enum names
// ============================================================================

TaskKind parseTaskKind(const std::string& name)
{
    if (name == "base_tactic_prediction") return TaskKind::BASE_TACTIC;
    if (name == "local_argument_prediction") return TaskKind::LOCAL_ARGUMENT;
    if (name == "global_argument_prediction") return TaskKind::GLOBAL_ARGUMENT;
    throw std::invalid_argument(name + " is not a valid prediction task type");
}

const char* taskKindName(TaskKind kind)
{
    switch (kind)
    {
    case TaskKind::BASE_TACTIC:
        return "base_tactic_prediction";
    case TaskKind::LOCAL_ARGUMENT:
        return "local_argument_prediction";
    case TaskKind::GLOBAL_ARGUMENT:
        return "global_argument_prediction";
    }
    return "unknown";
}

QueryKeyMethod parseQueryKeyMethod(const std::string& name)
{
    if (name == "broadcast_ragged") return QueryKeyMethod::BROADCAST_RAGGED;
    if (name == "ragged_to_dense_to_ragged") return QueryKeyMethod::RAGGED_TO_DENSE_TO_RAGGED;
    throw std::invalid_argument("Unsupported multiplication method: " + name);
}

// ============================================================================
// TaskConfig
// ============================================================================

TaskConfig TaskConfig::fromJson(const std::string& json)
{
    TaskConfig config;
    config.kind = parseTaskKind(readJsonString(json, "prediction_task_type"));
    config.hidden_size = static_cast<int>(readJsonInt(json, "hidden_size"));
    config.tactic_embedding_size = static_cast<int>(readJsonInt(json, "tactic_embedding_size"));
    config.unit_norm_embs = readJsonBool(json, "unit_norm_embs", false);
    config.arguments_loss_coefficient = readJsonFloat(json, "arguments_loss_coefficient", 1.0f);
    config.dynamic_global_context = readJsonBool(json, "dynamic_global_context", false);
    config.global_cosine_similarity = readJsonBool(json, "global_cosine_similarity", false);
    config.sum_loss_over_tactic = readJsonBool(json, "sum_loss_over_tactic", false);
    if (findValue(json, "query_key_method"))
        config.query_key_method = parseQueryKeyMethod(readJsonString(json, "query_key_method"));

    if (config.hidden_size <= 0 || config.tactic_embedding_size <= 0)
        throw std::invalid_argument("hidden_size and tactic_embedding_size must be positive");
    return config;
}

TaskConfig loadTaskConfig(const std::string& path)
{
    TaskConfig config = TaskConfig::fromJson(readFile(path, "task config"));
    std::cout << "[TaskConfig] Loaded " << taskKindName(config.kind) << " from " << path
              << " (hidden " << config.hidden_size << ", tactic embedding " << config.tactic_embedding_size
              << ")" << std::endl;
    return config;
}

// ============================================================================
// GraphConstants
// ============================================================================

int64_t GraphConstants::maxArguments() const
{
    if (tactic_index_to_numargs.empty()) return 0;
    return *std::max_element(tactic_index_to_numargs.begin(), tactic_index_to_numargs.end());
}

void GraphConstants::validate() const
{
    if (tactic_num <= 0)
        throw std::invalid_argument("tactic_num must be positive");
    if (static_cast<int64_t>(tactic_index_to_numargs.size()) != tactic_num)
        throw std::invalid_argument("tactic_index_to_numargs has " + std::to_string(tactic_index_to_numargs.size())
                                    + " entries for " + std::to_string(tactic_num) + " tactics");
    for (int64_t n : tactic_index_to_numargs)
    {
        if (n < 0)
            throw std::invalid_argument("negative argument count in tactic_index_to_numargs");
    }
    for (int64_t label : global_context)
    {
        if (label < 0 || label >= node_label_num)
            throw std::invalid_argument("global context label " + std::to_string(label) + " outside "
                                        + std::to_string(node_label_num) + " node labels");
    }
}

GraphConstants GraphConstants::fromJson(const std::string& json)
{
    GraphConstants constants;
    constants.tactic_num = readJsonInt(json, "tactic_num");
    constants.node_label_num = readJsonInt(json, "node_label_num");
    constants.tactic_index_to_numargs = readJsonIntArray(json, "tactic_index_to_numargs");
    if (findValue(json, "global_context"))
        constants.global_context = readJsonIntArray(json, "global_context");
    constants.validate();
    return constants;
}

GraphConstants loadGraphConstants(const std::string& path)
{
    GraphConstants constants = GraphConstants::fromJson(readFile(path, "graph constants"));
    std::cout << "[GraphConstants] " << constants.tactic_num << " tactics, " << constants.node_label_num
              << " node labels, " << constants.globalContextSize() << " global definitions" << std::endl;
    return constants;
}

} // namespace tacpred
