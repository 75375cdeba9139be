/// @file definition_loader.cpp
/// @brief yaml-cpp based quest catalog parser.

#include "qe/quest/definition_loader.hpp"

#include <optional>
#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

#include "qe/foundation/game_logger.hpp"

namespace qe::quest {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

using Definitions = std::vector<QuestDefinition>;

std::optional<ObjectiveKind> parseObjectiveKind(const std::string& name) {
    if (name == "talk_to_npc") { return ObjectiveKind::TalkToNpc; }
    if (name == "collect_item") { return ObjectiveKind::CollectItem; }
    if (name == "return_to_npc") { return ObjectiveKind::ReturnToNpc; }
    if (name == "make_choice") { return ObjectiveKind::MakeChoice; }
    return std::nullopt;
}

/// Thrown inside the parser only; converted to GameError at the boundary.
class CatalogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Condition parseCondition(const YAML::Node& node, const std::string& questId) {
    auto type = node["type"].as<std::string>("");
    if (type == "player_level") {
        return PlayerLevelCondition{node["min"].as<uint32_t>()};
    }
    if (type == "quest_completed") {
        return QuestCompletedCondition{node["quest"].as<std::string>()};
    }
    if (type == "quest_choice") {
        return QuestChoiceCondition{node["quest"].as<std::string>(),
                                    node["option"].as<std::string>()};
    }
    if (type == "custom") {
        CustomCondition custom;
        custom.kind = node["kind"].as<std::string>("");
        if (const auto params = node["params"]; params && params.IsMap()) {
            for (auto it = params.begin(); it != params.end(); ++it) {
                custom.parameters.emplace(it->first.as<std::string>(),
                                          it->second.as<std::string>());
            }
        }
        return custom;
    }
    throw CatalogError("quest '" + questId + "': unknown condition type '" + type + "'");
}

QuestDefinition parseQuest(const YAML::Node& node) {
    QuestDefinition def;
    def.id = node["id"].as<std::string>("");
    def.name = node["name"].as<std::string>(def.id);
    def.description = node["description"].as<std::string>("");
    if (const auto giver = node["giver"]; giver && !giver.IsNull()) {
        def.giver = giver.as<std::string>();
    }

    for (const auto& obj : node["objectives"]) {
        auto kindName = obj["kind"].as<std::string>("");
        auto kind = parseObjectiveKind(kindName);
        if (!kind) {
            throw CatalogError("quest '" + def.id + "': unknown objective kind '" + kindName + "'");
        }
        ObjectiveTemplate tmpl;
        tmpl.kind = *kind;
        tmpl.target = obj["target"].as<std::string>("");
        tmpl.required = obj["count"].as<int32_t>(1);
        def.objectives.push_back(std::move(tmpl));
    }

    for (const auto& cond : node["prerequisites"]) {
        def.prerequisites.push_back(parseCondition(cond, def.id));
    }

    if (const auto rewards = node["rewards"]; rewards && rewards.IsMap()) {
        for (auto it = rewards.begin(); it != rewards.end(); ++it) {
            def.rewards.emplace(it->first.as<std::string>(), it->second.as<int64_t>());
        }
    }

    if (const auto branches = node["branches"]; branches && branches.IsMap()) {
        for (auto it = branches.begin(); it != branches.end(); ++it) {
            def.branches.emplace(it->first.as<std::string>(), it->second.as<std::string>());
        }
    }

    def.timeLimit = std::chrono::seconds(node["time_limit_seconds"].as<int64_t>(0));
    return def;
}

GameResult<Definitions> parseRoot(const YAML::Node& root) {
    try {
        const auto quests = root["quests"];
        if (!quests || !quests.IsSequence()) {
            return GameResult<Definitions>::err(
                GameError(ErrorCode::InvalidDefinition, "catalog has no 'quests' sequence"));
        }
        Definitions definitions;
        definitions.reserve(quests.size());
        for (const auto& node : quests) {
            definitions.push_back(parseQuest(node));
        }
        return GameResult<Definitions>::ok(std::move(definitions));
    } catch (const CatalogError& e) {
        return GameResult<Definitions>::err(GameError(ErrorCode::InvalidDefinition, e.what()));
    } catch (const YAML::Exception& e) {
        return GameResult<Definitions>::err(
            GameError(ErrorCode::InvalidDefinition, std::string("malformed quest entry: ") + e.what()));
    }
}

}  // namespace

GameResult<Definitions> parseQuestDefinitions(std::string_view yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yamlText));
    } catch (const YAML::ParserException& e) {
        return GameResult<Definitions>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return parseRoot(root);
}

GameResult<Definitions> loadQuestDefinitions(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<Definitions>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open quest catalog: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<Definitions>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }

    auto result = parseRoot(root);
    if (result.hasValue()) {
        QE_LOG_INFO(LogCategory::Config, "loaded " + std::to_string(result.value().size())
                                             + " quest definitions from " + path.string());
    } else {
        QE_LOG_ERROR(LogCategory::Config, std::string(result.error().message()));
    }
    return result;
}

}  // namespace qe::quest
