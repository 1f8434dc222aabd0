#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "boxpuzzle/app/GeneratorConfig.hpp"
#include "boxpuzzle/geometry/Box.hpp"
#include "boxpuzzle/level/LevelGenerator.hpp"

namespace boxpuzzle::app
{
class CommandConsole
{
public:
    using CommandHandler = std::function<void(const std::vector<std::string>&)>;

    struct CommandInfo
    {
        std::string usage;
        std::string description;
        std::string category;
    };

    explicit CommandConsole(GeneratorConfig& config);

    // First token of usage is the command name. Re-registering a name replaces the handler.
    void RegisterCommand(const std::string& usage, const std::string& description, CommandHandler handler);

    // Returns false for an unknown command or when the handler reported an error.
    bool Execute(const std::string& commandLine);

    void AddLog(const std::string& text);
    void AddError(const std::string& text);
    void ClearLog() { m_items.clear(); }

    [[nodiscard]] const std::vector<std::string>& GetLog() const { return m_items; }
    [[nodiscard]] const std::vector<CommandInfo>& GetCommands() const { return m_commandInfos; }
    [[nodiscard]] bool HasCommand(const std::string& name) const { return m_commandRegistry.contains(name); }

    // Last generated or loaded box set. A level keeps its figure boxes here as well.
    [[nodiscard]] const std::vector<geometry::Box>& GetBoxes() const { return m_boxes; }
    [[nodiscard]] const std::optional<level::Level>& GetLevel() const { return m_level; }
    [[nodiscard]] std::uint32_t GetSeed() const { return m_seed; }

private:
    void RegisterBuiltins();
    void PrintHelp();
    void PrintStats();
    void SetBoxes(std::uint32_t seed, std::vector<geometry::Box> boxes);

    GeneratorConfig& m_config;

    std::vector<std::string> m_items;
    std::unordered_map<std::string, CommandHandler> m_commandRegistry;
    std::vector<CommandInfo> m_commandInfos;
    bool m_commandFailed = false;

    std::uint32_t m_seed = 0;
    std::vector<geometry::Box> m_boxes;
    std::optional<level::Level> m_level;
};

[[nodiscard]] std::vector<std::string> Tokenize(const std::string& text);
} // namespace boxpuzzle::app
