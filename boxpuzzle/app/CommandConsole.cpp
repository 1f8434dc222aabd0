#include "boxpuzzle/app/CommandConsole.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <sstream>
#include <utility>

#include "boxpuzzle/core/SeededRandom.hpp"
#include "boxpuzzle/generation/ContainerSplitter.hpp"
#include "boxpuzzle/generation/FigureAssembler.hpp"
#include "boxpuzzle/generation/TagDistribution.hpp"
#include "boxpuzzle/io/BoxSerialization.hpp"

namespace boxpuzzle::app
{
namespace
{
bool ParseInt(const std::string& token, int& outValue)
{
    try
    {
        std::size_t consumed = 0;
        const int value = std::stoi(token, &consumed);
        if (consumed != token.size())
        {
            return false;
        }
        outValue = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool ParseFloat(const std::string& token, float& outValue)
{
    try
    {
        std::size_t consumed = 0;
        const float value = std::stof(token, &consumed);
        if (consumed != token.size())
        {
            return false;
        }
        outValue = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool ParseSeed(const std::string& token, std::uint32_t& outSeed)
{
    if (token.empty() || token.front() == '-')
    {
        return false;
    }
    try
    {
        std::size_t consumed = 0;
        const unsigned long long value = std::stoull(token, &consumed);
        if (consumed != token.size() || value > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        outSeed = static_cast<std::uint32_t>(value);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

std::string CommandCategoryForUsage(const std::string& usage)
{
    const std::vector<std::string> tokens = Tokenize(usage);
    if (tokens.empty())
    {
        return "General";
    }

    const std::string& command = tokens.front();
    if (command == "split" || command == "figure" || command == "level" || command == "generate" || command == "tag")
    {
        return "Generation";
    }
    if (command == "save" || command == "load" || command == "config_reload")
    {
        return "Files";
    }
    return "General";
}

std::string FormatFloat(float value)
{
    std::ostringstream stream;
    stream << value;
    return stream.str();
}

std::string FormatBox(const geometry::Box& box)
{
    std::ostringstream stream;
    stream << "  #" << (box.id.has_value() ? std::to_string(*box.id) : std::string("-"))
           << " center=(" << box.center.x << ", " << box.center.y << ", " << box.center.z << ")"
           << " size=(" << box.size.x << ", " << box.size.y << ", " << box.size.z << ")";
    if (box.material == geometry::Material::Glass)
    {
        stream << " glass";
    }
    for (const geometry::Debuff debuff : geometry::kAllDebuffs)
    {
        if (box.HasDebuff(debuff))
        {
            stream << " " << io::DebuffToString(debuff);
        }
    }
    return stream.str();
}
} // namespace

std::vector<std::string> Tokenize(const std::string& text)
{
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

CommandConsole::CommandConsole(GeneratorConfig& config)
    : m_config(config)
{
    RegisterBuiltins();
}

void CommandConsole::RegisterCommand(const std::string& usage, const std::string& description, CommandHandler handler)
{
    const std::vector<std::string> tokens = Tokenize(usage);
    if (tokens.empty())
    {
        return;
    }

    const std::string& name = tokens.front();
    m_commandInfos.erase(
        std::remove_if(m_commandInfos.begin(), m_commandInfos.end(), [&](const CommandInfo& info) {
            const std::vector<std::string> existing = Tokenize(info.usage);
            return !existing.empty() && existing.front() == name;
        }),
        m_commandInfos.end());
    m_commandInfos.push_back(CommandInfo{usage, description, CommandCategoryForUsage(usage)});
    m_commandRegistry[name] = std::move(handler);
}

bool CommandConsole::Execute(const std::string& commandLine)
{
    const std::vector<std::string> tokens = Tokenize(commandLine);
    if (tokens.empty())
    {
        return true;
    }

    AddLog("# " + commandLine);

    const auto it = m_commandRegistry.find(tokens.front());
    if (it == m_commandRegistry.end())
    {
        AddError("Unknown command '" + tokens.front() + "'. Type `help`.");
        return false;
    }

    m_commandFailed = false;
    it->second(tokens);
    return !m_commandFailed;
}

void CommandConsole::AddLog(const std::string& text)
{
    m_items.push_back(text);
}

void CommandConsole::AddError(const std::string& text)
{
    m_items.push_back("Error: " + text);
    m_commandFailed = true;
}

void CommandConsole::PrintHelp()
{
    AddLog("Available commands by category:");
    std::map<std::string, std::vector<CommandInfo>> grouped;
    for (const CommandInfo& info : m_commandInfos)
    {
        grouped[info.category].push_back(info);
    }

    for (auto& [category, commands] : grouped)
    {
        std::sort(commands.begin(), commands.end(), [](const CommandInfo& a, const CommandInfo& b) {
            return a.usage < b.usage;
        });
        AddLog("[" + category + "]");
        for (const CommandInfo& info : commands)
        {
            AddLog("  " + info.usage + " - " + info.description);
        }
    }
}

void CommandConsole::PrintStats()
{
    if (m_boxes.empty())
    {
        AddLog("No boxes. Run split, figure, level or load first.");
        return;
    }

    const std::optional<geometry::BoxBounds> bounds = geometry::ComputeBounds(m_boxes);
    const glm::vec3 extent = bounds.has_value() ? bounds->Extent() : glm::vec3{0.0F};
    const auto glassCount = std::count_if(m_boxes.begin(), m_boxes.end(), [](const geometry::Box& box) {
        return box.material == geometry::Material::Glass;
    });

    AddLog("Seed: " + std::to_string(m_seed));
    AddLog("Boxes: " + std::to_string(m_boxes.size()));
    AddLog("Volume: " + FormatFloat(geometry::TotalVolume(m_boxes)));
    AddLog("Bounds: " + FormatFloat(extent.x) + " x " + FormatFloat(extent.y) + " x " + FormatFloat(extent.z));
    AddLog(std::string("Connected: ") + (geometry::IsConnected(m_boxes) ? "yes" : "no"));
    AddLog("Glass: " + std::to_string(glassCount));
    for (const geometry::Debuff debuff : geometry::kAllDebuffs)
    {
        AddLog(io::DebuffToString(debuff) + ": " + std::to_string(generation::CountDebuff(m_boxes, debuff)));
    }
    if (m_level.has_value())
    {
        AddLog("Difficulty: " + m_level->difficultyId);
        AddLog("Target angle: " + FormatFloat(m_level->targetAngle));
        if (m_level->ring.has_value())
        {
            AddLog("Ring: inner=" + FormatFloat(m_level->ring->innerRadius) +
                   " outer=" + FormatFloat(m_level->ring->outerRadius) +
                   " floor=" + FormatFloat(m_level->ring->floorY));
        }
    }
}

void CommandConsole::SetBoxes(std::uint32_t seed, std::vector<geometry::Box> boxes)
{
    m_seed = seed;
    m_boxes = std::move(boxes);
    m_level.reset();
    for (const geometry::Box& box : m_boxes)
    {
        AddLog(FormatBox(box));
    }
}

void CommandConsole::RegisterBuiltins()
{
    RegisterCommand("help", "List all commands", [this](const std::vector<std::string>&) {
        PrintHelp();
    });

    RegisterCommand("split w h d cuts [seed]", "Tile a container with cuts + 1 boxes", [this](const std::vector<std::string>& tokens) {
        if (tokens.size() < 5)
        {
            AddError("Usage: split w h d cuts [seed]");
            return;
        }

        generation::ContainerDimensions container;
        int cuts = 0;
        if (!ParseFloat(tokens[1], container.width) || !ParseFloat(tokens[2], container.height) ||
            !ParseFloat(tokens[3], container.depth) || !ParseInt(tokens[4], cuts))
        {
            AddError("split expects numeric dimensions and an integer cut count");
            return;
        }

        std::uint32_t seed = core::RandomSeed();
        if (tokens.size() >= 6 && !ParseSeed(tokens[5], seed))
        {
            AddError("Invalid seed '" + tokens[5] + "'");
            return;
        }

        std::vector<geometry::Box> boxes;
        std::string error;
        if (!generation::GenerateTiledBoxes(container, cuts, seed, &boxes, &error))
        {
            AddError(error);
            return;
        }

        AddLog("Split seed " + std::to_string(seed) + " into " + std::to_string(boxes.size()) + " boxes");
        SetBoxes(seed, std::move(boxes));
    });

    RegisterCommand("figure seed count", "Assemble a connected figure", [this](const std::vector<std::string>& tokens) {
        if (tokens.size() < 3)
        {
            AddError("Usage: figure seed count");
            return;
        }

        generation::FigureOptions options;
        if (!ParseSeed(tokens[1], options.seed) || !ParseInt(tokens[2], options.boxCount))
        {
            AddError("figure expects a non-negative seed and an integer count");
            return;
        }
        options.glassChance = m_config.GetSettings().glassChance;

        generation::Figure figure = generation::GenerateFigure(options);
        AddLog("Figure seed " + std::to_string(figure.seed) + " has " + std::to_string(figure.boxes.size()) + " boxes");
        SetBoxes(figure.seed, std::move(figure.boxes));
    });

    RegisterCommand("level seed difficulty", "Generate a level (easy, medium, hard)", [this](const std::vector<std::string>& tokens) {
        if (tokens.size() < 3)
        {
            AddError("Usage: level seed difficulty");
            return;
        }

        std::uint32_t seed = 0;
        if (!ParseSeed(tokens[1], seed))
        {
            AddError("Invalid seed '" + tokens[1] + "'");
            return;
        }
        const std::optional<level::Difficulty> difficulty = level::FindDifficulty(tokens[2]);
        if (!difficulty.has_value())
        {
            AddError("Unknown difficulty '" + tokens[2] + "'");
            return;
        }

        const level::LevelGenerator generator{};
        level::Level generated = generator.Generate(seed, *difficulty);
        AddLog("Level " + difficulty->title + " seed " + std::to_string(seed) + " has " +
               std::to_string(generated.figure.boxes.size()) + " boxes, target angle " +
               FormatFloat(generated.targetAngle));
        SetBoxes(seed, generated.figure.boxes);
        m_level = std::move(generated);
    });

    RegisterCommand("generate", "Split and tag using config/generator.json", [this](const std::vector<std::string>&) {
        const GeneratorSettings& settings = m_config.GetSettings();
        std::vector<geometry::Box> boxes;
        std::string error;
        if (!generation::GenerateBoxesWithDistribution(
                settings.seed, settings.cuts, settings.container, settings.BuildDebuffDistribution(), &boxes, &error))
        {
            AddError(error);
            return;
        }

        AddLog("Generated " + std::to_string(boxes.size()) + " boxes from config seed " + std::to_string(settings.seed));
        SetBoxes(settings.seed, std::move(boxes));
    });

    RegisterCommand("tag debuff count", "Tag boxes of the last set (FRAGILE, HEAVY, NON_TILTABLE)", [this](const std::vector<std::string>& tokens) {
        if (tokens.size() < 3)
        {
            AddError("Usage: tag debuff count");
            return;
        }
        if (m_boxes.empty())
        {
            AddError("No boxes to tag");
            return;
        }

        const std::optional<geometry::Debuff> debuff = io::DebuffFromString(tokens[1]);
        if (!debuff.has_value())
        {
            AddError("Unknown debuff '" + tokens[1] + "'");
            return;
        }
        int count = 0;
        if (!ParseInt(tokens[2], count))
        {
            AddError("Invalid count '" + tokens[2] + "'");
            return;
        }

        core::SeededRandom rng(m_seed);
        generation::DistributeDebuffs(m_boxes, {{*debuff, count}}, rng);
        if (m_level.has_value())
        {
            m_level->figure.boxes = m_boxes;
        }
        AddLog(tokens[1] + " boxes: " + std::to_string(generation::CountDebuff(m_boxes, *debuff)));
    });

    RegisterCommand("save path", "Write the last figure or level as JSON", [this](const std::vector<std::string>& tokens) {
        if (tokens.size() < 2)
        {
            AddError("Usage: save path");
            return;
        }
        if (m_boxes.empty())
        {
            AddError("Nothing to save");
            return;
        }

        std::string error;
        const bool saved = m_level.has_value()
            ? io::SaveLevel(tokens[1], *m_level, &error)
            : io::SaveFigure(tokens[1], generation::Figure{m_seed, m_boxes}, &error);
        if (!saved)
        {
            AddError(error);
            return;
        }
        AddLog("Saved " + std::to_string(m_boxes.size()) + " boxes to " + tokens[1]);
    });

    RegisterCommand("load path", "Read a figure or level JSON file", [this](const std::vector<std::string>& tokens) {
        if (tokens.size() < 2)
        {
            AddError("Usage: load path");
            return;
        }

        level::Level loadedLevel;
        std::string levelError;
        if (io::LoadLevel(tokens[1], &loadedLevel, &levelError))
        {
            AddLog("Loaded level with " + std::to_string(loadedLevel.figure.boxes.size()) + " boxes");
            SetBoxes(loadedLevel.seed, loadedLevel.figure.boxes);
            m_level = std::move(loadedLevel);
            return;
        }

        generation::Figure figure;
        std::string figureError;
        if (!io::LoadFigure(tokens[1], &figure, &figureError))
        {
            AddError(figureError);
            return;
        }
        AddLog("Loaded figure with " + std::to_string(figure.boxes.size()) + " boxes");
        SetBoxes(figure.seed, std::move(figure.boxes));
    });

    RegisterCommand("stats", "Summarize the last box set", [this](const std::vector<std::string>&) {
        PrintStats();
    });

    RegisterCommand("config_reload", "Reload config/generator.json", [this](const std::vector<std::string>&) {
        const bool loaded = m_config.Load();
        const GeneratorSettings& settings = m_config.GetSettings();
        if (!m_config.GetStatus().empty())
        {
            AddLog("[Config] " + m_config.GetStatus());
        }
        if (!loaded)
        {
            AddError("Failed to load " + m_config.GetPath().string());
            return;
        }
        AddLog("Config: seed=" + std::to_string(settings.seed) + " cuts=" + std::to_string(settings.cuts) +
               " container=" + FormatFloat(settings.container.width) + "x" + FormatFloat(settings.container.height) +
               "x" + FormatFloat(settings.container.depth) + " difficulty=" + settings.difficulty);
    });
}
} // namespace boxpuzzle::app
