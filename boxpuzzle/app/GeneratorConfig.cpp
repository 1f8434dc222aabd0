#include "boxpuzzle/app/GeneratorConfig.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <system_error>
#include <utility>

#include <glm/common.hpp>
#include <nlohmann/json.hpp>

#include "boxpuzzle/level/LevelGenerator.hpp"

namespace boxpuzzle::app
{
namespace
{
using json = nlohmann::json;

constexpr float kMinContainerExtent = 1.0F;
constexpr float kMaxContainerExtent = 64.0F;
constexpr int kMaxFigureBoxes = 256;

// Integer that fits in int. Larger JSON integers would wrap on get<int>().
bool ReadIntValue(const json& value, int* outValue)
{
    if (value.is_number_unsigned())
    {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        *outValue = static_cast<int>(raw);
        return true;
    }
    if (value.is_number_integer())
    {
        const auto raw = value.get<std::int64_t>();
        if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max())
        {
            return false;
        }
        *outValue = static_cast<int>(raw);
        return true;
    }
    return false;
}

bool ReadSeedValue(const json& value, std::uint32_t* outSeed)
{
    if (!value.is_number_unsigned())
    {
        return false;
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw > std::numeric_limits<std::uint32_t>::max())
    {
        return false;
    }
    *outSeed = static_cast<std::uint32_t>(raw);
    return true;
}
} // namespace

generation::DebuffDistribution GeneratorSettings::BuildDebuffDistribution() const
{
    return {
        {geometry::Debuff::Fragile, fragileCount},
        {geometry::Debuff::Heavy, heavyCount},
        {geometry::Debuff::NonTiltable, nonTiltableCount},
    };
}

GeneratorConfig::GeneratorConfig()
    : GeneratorConfig(std::filesystem::path("config") / "generator.json")
{
}

GeneratorConfig::GeneratorConfig(std::filesystem::path path)
    : m_path(std::move(path))
{
}

bool GeneratorConfig::Load()
{
    m_settings = GeneratorSettings{};
    m_status.clear();

    if (!std::filesystem::exists(m_path))
    {
        return Save();
    }

    std::ifstream stream(m_path);
    if (!stream.is_open())
    {
        m_status = "Failed to open generator config.";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception&)
    {
        m_status = "Invalid generator JSON. Using defaults.";
        std::cout << "[Config] " << m_status << "\n";
        return Save();
    }

    if (!root.is_object())
    {
        m_status = "Generator config root is not an object. Using defaults.";
        std::cout << "[Config] " << m_status << "\n";
        return Save();
    }

    auto readInt = [](const json& node, const char* key, int& target) {
        if (node.contains(key))
        {
            (void)ReadIntValue(node[key], &target);
        }
    };
    auto readFloat = [](const json& node, const char* key, float& target) {
        if (node.contains(key) && node[key].is_number())
        {
            target = node[key].get<float>();
        }
    };

    if (root.contains("seed"))
    {
        (void)ReadSeedValue(root["seed"], &m_settings.seed);
    }
    if (root.contains("container") && root["container"].is_object())
    {
        const json& container = root["container"];
        readFloat(container, "width", m_settings.container.width);
        readFloat(container, "height", m_settings.container.height);
        readFloat(container, "depth", m_settings.container.depth);
    }
    readInt(root, "cuts", m_settings.cuts);
    if (root.contains("debuffs") && root["debuffs"].is_object())
    {
        const json& debuffs = root["debuffs"];
        readInt(debuffs, "FRAGILE", m_settings.fragileCount);
        readInt(debuffs, "HEAVY", m_settings.heavyCount);
        readInt(debuffs, "NON_TILTABLE", m_settings.nonTiltableCount);
    }
    readInt(root, "figure_box_count", m_settings.figureBoxCount);
    readFloat(root, "glass_chance", m_settings.glassChance);
    if (root.contains("difficulty") && root["difficulty"].is_string())
    {
        m_settings.difficulty = root["difficulty"].get<std::string>();
    }

    Clamp();
    return true;
}

bool GeneratorConfig::Save() const
{
    if (m_path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
    }

    json root;
    root["asset_version"] = m_settings.assetVersion;
    root["seed"] = m_settings.seed;
    root["container"] = {
        {"width", m_settings.container.width},
        {"height", m_settings.container.height},
        {"depth", m_settings.container.depth},
    };
    root["cuts"] = m_settings.cuts;
    root["debuffs"] = {
        {"FRAGILE", m_settings.fragileCount},
        {"HEAVY", m_settings.heavyCount},
        {"NON_TILTABLE", m_settings.nonTiltableCount},
    };
    root["figure_box_count"] = m_settings.figureBoxCount;
    root["glass_chance"] = m_settings.glassChance;
    root["difficulty"] = m_settings.difficulty;

    std::ofstream stream(m_path);
    if (!stream.is_open())
    {
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}

void GeneratorConfig::Clamp()
{
    m_settings.container.width = glm::clamp(m_settings.container.width, kMinContainerExtent, kMaxContainerExtent);
    m_settings.container.height = glm::clamp(m_settings.container.height, kMinContainerExtent, kMaxContainerExtent);
    m_settings.container.depth = glm::clamp(m_settings.container.depth, kMinContainerExtent, kMaxContainerExtent);

    const auto maxCuts = static_cast<int>(generation::ContainerSplitter::MaxCuts(m_settings.container));
    m_settings.cuts = std::clamp(m_settings.cuts, 0, maxCuts);

    m_settings.fragileCount = std::max(0, m_settings.fragileCount);
    m_settings.heavyCount = std::max(0, m_settings.heavyCount);
    m_settings.nonTiltableCount = std::max(0, m_settings.nonTiltableCount);
    m_settings.figureBoxCount = std::clamp(m_settings.figureBoxCount, 1, kMaxFigureBoxes);
    m_settings.glassChance = glm::clamp(m_settings.glassChance, 0.0F, 1.0F);

    if (!level::FindDifficulty(m_settings.difficulty).has_value())
    {
        m_status = "Unknown difficulty '" + m_settings.difficulty + "', using medium.";
        std::cout << "[Config] " << m_status << "\n";
        m_settings.difficulty = "medium";
    }
}
} // namespace boxpuzzle::app
