#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "boxpuzzle/generation/ContainerSplitter.hpp"
#include "boxpuzzle/generation/TagDistribution.hpp"

namespace boxpuzzle::app
{
struct GeneratorSettings
{
    int assetVersion = 1;
    std::uint32_t seed = 123;
    generation::ContainerDimensions container{3.0F, 3.0F, 3.0F};
    int cuts = 2;
    int fragileCount = 1;
    int heavyCount = 2;
    int nonTiltableCount = 1;
    int figureBoxCount = 5;
    float glassChance = 0.5F;
    std::string difficulty = "medium";

    // FRAGILE, HEAVY, NON_TILTABLE in that order.
    [[nodiscard]] generation::DebuffDistribution BuildDebuffDistribution() const;
};

// config/generator.json. A missing file is created with defaults; an unreadable one is
// replaced by defaults and the reason is kept in the status string.
class GeneratorConfig
{
public:
    GeneratorConfig();
    explicit GeneratorConfig(std::filesystem::path path);

    bool Load();
    [[nodiscard]] bool Save() const;

    [[nodiscard]] const GeneratorSettings& GetSettings() const { return m_settings; }
    GeneratorSettings& GetSettings() { return m_settings; }
    [[nodiscard]] const std::string& GetStatus() const { return m_status; }
    [[nodiscard]] const std::filesystem::path& GetPath() const { return m_path; }

private:
    void Clamp();

    std::filesystem::path m_path;
    GeneratorSettings m_settings;
    std::string m_status;
};
} // namespace boxpuzzle::app
