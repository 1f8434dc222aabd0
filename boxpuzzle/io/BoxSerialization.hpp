#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "boxpuzzle/generation/FigureAssembler.hpp"
#include "boxpuzzle/geometry/Box.hpp"
#include "boxpuzzle/level/LevelGenerator.hpp"

namespace boxpuzzle::io
{
constexpr int kBoxFileVersion = 1;

std::string MaterialToString(geometry::Material material);
geometry::Material MaterialFromString(const std::string& value);

// "FRAGILE", "HEAVY", "NON_TILTABLE"
std::string DebuffToString(geometry::Debuff debuff);
std::optional<geometry::Debuff> DebuffFromString(const std::string& value);

std::string LocationToString(geometry::BoxLocation location);
std::optional<geometry::BoxLocation> LocationFromString(const std::string& value);

// Figure format:
// {
//   "version": 1,
//   "seed": 7,
//   "boxes": [
//     { "id": 0, "center": [x, y, z], "size": [w, h, d],
//       "material": "standard", "debuffs": ["FRAGILE"], "location": "container" }
//   ]
// }
// Levels add "difficulty", "target_angle" and an optional "ring" object.
std::string SerializeBoxes(const std::vector<geometry::Box>& boxes);
std::string SerializeFigure(const generation::Figure& figure);
std::string SerializeLevel(const level::Level& level);

[[nodiscard]] bool ParseBoxes(const std::string& jsonContent, std::vector<geometry::Box>* outBoxes, std::string* outError = nullptr);
[[nodiscard]] bool ParseFigure(const std::string& jsonContent, generation::Figure* outFigure, std::string* outError = nullptr);
[[nodiscard]] bool ParseLevel(const std::string& jsonContent, level::Level* outLevel, std::string* outError = nullptr);

[[nodiscard]] bool SaveFigure(const std::filesystem::path& path, const generation::Figure& figure, std::string* outError = nullptr);
[[nodiscard]] bool LoadFigure(const std::filesystem::path& path, generation::Figure* outFigure, std::string* outError = nullptr);

[[nodiscard]] bool SaveLevel(const std::filesystem::path& path, const level::Level& level, std::string* outError = nullptr);
[[nodiscard]] bool LoadLevel(const std::filesystem::path& path, level::Level* outLevel, std::string* outError = nullptr);
} // namespace boxpuzzle::io
