#include "boxpuzzle/io/BoxSerialization.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace boxpuzzle::io
{
namespace
{
using json = nlohmann::json;
using geometry::Box;

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}

json Vec3ToJson(const glm::vec3& value)
{
    return json::array({value.x, value.y, value.z});
}

bool Vec3FromJson(const json& value, glm::vec3* outValue)
{
    if (!value.is_array() || value.size() != 3)
    {
        return false;
    }
    for (const json& component : value)
    {
        if (!component.is_number())
        {
            return false;
        }
    }
    *outValue = glm::vec3{
        value.at(0).get<float>(),
        value.at(1).get<float>(),
        value.at(2).get<float>(),
    };
    return true;
}

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

json BoxToJson(const Box& box)
{
    json node;
    if (box.id.has_value())
    {
        node["id"] = *box.id;
    }
    node["center"] = Vec3ToJson(box.center);
    node["size"] = Vec3ToJson(box.size);
    node["material"] = MaterialToString(box.material);

    node["debuffs"] = json::array();
    for (const geometry::Debuff debuff : geometry::kAllDebuffs)
    {
        if (box.HasDebuff(debuff))
        {
            node["debuffs"].push_back(DebuffToString(debuff));
        }
    }

    if (box.location.has_value())
    {
        node["location"] = LocationToString(*box.location);
    }
    return node;
}

bool BoxFromJson(const json& node, std::size_t index, Box* outBox, std::string* outError)
{
    const std::string where = "boxes[" + std::to_string(index) + "]";
    if (!node.is_object())
    {
        SetError(outError, where + " is not an object");
        return false;
    }

    Box box;
    if (!node.contains("center") || !Vec3FromJson(node["center"], &box.center))
    {
        SetError(outError, where + ".center must be an array of 3 numbers");
        return false;
    }
    if (!node.contains("size") || !Vec3FromJson(node["size"], &box.size))
    {
        SetError(outError, where + ".size must be an array of 3 numbers");
        return false;
    }
    if (!(box.size.x > 0.0F) || !(box.size.y > 0.0F) || !(box.size.z > 0.0F))
    {
        SetError(outError, where + ".size must be positive");
        return false;
    }

    if (node.contains("id") && node["id"].is_number_integer())
    {
        int id = 0;
        if (!ReadIntValue(node["id"], &id))
        {
            SetError(outError, where + ".id is out of range");
            return false;
        }
        box.id = id;
    }
    if (node.contains("material") && node["material"].is_string())
    {
        box.material = MaterialFromString(node["material"].get<std::string>());
    }
    if (node.contains("debuffs") && node["debuffs"].is_array())
    {
        for (const json& entry : node["debuffs"])
        {
            if (!entry.is_string())
            {
                continue;
            }
            if (const auto debuff = DebuffFromString(entry.get<std::string>()))
            {
                box.AddDebuff(*debuff);
            }
        }
    }
    if (node.contains("location") && node["location"].is_string())
    {
        box.location = LocationFromString(node["location"].get<std::string>());
    }

    *outBox = box;
    return true;
}

json BoxesToJson(const std::vector<Box>& boxes)
{
    json array = json::array();
    for (const Box& box : boxes)
    {
        array.push_back(BoxToJson(box));
    }
    return array;
}

bool BoxesFromJson(const json& array, std::vector<Box>* outBoxes, std::string* outError)
{
    if (!array.is_array())
    {
        SetError(outError, "\"boxes\" must be an array");
        return false;
    }

    std::vector<Box> boxes;
    boxes.reserve(array.size());
    for (std::size_t i = 0; i < array.size(); ++i)
    {
        Box box;
        if (!BoxFromJson(array[i], i, &box, outError))
        {
            return false;
        }
        boxes.push_back(box);
    }
    *outBoxes = std::move(boxes);
    return true;
}

json FigureToJson(const generation::Figure& figure)
{
    json root;
    root["version"] = kBoxFileVersion;
    root["seed"] = figure.seed;
    root["boxes"] = BoxesToJson(figure.boxes);
    return root;
}

bool ParseRoot(const std::string& jsonContent, json* outRoot, std::string* outError)
{
    try
    {
        *outRoot = json::parse(jsonContent);
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string("Invalid JSON: ") + ex.what());
        return false;
    }
    if (!outRoot->is_object())
    {
        SetError(outError, "Root must be an object");
        return false;
    }
    return true;
}

bool ReadSeed(const json& root, std::uint32_t* outSeed, std::string* outError)
{
    if (!root.contains("seed") || !ReadSeedValue(root["seed"], outSeed))
    {
        SetError(outError, "\"seed\" must be an integer in [0, 4294967295]");
        return false;
    }
    return true;
}

bool FigureFromJson(const json& root, generation::Figure* outFigure, std::string* outError)
{
    generation::Figure figure;
    if (!ReadSeed(root, &figure.seed, outError))
    {
        return false;
    }
    if (!root.contains("boxes"))
    {
        SetError(outError, "Missing \"boxes\"");
        return false;
    }
    if (!BoxesFromJson(root["boxes"], &figure.boxes, outError))
    {
        return false;
    }

    *outFigure = std::move(figure);
    return true;
}

bool WriteTextFile(const std::filesystem::path& path, const std::string& content, std::string* outError)
{
    if (path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Unable to open file for writing: " + path.string());
        return false;
    }
    stream << content << "\n";
    return true;
}

bool ReadTextFile(const std::filesystem::path& path, std::string* outContent, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Unable to open file: " + path.string());
        return false;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    *outContent = buffer.str();
    return true;
}
} // namespace

std::string MaterialToString(geometry::Material material)
{
    switch (material)
    {
        case geometry::Material::Glass: return "glass";
        case geometry::Material::Standard:
        default: return "standard";
    }
}

geometry::Material MaterialFromString(const std::string& value)
{
    return value == "glass" ? geometry::Material::Glass : geometry::Material::Standard;
}

std::string DebuffToString(geometry::Debuff debuff)
{
    switch (debuff)
    {
        case geometry::Debuff::Fragile: return "FRAGILE";
        case geometry::Debuff::Heavy: return "HEAVY";
        case geometry::Debuff::NonTiltable: return "NON_TILTABLE";
        default: return "FRAGILE";
    }
}

std::optional<geometry::Debuff> DebuffFromString(const std::string& value)
{
    if (value == "FRAGILE")
    {
        return geometry::Debuff::Fragile;
    }
    if (value == "HEAVY")
    {
        return geometry::Debuff::Heavy;
    }
    if (value == "NON_TILTABLE")
    {
        return geometry::Debuff::NonTiltable;
    }
    return std::nullopt;
}

std::string LocationToString(geometry::BoxLocation location)
{
    switch (location)
    {
        case geometry::BoxLocation::Queue: return "queue";
        case geometry::BoxLocation::Buffer: return "buffer";
        case geometry::BoxLocation::Active: return "active";
        case geometry::BoxLocation::Container:
        default: return "container";
    }
}

std::optional<geometry::BoxLocation> LocationFromString(const std::string& value)
{
    if (value == "queue")
    {
        return geometry::BoxLocation::Queue;
    }
    if (value == "buffer")
    {
        return geometry::BoxLocation::Buffer;
    }
    if (value == "active")
    {
        return geometry::BoxLocation::Active;
    }
    if (value == "container")
    {
        return geometry::BoxLocation::Container;
    }
    return std::nullopt;
}

std::string SerializeBoxes(const std::vector<Box>& boxes)
{
    json root;
    root["version"] = kBoxFileVersion;
    root["boxes"] = BoxesToJson(boxes);
    return root.dump(2);
}

std::string SerializeFigure(const generation::Figure& figure)
{
    return FigureToJson(figure).dump(2);
}

std::string SerializeLevel(const level::Level& level)
{
    json root = FigureToJson(level.figure);
    root["seed"] = level.seed;
    root["difficulty"] = level.difficultyId;
    root["target_angle"] = level.targetAngle;
    if (level.ring.has_value())
    {
        root["ring"] = {
            {"inner_radius", level.ring->innerRadius},
            {"outer_radius", level.ring->outerRadius},
            {"floor_y", level.ring->floorY},
        };
    }
    return root.dump(2);
}

bool ParseBoxes(const std::string& jsonContent, std::vector<Box>* outBoxes, std::string* outError)
{
    json root;
    if (!ParseRoot(jsonContent, &root, outError))
    {
        return false;
    }
    if (!root.contains("boxes"))
    {
        SetError(outError, "Missing \"boxes\"");
        return false;
    }
    return BoxesFromJson(root["boxes"], outBoxes, outError);
}

bool ParseFigure(const std::string& jsonContent, generation::Figure* outFigure, std::string* outError)
{
    json root;
    if (!ParseRoot(jsonContent, &root, outError))
    {
        return false;
    }
    return FigureFromJson(root, outFigure, outError);
}

bool ParseLevel(const std::string& jsonContent, level::Level* outLevel, std::string* outError)
{
    json root;
    if (!ParseRoot(jsonContent, &root, outError))
    {
        return false;
    }

    level::Level level;
    if (!FigureFromJson(root, &level.figure, outError))
    {
        return false;
    }
    level.seed = level.figure.seed;

    if (!root.contains("difficulty") || !root["difficulty"].is_string())
    {
        SetError(outError, "\"difficulty\" must be a string");
        return false;
    }
    level.difficultyId = root["difficulty"].get<std::string>();

    if (!root.contains("target_angle") || !root["target_angle"].is_number())
    {
        SetError(outError, "\"target_angle\" must be a number");
        return false;
    }
    level.targetAngle = root["target_angle"].get<float>();

    if (root.contains("ring") && root["ring"].is_object())
    {
        const json& ring = root["ring"];
        level::RotationRing parsed;
        auto readFloat = [&](const char* key, float& target) {
            if (ring.contains(key) && ring[key].is_number())
            {
                target = ring[key].get<float>();
            }
        };
        readFloat("inner_radius", parsed.innerRadius);
        readFloat("outer_radius", parsed.outerRadius);
        readFloat("floor_y", parsed.floorY);
        level.ring = parsed;
    }

    *outLevel = std::move(level);
    return true;
}

bool SaveFigure(const std::filesystem::path& path, const generation::Figure& figure, std::string* outError)
{
    return WriteTextFile(path, SerializeFigure(figure), outError);
}

bool LoadFigure(const std::filesystem::path& path, generation::Figure* outFigure, std::string* outError)
{
    std::string content;
    if (!ReadTextFile(path, &content, outError))
    {
        return false;
    }
    return ParseFigure(content, outFigure, outError);
}

bool SaveLevel(const std::filesystem::path& path, const level::Level& level, std::string* outError)
{
    return WriteTextFile(path, SerializeLevel(level), outError);
}

bool LoadLevel(const std::filesystem::path& path, level::Level* outLevel, std::string* outError)
{
    std::string content;
    if (!ReadTextFile(path, &content, outError))
    {
        return false;
    }
    return ParseLevel(content, outLevel, outError);
}
} // namespace boxpuzzle::io
