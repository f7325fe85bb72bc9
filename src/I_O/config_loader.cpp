#include "config_loader.hpp"
#include "models/pt_array.hpp"
#include "graph_results.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <utility>

// Implementation of SimpleYamlParser methods

void SimpleYamlParser::parseFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    parseLines(lines);
}

void SimpleYamlParser::parseString(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    parseLines(lines);
}

std::string SimpleYamlParser::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

// Drop a trailing "# ..." comment, ignoring '#' inside quotes
std::string SimpleYamlParser::stripComment(const std::string& str) {
    char quote = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return str.substr(0, i);
        }
    }
    return str;
}

std::string SimpleYamlParser::removeQuotes(const std::string& str) {
    std::string trimmed = trim(str);
    if (trimmed.size() >= 2 &&
        ((trimmed.front() == '"' && trimmed.back() == '"') ||
         (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        return trimmed.substr(1, trimmed.length() - 2);
    }
    return trimmed;
}

bool SimpleYamlParser::isInlineArray(const std::string& str) {
    std::string trimmed = trim(str);
    return !trimmed.empty() && trimmed.front() == '[' && trimmed.back() == ']';
}

std::vector<std::string> SimpleYamlParser::parseInlineArray(const std::string& str) {
    std::vector<std::string> result;
    std::string trimmed = trim(str);
    std::string content = trimmed.substr(1, trimmed.length() - 2);

    // Split by commas outside quotes
    std::string item;
    char quote = 0;
    for (char c : content) {
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ',') {
            std::string cleanItem = trim(item);
            if (!cleanItem.empty()) result.push_back(removeQuotes(cleanItem));
            item.clear();
            continue;
        }
        item += c;
    }
    std::string cleanItem = trim(item);
    if (!cleanItem.empty()) result.push_back(removeQuotes(cleanItem));

    return result;
}

int SimpleYamlParser::getIndentLevel(const std::string& line) {
    int indent = 0;
    for (char c : line) {
        if (c == ' ') indent++;
        else if (c == '\t') indent += 4; // Treat tab as 4 spaces
        else break;
    }
    return indent;
}

bool SimpleYamlParser::isComment(const std::string& line) {
    std::string trimmed = trim(line);
    return trimmed.empty() || trimmed[0] == '#';
}

std::string SimpleYamlParser::joinPath(const std::vector<std::string>& path) {
    std::string result;
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) result += ".";
        result += path[i];
    }
    return result;
}

void SimpleYamlParser::parseLines(const std::vector<std::string>& lines) {
    // (indent, key) of the open sections
    std::vector<std::pair<int, std::string>> sections;
    std::string blockArrayKey;

    for (size_t i = 0; i < lines.size(); i++) {
        if (isComment(lines[i])) continue;

        int indent = getIndentLevel(lines[i]);
        std::string content = trim(stripComment(lines[i]));
        if (content.empty()) continue;

        // Block array item belonging to the last "key:" line
        if (content[0] == '-') {
            if (blockArrayKey.empty()) {
                throw std::runtime_error("Line " + std::to_string(i + 1)
                                         + ": array item without a key");
            }
            arrayMap[blockArrayKey].push_back(removeQuotes(content.substr(1)));
            continue;
        }

        while (!sections.empty() && sections.back().first >= indent) {
            sections.pop_back();
        }

        size_t colonPos = content.find(':');
        if (colonPos == std::string::npos) {
            throw std::runtime_error("Line " + std::to_string(i + 1)
                                     + ": expected 'key: value', got '" + content + "'");
        }
        std::string key = trim(content.substr(0, colonPos));
        std::string value = trim(content.substr(colonPos + 1));

        std::vector<std::string> path;
        for (const auto& s : sections) path.push_back(s.second);
        path.push_back(key);
        std::string fullKey = joinPath(path);

        if (value.empty()) {
            // Section header, or the key of a block array
            sections.emplace_back(indent, key);
            blockArrayKey = fullKey;
        } else if (isInlineArray(value)) {
            arrayMap[fullKey] = parseInlineArray(value);
            blockArrayKey.clear();
        } else {
            keyValueMap[fullKey] = removeQuotes(value);
            blockArrayKey.clear();
        }
    }
}

// Numeric conversion that must consume the whole string
bool SimpleYamlParser::parseWhole(const std::string& str, double& value) {
    size_t pos = 0;
    try {
        value = std::stod(str, &pos);
    } catch (const std::logic_error&) {
        return false;
    }
    return pos == str.size();
}

bool SimpleYamlParser::parseWhole(const std::string& str, int& value) {
    size_t pos = 0;
    try {
        value = std::stoi(str, &pos);
    } catch (const std::logic_error&) {
        return false;
    }
    return pos == str.size();
}

bool SimpleYamlParser::hasKey(const std::string& key) const {
    return keyValueMap.find(key) != keyValueMap.end();
}

bool SimpleYamlParser::hasArray(const std::string& key) const {
    auto it = arrayMap.find(key);
    return it != arrayMap.end() && !it->second.empty();
}

std::string SimpleYamlParser::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = keyValueMap.find(key);
    return (it != keyValueMap.end()) ? it->second : defaultValue;
}

int SimpleYamlParser::getInt(const std::string& key, int defaultValue) const {
    auto it = keyValueMap.find(key);
    if (it == keyValueMap.end()) {
        return defaultValue;
    }
    int value = 0;
    if (!parseWhole(it->second, value)) {
        throw std::invalid_argument("Value '" + it->second + "' of '" + key + "' is not an integer");
    }
    return value;
}

double SimpleYamlParser::getDouble(const std::string& key, double defaultValue) const {
    auto it = keyValueMap.find(key);
    if (it == keyValueMap.end()) {
        return defaultValue;
    }
    double value = 0.0;
    if (!parseWhole(it->second, value)) {
        throw std::invalid_argument("Value '" + it->second + "' of '" + key + "' is not a number");
    }
    return value;
}

bool SimpleYamlParser::getBool(const std::string& key, bool defaultValue) const {
    auto it = keyValueMap.find(key);
    if (it != keyValueMap.end()) {
        std::string value = it->second;
        std::transform(value.begin(), value.end(), value.begin(), ::tolower);
        return value == "true" || value == "yes" || value == "1";
    }
    return defaultValue;
}

std::vector<double> SimpleYamlParser::getDoubleArray(const std::string& key) const {
    std::vector<double> result;
    auto it = arrayMap.find(key);
    if (it != arrayMap.end()) {
        for (const std::string& str : it->second) {
            double value = 0.0;
            if (!parseWhole(str, value)) {
                throw std::invalid_argument("Item '" + str + "' of '" + key + "' is not a number");
            }
            result.push_back(value);
        }
    }
    return result;
}

std::vector<std::string> SimpleYamlParser::getStringArray(const std::string& key) const {
    auto it = arrayMap.find(key);
    return (it != arrayMap.end()) ? it->second : std::vector<std::string>();
}

// Implementation of ConfigLoader methods

namespace {

std::vector<double> requireArray(const SimpleYamlParser& parser, const std::string& key) {
    if (!parser.hasArray(key)) {
        throw std::runtime_error("Missing required array '" + key + "'");
    }
    return parser.getDoubleArray(key);
}

} // namespace

RunConfig ConfigLoader::loadConfig(const std::string& filename) {
    SimpleYamlParser parser;
    parser.parseFile(filename);
    return fromParser(parser);
}

RunConfig ConfigLoader::fromParser(const SimpleYamlParser& parser) {
    RunConfig config;

    // Load run section
    config.run_name = parser.getString("run.name", "ptet");
    config.device = parser.getString("run.device", "host");
    std::transform(config.device.begin(), config.device.end(), config.device.begin(), ::tolower);
    if (config.device != "host" && config.device != "gpu") {
        throw std::invalid_argument("run.device must be 'host' or 'gpu', got '" + config.device + "'");
    }
    config.verbose = parser.getBool("run.verbose", false);

    // Load site section
    if (!parser.hasKey("site.albedo")) {
        throw std::runtime_error("Missing required entry 'site.albedo'");
    }
    config.albedo = parser.getDouble("site.albedo");
    config.site_elevation = parser.getDouble("site.elevation", 0.0);

    // Load radiation coefficients
    config.ac = parser.getDouble("radiation.ac", PTMethods::DEFAULT_AC);
    config.bc = parser.getDouble("radiation.bc", PTMethods::DEFAULT_BC);

    // Load forcings
    config.forcing.air_T      = requireArray(parser, "forcings.air_temperature");
    config.forcing.fuel_T     = requireArray(parser, "forcings.fuel_temperature");
    config.forcing.RH         = requireArray(parser, "forcings.relative_humidity");
    config.forcing.fuel_moist = requireArray(parser, "forcings.fuel_moisture");
    config.forcing.Rs         = requireArray(parser, "forcings.solar_radiation");
    config.forcing.Ra         = requireArray(parser, "forcings.extraterrestrial_radiation");
    if (parser.hasArray("forcings.elevation")) {
        config.forcing.elevation = parser.getDoubleArray("forcings.elevation");
    } else if (parser.hasKey("site.elevation")) {
        config.forcing.elevation = {config.site_elevation};
    } else {
        throw std::runtime_error("Missing 'forcings.elevation' or 'site.elevation'");
    }
    config.timestamps = parser.getStringArray("forcings.timestamps");

    // Fail fast on inconsistent lengths
    size_t n = PTMethods::sampleCount(config.forcing);
    if (!config.timestamps.empty() && config.timestamps.size() != n) {
        throw std::runtime_error("forcings.timestamps has " + std::to_string(config.timestamps.size())
                                 + " entries for " + std::to_string(n) + " samples");
    }
    for (const auto& ts : config.timestamps) {
        parseTimestamp(ts);
    }

    // Load output
    config.output_path = parser.getString("output.output_path", ".");
    config.output_file = parser.getString("output.output_file", "pet.nc");
    config.compression_level = parser.getInt("output.compression_level", 0);
    if (config.compression_level < 0 || config.compression_level > 9) {
        throw std::invalid_argument("output.compression_level must be within 0-9");
    }
    config.title = parser.getString("output.title", "Evapotranspiration");
    config.ylabel = parser.getString("output.ylabel", "mm");
    config.xlabel = parser.getString("output.xlabel", "Date");

    return config;
}
