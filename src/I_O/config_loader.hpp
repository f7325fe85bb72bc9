#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include <vector>
#include <map>

#include "forcing.hpp"

// Main configuration structure for one PET run
struct RunConfig {
    // Run section
    std::string run_name;
    std::string device;          // "host" or "gpu"
    bool verbose;

    // Site section
    double albedo;
    double site_elevation;

    // Radiation section (cloudiness coefficients)
    double ac;
    double bc;

    // Forcings
    std::vector<std::string> timestamps;   // "YYYY-MM-DD HH:MM", optional
    PETForcing forcing;

    // Output
    std::string output_path;
    std::string output_file;
    int compression_level;
    std::string title;
    std::string ylabel;
    std::string xlabel;
};

// Simple YAML parser class
//
// Understands nested sections (two-space indentation), "key: value" pairs,
// inline arrays "[a, b, c]" and block arrays of "- value" items. Keys are
// stored with their section path joined by dots, e.g. "forcings.air_temperature".
class SimpleYamlParser {
public:
    void parseFile(const std::string& filename);
    void parseString(const std::string& text);

    bool hasKey(const std::string& key) const;
    bool hasArray(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;
    std::vector<double> getDoubleArray(const std::string& key) const;
    std::vector<std::string> getStringArray(const std::string& key) const;

private:
    std::map<std::string, std::string> keyValueMap;
    std::map<std::string, std::vector<std::string>> arrayMap;

    void parseLines(const std::vector<std::string>& lines);

    static std::string joinPath(const std::vector<std::string>& path);
    static std::string trim(const std::string& str);
    static std::string stripComment(const std::string& str);
    static std::string removeQuotes(const std::string& str);
    static bool isInlineArray(const std::string& str);
    static std::vector<std::string> parseInlineArray(const std::string& str);
    static int getIndentLevel(const std::string& line);
    static bool isComment(const std::string& line);
    static bool parseWhole(const std::string& str, double& value);
    static bool parseWhole(const std::string& str, int& value);
};

// Configuration loader class
class ConfigLoader {
public:
    // Throws std::runtime_error on I/O errors or missing required entries,
    // std::invalid_argument on malformed values (numbers with trailing text,
    // timestamps that are not valid "YYYY-MM-DD HH:MM" dates).
    static RunConfig loadConfig(const std::string& filename);
    static RunConfig fromParser(const SimpleYamlParser& parser);
};

#endif // CONFIG_LOADER_HPP
