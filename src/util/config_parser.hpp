#ifndef TOKENVAULT_UTIL_CONFIG_PARSER_HPP
#define TOKENVAULT_UTIL_CONFIG_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include "config/engine_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" file into tokenvault::config::EngineConfig.
 *
 * FORMAT:
 *   # comment
 *   registryPath = /var/lib/tokenvault/registry.sqlite
 *   defaultPolicy = gdpr_eu
 *   workerThreads = 4
 *
 * RULES:
 *   - Blank lines and lines starting with '#' are skipped.
 *   - A missing file is not an error: defaults stay in place and a warning is logged.
 *   - A line without '=' or a value that does not parse throws std::runtime_error.
 *   - Unknown keys are logged and ignored.
 *
 * USAGE:
 *   @code
 *   tokenvault::config::EngineConfig cfg;
 *   tokenvault::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("tokenvault.conf");
 *   @endcode
 */

namespace tokenvault {
namespace util {

/**
 * @class ConfigParser
 * @brief Populates an EngineConfig from key=value text.
 */
class ConfigParser
{
public:
    explicit ConfigParser(tokenvault::config::EngineConfig &engineConfig)
        : engineConfig_(engineConfig)
    {
    }

    /**
     * @brief Parse the given file line by line.
     * @return false if the file does not exist (defaults kept), true once parsed.
     * @throw std::runtime_error on malformed lines or values.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(inFile, line)) {
            ++lineNo;
            parseLine(line, lineNo);
        }
        return true;
    }

    /**
     * @brief Parse config text held in memory (same rules as a file).
     */
    inline void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t lineNo = 0;
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            ++lineNo;
            parseLine(text.substr(start, end - start), lineNo);
            start = end + 1;
        }
    }

private:
    tokenvault::config::EngineConfig &engineConfig_;
    std::mutex mutex_;

    inline void parseLine(std::string line, size_t lineNo)
    {
        trim(line);
        if (line.empty() || line[0] == '#') {
            return;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw std::runtime_error("ConfigParser: line " + std::to_string(lineNo) +
                                     " has no '=': " + line);
        }
        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        trim(key);
        trim(val);

        applyKeyValue(key, val);
    }

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "registryPath") {
            engineConfig_.registryPath = val;
        }
        else if (key == "defaultPolicy") {
            engineConfig_.defaultPolicy = val;
        }
        else if (key == "defaultRegion") {
            engineConfig_.defaultRegion = val;
        }
        else if (key == "workerThreads") {
            engineConfig_.workerThreads = parseUInt32(val);
        }
        else if (key == "logLevel") {
            // validate now so a typo fails at start-up rather than at first use
            logger::parseLogLevel(val);
            engineConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            engineConfig_.logFile = val;
        }
        else if (key == "detectorEndpoint") {
            engineConfig_.detectorEndpoint = val;
        }
        else if (key == "detectorTimeoutSeconds") {
            engineConfig_.detectorTimeoutSeconds = parseUInt32(val);
        }
        else if (key == "detectorOffsetUnit") {
            if (val != "codepoint" && val != "byte") {
                throw std::runtime_error("ConfigParser: detectorOffsetUnit must be 'codepoint' or 'byte', got '" +
                                         val + "'");
            }
            engineConfig_.detectorOffsetUnit = val;
        }
        else if (key == "valueSearchWordBoundary") {
            engineConfig_.valueSearchWordBoundary = parseBool(val);
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("ConfigParser: " + key + " set to " + val);
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        s.erase(s.find_last_not_of(whitespace) + 1);
    }

    inline uint32_t parseUInt32(const std::string &val) const
    {
        uint64_t n = 0;
        try {
            size_t idx = 0;
            if (val.empty() || val[0] == '-') {
                throw std::runtime_error("not an unsigned number");
            }
            n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
        if (n > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("ConfigParser: value out of range: " + val);
        }
        return static_cast<uint32_t>(n);
    }

    inline bool parseBool(const std::string &val) const
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
        if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
        throw std::runtime_error("ConfigParser: expected a boolean, got '" + val + "'");
    }
};

} // namespace util
} // namespace tokenvault

#endif // TOKENVAULT_UTIL_CONFIG_PARSER_HPP
