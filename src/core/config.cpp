/**
 * @file   config.cpp
 * @brief  Implements loadString(), loadFile() and the built-in defaults.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

#include "config.hpp"
#include <fstream>
#include <set>
#include <sstream>

namespace muxbridge::config {

BridgeConfig defaults() {
    BridgeConfig c;
    c.superuserBridges.push_back({ "sudo",
                                   { "sudo", "-n", "muxbridge", "--privileged" },
                                   {}, true });
    c.superuserBridges.push_back({ "pkexec",
                                   { "pkexec", "--disable-internal-agent", "muxbridge", "--privileged" },
                                   {}, true });
    return c;
}

/**
 * Parse, convert through the ADL serializers, then fill in labels and
 * drop duplicates.
 */
bool loadString(const std::string& text, BridgeConfig& out, std::string* err)
{
    // 1) Parse
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("JSON parse error: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "configuration must be a JSON object";
        return false;
    }

    // 2) Convert JSON -> BridgeConfig (throws on schema errors)
    BridgeConfig parsed;
    try {
        parsed = j.get<BridgeConfig>();
    }
    catch (const std::exception& e) {
        if (err) *err = std::string("configuration schema error: ") + e.what();
        return false;
    }

    // 3) Semantic checks
    std::string warning;
    std::set<std::string> seen;
    BridgeConfig result;
    for (auto& b : parsed.superuserBridges) {
        if (b.spawn.empty() || b.spawn.front().empty()) {
            if (err) *err = "superuser bridge has an empty \"spawn\" command";
            return false;
        }
        if (b.label.empty()) {
            const auto& prog = b.spawn.front();
            auto slash = prog.rfind('/');
            b.label = (slash == std::string::npos) ? prog : prog.substr(slash + 1);
        }
        if (!seen.insert(b.label).second) {
            if (warning.empty())
                warning = "duplicate superuser bridge label `" + b.label + "` ignored";
            continue;
        }
        result.superuserBridges.push_back(std::move(b));
    }

    out = std::move(result);
    if (!warning.empty() && err)
        *err = std::move(warning);
    return true;
}

bool loadFile(const std::string& path, BridgeConfig& out, std::string* err)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        if (err) *err = "Failed to open file: " + path;
        return false;
    }
    std::ostringstream text;
    text << in.rdbuf();
    return loadString(text.str(), out, err);
}

} // namespace muxbridge::config
