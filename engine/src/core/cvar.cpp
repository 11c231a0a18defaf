#include "kine/core/cvar.hpp"
#include "kine/core/logger.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace kine::core {

static std::unordered_map<std::string, ICVar*>& getCVarMap() {
    static std::unordered_map<std::string, ICVar*> map;
    return map;
}

static std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

ICVar::~ICVar() {
    CVarSystem::unregisterCVar(this);
}

void CVarSystem::registerCVar(ICVar* cvar) {
  if (cvar == nullptr) {
    return;
  }
    auto& map = getCVarMap();
    if (map.contains(cvar->name)) {
      return;
    }
    map[cvar->name] = cvar;
}

void CVarSystem::unregisterCVar(ICVar* cvar) {
    if (cvar == nullptr) {
        return;
    }
    auto& map = getCVarMap();
    auto it = map.find(cvar->name);
    // Only the instance that owns the registration may remove it
    if (it != map.end() && it->second == cvar) {
        map.erase(it);
    }
}

ICVar* CVarSystem::find(const std::string& name) {
    auto& map = getCVarMap();
    auto it = map.find(name);
    if (it != map.end()) {
        return it->second;
    }
    return nullptr;
}

Result<void> CVarSystem::set(const std::string& name, const std::string& value) {
    ICVar* cvar = find(name);
    if (cvar == nullptr) {
        return Unexpected<std::string>("Unknown CVar: " + name);
    }
    if (cvar->flags & CVarFlags::read_only) {
        return Unexpected<std::string>("CVar is read-only: " + name);
    }

    try {
        cvar->setFromString(value);
    } catch (const std::invalid_argument&) {
        return Unexpected<std::string>("Invalid value '" + value + "' for CVar " + name);
    } catch (const std::out_of_range&) {
        return Unexpected<std::string>("Value '" + value + "' out of range for CVar " + name);
    }
    return {};
}

Result<size_t> CVarSystem::saveToIni(const std::filesystem::path& path) {
    auto& map = getCVarMap();

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Unexpected<std::string>("Failed to create directory " +
                                           path.parent_path().string() + ": " + ec.message());
        }
    }

    core::Logger::info("Saving CVars to: {}", std::filesystem::absolute(path).string());
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        return Unexpected<std::string>("Failed to open CVar file for writing: " + path.string());
    }

    size_t savedCount = 0;
    for (auto const& [name, cvar] : map) {
        if (cvar->flags & CVarFlags::save) {
            f << name << "=" << cvar->toString() << "\n";
            savedCount++;
        }
    }
    core::Logger::info("Successfully saved {} CVars", savedCount);
    return savedCount;
}

Result<size_t> CVarSystem::loadFromIni(const std::filesystem::path& path) {
    core::Logger::info("Loading CVars from: {}", std::filesystem::absolute(path).string());
    std::ifstream f(path);
    if (!f) {
        return Unexpected<std::string>("CVar file not found: " + path.string());
    }

    size_t loadedCount = 0;
    std::string line;
    while (std::getline(f, line)) {
      line = trim(line);
      if (line.empty() || line[0] == ';') {
        continue;
      }
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
          continue;
        }

        std::string name = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (auto res = set(name, val); res) {
            loadedCount++;
        } else {
            core::Logger::warn("Skipping CVar line '{}': {}", line, res.error());
        }
    }
    core::Logger::info("Successfully loaded {} CVars", loadedCount);
    return loadedCount;
}

}
