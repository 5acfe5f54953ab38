#include "localization.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;

    bool load_strings(const std::filesystem::path& l10n_dir, const std::string& lang) {
        std::ifstream file(l10n_dir / (lang + ".txt"));
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                // Only fill keys the preferred language did not provide.
                translations.emplace(line.substr(0, pos), line.substr(pos + 1));
            }
        }
        return true;
    }
}

void init_localization(const std::filesystem::path& l10n_dir) {
    translations.clear();
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).find("zh") == 0) {
        lang = "zh";
    }
    if (lang != "en" && !load_strings(l10n_dir, lang)) {
        std::cerr << "Could not open localization file for " << lang << ", falling back to English." << std::endl;
    }
    if (!load_strings(l10n_dir, "en")) {
        std::cerr << "Could not open localization directory " << l10n_dir.string() << std::endl;
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
