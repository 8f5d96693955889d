/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

namespace audioscribe::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string StripQuotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Returns false on the first line that is neither blank, a comment, nor KEY=value.
bool ParseLines(std::istream& in, std::map<std::string, std::string>& values, std::string& badLine) {
    std::string line;
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            badLine = line;
            return false;
        }
        std::string key = Trim(line.substr(0, eq));
        if (key.empty()) {
            badLine = line;
            return false;
        }
        values[key] = StripQuotes(Trim(line.substr(eq + 1)));
    }
    return true;
}

domain::Configuration Defaulted(const fs::path& path, domain::ErrorKind* status) {
    if (status) *status = domain::ErrorKind::ConfigurationDefaulted;

    std::string error;
    if (ConfigLoader::WriteDefault(path, error)) {
        std::cout << "[ConfigLoader] Created configuration file: " << path.string() << std::endl;
    } else {
        std::cerr << "[ConfigLoader] " << error << std::endl;
    }
    return domain::Configuration();
}

} // namespace

domain::Configuration ConfigLoader::Load(const fs::path& path, domain::ErrorKind* status) {
    if (status) *status = domain::ErrorKind::None;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::cout << "[ConfigLoader] Configuration file not found. Creating default..." << std::endl;
        return Defaulted(path, status);
    }

    std::ifstream f(path);
    std::map<std::string, std::string> values;
    std::string badLine;
    bool readable = f.is_open() && fs::is_regular_file(path, ec);
    if (readable && ParseLines(f, values, badLine)) {
        return domain::Configuration(values);
    }
    f.close();

    if (!readable) {
        std::cerr << "[ConfigLoader] Error reading " << path.string() << ". Using defaults." << std::endl;
        if (status) *status = domain::ErrorKind::ConfigurationDefaulted;
        return domain::Configuration();
    }

    // Keep the operator's file for inspection before replacing it.
    std::cerr << "[ConfigLoader] Malformed line in " << path.string() << ": \"" << badLine << "\"" << std::endl;
    fs::path backup = path;
    backup += ".bak";
    fs::rename(path, backup, ec);
    if (ec) {
        std::cerr << "[ConfigLoader] Could not back up malformed configuration: " << ec.message() << std::endl;
        if (status) *status = domain::ErrorKind::ConfigurationDefaulted;
        return domain::Configuration();
    }
    std::cerr << "[ConfigLoader] Previous file kept as " << backup.string() << std::endl;
    return Defaulted(path, status);
}

bool ConfigLoader::WriteDefault(const fs::path& path, std::string& error) {
    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream f(path);
        if (!f.is_open()) {
            error = "Cannot write configuration file: " + path.string();
            return false;
        }
        f << DefaultFileContent();
        if (f.fail()) {
            error = "Write failed for configuration file: " + path.string();
            return false;
        }
    } catch (const std::exception& e) {
        error = "Error writing " + path.string() + ": " + e.what();
        return false;
    }
    return true;
}

std::string ConfigLoader::DefaultFileContent() {
    std::ostringstream out;
    out << "# AudioScribe configuration\n";
    out << "# KEY=value lines; lines starting with # are ignored.\n";
    for (const auto& key : domain::RecognizedKeys()) {
        out << "\n";
        std::istringstream comment(key.comment);
        std::string line;
        while (std::getline(comment, line)) {
            out << "# " << line << "\n";
        }
        out << key.name << "=" << key.defaultValue << "\n";
    }
    return out.str();
}

} // namespace audioscribe::infrastructure
