/**
 * immunorm - shared enums, species keys and logging
 */

#include "immunorm.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace immunorm {

// ============================================================================
// Logging
// ============================================================================

// Resolution calls may log from several threads at once
static std::atomic<LogLevel> g_log_level{LogLevel::INFO};
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level.load()) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::INFO: level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR: level_str = "ERROR"; break;
        default: level_str = "UNKNOWN"; break;
    }

    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

// ============================================================================
// Enum conversions
// ============================================================================

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string family_to_string(GeneFamily family) {
    switch (family) {
        case GeneFamily::TR: return "TR";
        case GeneFamily::IG: return "IG";
        case GeneFamily::MH: return "MH";
    }
    return "";
}

GeneFamily parse_family(const std::string& name) {
    std::string upper = to_upper(name);
    if (upper == "TR" || upper == "TCR") return GeneFamily::TR;
    if (upper == "IG") return GeneFamily::IG;
    if (upper == "MH" || upper == "MHC" || upper == "HLA") return GeneFamily::MH;
    throw std::invalid_argument("Unknown gene family: " + name + " (expected TR, IG or MH)");
}

std::string precision_to_string(Precision precision) {
    switch (precision) {
        case Precision::SUBGROUP: return "subgroup";
        case Precision::GENE: return "gene";
        case Precision::PROTEIN: return "protein";
        case Precision::ALLELE: return "allele";
    }
    return "";
}

Precision parse_precision(const std::string& name) {
    if (name == "subgroup") return Precision::SUBGROUP;
    if (name == "gene") return Precision::GENE;
    if (name == "protein") return Precision::PROTEIN;
    if (name == "allele") return Precision::ALLELE;
    throw std::invalid_argument("Unknown precision: " + name +
                                " (expected subgroup, gene, protein or allele)");
}

Functionality parse_functionality(const std::string& label) {
    std::string core;
    for (char c : label) {
        if (c != '(' && c != ')' && c != '[' && c != ']') core += c;
    }
    if (core == "F") return Functionality::FUNCTIONAL;
    if (core == "ORF") return Functionality::ORF;
    if (core == "P") return Functionality::PSEUDOGENE;
    return Functionality::NONE;
}

std::string functionality_to_string(Functionality functionality) {
    switch (functionality) {
        case Functionality::FUNCTIONAL: return "F";
        case Functionality::ORF: return "ORF";
        case Functionality::PSEUDOGENE: return "P";
        case Functionality::NONE: return "";
    }
    return "";
}

FunctionalityFilter parse_functionality_filter(const std::string& name) {
    std::string upper = to_upper(name);
    if (upper == "ANY" || upper == "ALL") return FunctionalityFilter::ANY;
    if (upper == "F") return FunctionalityFilter::FUNCTIONAL;
    if (upper == "NF") return FunctionalityFilter::NON_FUNCTIONAL;
    if (upper == "P") return FunctionalityFilter::PSEUDOGENE;
    if (upper == "ORF") return FunctionalityFilter::ORF;
    throw std::invalid_argument("Unknown functionality filter: " + name +
                                " (expected any, F, NF, P or ORF)");
}

bool filter_accepts(FunctionalityFilter filter, Functionality functionality) {
    switch (filter) {
        case FunctionalityFilter::ANY:
            return true;
        case FunctionalityFilter::FUNCTIONAL:
            return functionality == Functionality::FUNCTIONAL;
        case FunctionalityFilter::NON_FUNCTIONAL:
            return functionality == Functionality::ORF ||
                   functionality == Functionality::PSEUDOGENE;
        case FunctionalityFilter::PSEUDOGENE:
            return functionality == Functionality::PSEUDOGENE;
        case FunctionalityFilter::ORF:
            return functionality == Functionality::ORF;
    }
    return false;
}

// ============================================================================
// Species keys
// ============================================================================

std::string clean_species(const std::string& species) {
    std::string result;
    result.reserve(species.size());
    for (unsigned char c : species) {
        if (std::isspace(c)) continue;
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

const std::vector<std::string>& supported_species() {
    static const std::vector<std::string> species = {"homosapiens", "musmusculus"};
    return species;
}

} // namespace immunorm
