// ==============================================================================
// qube_info.cpp - Метаданные qube из YAML
// ==============================================================================

#include "qrpolicy/qube_info.hpp"

#include "qrpolicy/platform.hpp"
#include "qrpolicy/specifier.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace qrpolicy {

// ============================================================================
// StaticQubeInfo
// ============================================================================

void StaticQubeInfo::add(std::string name, QubeRecord record) {
    qubes_[std::move(name)] = std::move(record);
}

const QubeRecord* StaticQubeInfo::find(std::string_view qube) const {
    auto it = qubes_.find(qube);
    return it != qubes_.end() ? &it->second : nullptr;
}

std::optional<std::string> StaticQubeInfo::type_of(std::string_view qube) const {
    const QubeRecord* rec = find(qube);
    return rec != nullptr ? rec->type : std::nullopt;
}

bool StaticQubeInfo::has_tag(std::string_view qube, std::string_view tag) const {
    const QubeRecord* rec = find(qube);
    return rec != nullptr && rec->tags.count(tag) > 0;
}

std::optional<std::string> StaticQubeInfo::dispvm_template_of(std::string_view qube) const {
    const QubeRecord* rec = find(qube);
    return rec != nullptr ? rec->dispvm_template : std::nullopt;
}

// ============================================================================
// YAML
// ============================================================================

namespace {

QubeRecord parse_record(const std::string& name, const YAML::Node& node) {
    QubeRecord rec;
    if (!node || node.IsNull()) {
        return rec;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("qube '" + name + "' must be a mapping");
    }
    if (node["type"]) {
        rec.type = node["type"].as<std::string>();
    }
    if (node["template"]) {
        rec.dispvm_template = node["template"].as<std::string>();
    }
    if (const auto tags = node["tags"]) {
        if (!tags.IsSequence()) {
            throw std::runtime_error("tags of qube '" + name + "' must be a list");
        }
        for (const auto& tag : tags) {
            rec.tags.insert(tag.as<std::string>());
        }
    }
    return rec;
}

}  // namespace

QubeInfoResult parse_qube_info(std::string_view yaml_text) {
    QubeInfoResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));
        if (!root || root.IsNull()) {
            result.ok = true;
            return result;
        }
        const YAML::Node qubes = root["qubes"];
        if (!qubes || qubes.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!qubes.IsMap()) {
            result.error = "'qubes' must be a mapping";
            return result;
        }
        for (const auto& entry : qubes) {
            const auto name = entry.first.as<std::string>();
            if (!is_valid_qube_name(name)) {
                result.error = "invalid qube name '" + name + "'";
                return result;
            }
            result.info.add(name, parse_record(name, entry.second));
        }
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = e.what();
    } catch (const std::runtime_error& e) {
        result.error = e.what();
    }
    return result;
}

QubeInfoResult load_qube_info(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        QubeInfoResult result;
        result.error = "cannot open qube metadata file: " + platform::path_to_utf8(path);
        return result;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto result = parse_qube_info(ss.str());
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

}  // namespace qrpolicy
