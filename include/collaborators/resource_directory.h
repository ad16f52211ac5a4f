#pragma once

/**
 * @file resource_directory.h
 * @brief Resource / hotline directory collaborator
 *
 * Read-only; lookups never touch session state.
 */

#include "errors.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace carebridge {

struct Resource {
    std::string id;
    std::string name;
    std::string type;         ///< "hotline", "crisis_line", "text_line", "emergency"
    std::string phone;
    std::string text_number;
    std::string website;
    std::string description;
    std::string hours;
    std::vector<std::string> languages;
    std::vector<std::string> categories;  ///< Risk categories served; empty = general

    nlohmann::json to_json() const;
    static Resource from_json(const nlohmann::json& j);
};

struct ResourceBundle {
    std::string locale;
    std::string category;
    std::vector<Resource> resources;

    bool empty() const { return resources.empty(); }
    nlohmann::json to_json() const;

    /// One line per resource, for the outbound message
    std::string render() const;
};

class IResourceDirectory {
public:
    virtual ~IResourceDirectory() = default;

    virtual Result<ResourceBundle> lookup(const std::string& locale, const std::string& category) const = 0;

    virtual std::string emergency_number(const std::string& locale) const = 0;
};

/**
 * @brief Built-in US/CA/UK/AU data, optionally replaced per locale by a JSON file
 *
 * File shape:
 * {"emergency_numbers": {"US": "911"},
 *  "resources": {"US": [{"id": ..., "name": ..., "phone": ..., "categories": [...]}]}}
 *
 * Unknown locales fall back to US data. A category with no specific entry
 * returns the locale's general resources.
 */
class StaticResourceDirectory : public IResourceDirectory {
public:
    StaticResourceDirectory();

    /// Merge a JSON directory file over the built-in data
    VoidResult load_file(const std::string& path);

    Result<ResourceBundle> lookup(const std::string& locale, const std::string& category) const override;
    std::string emergency_number(const std::string& locale) const override;

private:
    std::string resolve_locale(const std::string& locale) const;

    std::map<std::string, std::string> emergency_numbers_;
    std::map<std::string, std::vector<Resource>> resources_;
};

} // namespace carebridge
