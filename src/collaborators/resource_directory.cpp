#include "collaborators/resource_directory.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace carebridge {

namespace {

const char* kFallbackLocale = "US";
const char* kDefaultEmergency = "911";

Resource make_resource(const std::string& id, const std::string& name, const std::string& type,
                       const std::string& phone, const std::string& text_number,
                       const std::string& website, const std::string& description,
                       std::vector<std::string> languages, std::vector<std::string> categories) {
    Resource r;
    r.id = id;
    r.name = name;
    r.type = type;
    r.phone = phone;
    r.text_number = text_number;
    r.website = website;
    r.description = description;
    r.hours = "24/7";
    r.languages = std::move(languages);
    r.categories = std::move(categories);
    return r;
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& v : j[key]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

std::string normalize_locale(const std::string& locale) {
    std::string upper = utils::trim_copy(locale);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "GB") upper = "UK";
    return upper;
}

} // namespace

json Resource::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["type"] = type;
    if (!phone.empty()) j["phone"] = phone;
    if (!text_number.empty()) j["text_number"] = text_number;
    if (!website.empty()) j["website"] = website;
    j["description"] = description;
    j["hours"] = hours;
    j["languages"] = languages;
    j["categories"] = categories;
    return j;
}

Resource Resource::from_json(const json& j) {
    Resource r;
    r.id = j.value("id", "");
    r.name = j.value("name", "");
    r.type = j.value("type", "hotline");
    r.phone = j.value("phone", "");
    r.text_number = j.value("text_number", "");
    r.website = j.value("website", "");
    r.description = j.value("description", "");
    r.hours = j.value("hours", "");
    r.languages = string_list(j, "languages");
    r.categories = string_list(j, "categories");
    return r;
}

json ResourceBundle::to_json() const {
    json j;
    j["locale"] = locale;
    j["category"] = category;
    j["resources"] = json::array();
    for (const auto& r : resources) {
        j["resources"].push_back(r.to_json());
    }
    return j;
}

std::string ResourceBundle::render() const {
    std::ostringstream oss;
    oss << "Here are some people you can reach right now:";
    for (const auto& r : resources) {
        oss << "\n- " << r.name;
        if (!r.phone.empty()) oss << ": call " << r.phone;
        if (!r.text_number.empty()) oss << (r.phone.empty() ? ": " : ", ") << "text " << r.text_number;
        if (!r.website.empty()) oss << " (" << r.website << ")";
        if (!r.hours.empty()) oss << ", " << r.hours;
    }
    return oss.str();
}

StaticResourceDirectory::StaticResourceDirectory() {
    emergency_numbers_ = {{"US", "911"}, {"CA", "911"}, {"UK", "999"}, {"AU", "000"}};

    resources_["US"] = {
        make_resource("988_lifeline", "988 Suicide & Crisis Lifeline", "crisis_line", "988", "988",
                      "https://988lifeline.org", "24/7 suicide prevention and crisis support",
                      {"English", "Spanish"}, {"suicide", "self_harm", "crisis", "general"}),
        make_resource("domestic_violence_hotline", "National Domestic Violence Hotline", "hotline",
                      "1-800-799-7233", "", "https://www.thehotline.org",
                      "24/7 support for people experiencing domestic violence",
                      {"English", "Spanish"}, {"abuse", "harm_to_others"}),
        make_resource("samhsa_helpline", "SAMHSA National Helpline", "hotline", "1-800-662-4357", "",
                      "https://www.samhsa.gov/find-help/national-helpline",
                      "Treatment referral and information for mental health and substance use",
                      {"English", "Spanish"}, {"general"}),
    };
    resources_["CA"] = {
        make_resource("crisis_services_canada", "Crisis Services Canada", "crisis_line", "1-833-456-4566", "",
                      "", "24/7 crisis support for Canadians", {"English", "French"},
                      {"suicide", "self_harm", "crisis", "general"}),
        make_resource("kids_help_phone", "Kids Help Phone", "hotline", "1-800-668-6868", "686868",
                      "https://kidshelpphone.ca", "24/7 support for young people", {"English", "French"},
                      {"abuse", "general"}),
    };
    resources_["UK"] = {
        make_resource("samaritans", "Samaritans", "crisis_line", "116 123", "", "https://www.samaritans.org",
                      "24/7 emotional support", {"English"}, {"suicide", "self_harm", "crisis", "general"}),
    };
    resources_["AU"] = {
        make_resource("lifeline_au", "Lifeline Australia", "crisis_line", "13 11 14", "", "https://www.lifeline.org.au",
                      "24/7 crisis support and suicide prevention", {"English"},
                      {"suicide", "self_harm", "crisis", "general"}),
    };
}

VoidResult StaticResourceDirectory::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Failed to open resource directory: " + path);
    }
    try {
        json j;
        file >> j;
        if (j.contains("emergency_numbers") && j["emergency_numbers"].is_object()) {
            for (auto& [locale, number] : j["emergency_numbers"].items()) {
                emergency_numbers_[locale] = number.get<std::string>();
            }
        }
        if (j.contains("resources") && j["resources"].is_object()) {
            for (auto& [locale, list] : j["resources"].items()) {
                std::vector<Resource> parsed;
                for (const auto& entry : list) {
                    parsed.push_back(Resource::from_json(entry));
                }
                resources_[locale] = std::move(parsed);
            }
        }
        LOG_INFO("Loaded resource directory from " + path);
        return {};
    } catch (const json::exception& e) {
        return make_parse_error("Resource directory " + path + ": " + e.what());
    }
}

std::string StaticResourceDirectory::resolve_locale(const std::string& locale) const {
    std::string upper = normalize_locale(locale);
    return resources_.count(upper) ? upper : kFallbackLocale;
}

Result<ResourceBundle> StaticResourceDirectory::lookup(const std::string& locale, const std::string& category) const {
    ResourceBundle bundle;
    bundle.locale = resolve_locale(locale);
    bundle.category = category.empty() ? "general" : category;

    auto it = resources_.find(bundle.locale);
    if (it == resources_.end()) {
        return make_error(ErrorType::NotFound, "no resources for locale " + bundle.locale);
    }
    for (const auto& r : it->second) {
        if (std::find(r.categories.begin(), r.categories.end(), bundle.category) != r.categories.end()) {
            bundle.resources.push_back(r);
        }
    }
    if (bundle.resources.empty()) {
        for (const auto& r : it->second) {
            if (r.categories.empty() ||
                std::find(r.categories.begin(), r.categories.end(), "general") != r.categories.end()) {
                bundle.resources.push_back(r);
            }
        }
    }
    return bundle;
}

std::string StaticResourceDirectory::emergency_number(const std::string& locale) const {
    std::string upper = normalize_locale(locale);
    auto it = emergency_numbers_.find(upper);
    return it != emergency_numbers_.end() ? it->second : kDefaultEmergency;
}

} // namespace carebridge
