#include "assortment.hpp"
#include "util.hpp"
#include <algorithm>
#include <set>

namespace {

std::string string_or(const nlohmann::json& obj, const char* field, const std::string& fallback) {
    if (!obj.contains(field) || !obj[field].is_string()) return fallback;
    return obj[field].get<std::string>();
}

bool has_name(const nlohmann::json& attr, const std::string& name) {
    return attr.is_object() && attr.contains("name") && attr["name"].is_string() &&
           attr["name"].get<std::string>() == name;
}

} // namespace

std::string AssortmentParser::id_from_href(const std::string& href) {
    std::string path = href.substr(0, href.find('?'));
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::optional<std::string> AssortmentParser::meta_id(const nlohmann::json& obj, const char* field) {
    if (!obj.contains(field) || !obj[field].is_object()) return std::nullopt;
    const auto& ref = obj[field];
    if (!ref.contains("meta") || !ref["meta"].is_object()) return std::nullopt;

    std::string href = string_or(ref["meta"], "href", "");
    if (href.empty()) return std::nullopt;

    std::string id = id_from_href(href);
    if (id.empty()) return std::nullopt;
    return id;
}

void AssortmentParser::parse_folders(const nlohmann::json& page, FolderMap& folders) {
    if (!page.contains("rows") || !page["rows"].is_array()) return;

    for (const auto& row : page["rows"]) {
        if (!row.contains("id") || !row["id"].is_string()) continue;

        ProductFolder folder;
        folder.name = string_or(row, "name", "Untitled");
        folder.parent_id = meta_id(row, "productFolder");
        folders[row["id"].get<std::string>()] = folder;
    }
}

std::string AssortmentParser::group_path(const std::optional<std::string>& folder_id,
                                         const FolderMap& folders) {
    if (!folder_id) return kNoGroup;

    std::vector<std::string> path;
    std::set<std::string> visited;
    std::optional<std::string> current = folder_id;

    while (current && visited.insert(*current).second) {
        auto it = folders.find(*current);
        if (it == folders.end()) break;
        path.push_back(it->second.name);
        current = it->second.parent_id;
    }

    if (path.empty()) return kNoGroup;

    std::reverse(path.begin(), path.end());
    std::string joined;
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) joined += " > ";
        joined += path[i];
    }
    return joined;
}

std::optional<int64_t> AssortmentParser::read_expiration(const nlohmann::json& row,
                                                         const std::string& attribute) {
    if (!row.contains("attributes") || !row["attributes"].is_array()) return std::nullopt;

    for (const auto& attr : row["attributes"]) {
        if (!has_name(attr, attribute)) continue;
        if (!attr.contains("value") || !attr["value"].is_string()) return std::nullopt;
        return util::parse_date_ms(attr["value"].get<std::string>());
    }
    return std::nullopt;
}

Product AssortmentParser::parse_product(const nlohmann::json& row,
                                        const FolderMap& folders,
                                        const std::string& expiration_attribute,
                                        spdlog::logger& log) {
    Product product;
    product.id = row["id"].get<std::string>();
    product.name = row["name"].get<std::string>();

    if (row.contains("stock") && row["stock"].is_number()) {
        product.stock = row["stock"].get<double>();
    }
    if (row.contains("minimumBalance") && row["minimumBalance"].is_number()) {
        product.min_balance = row["minimumBalance"].get<double>();
    }

    product.group_path = group_path(meta_id(row, "productFolder"), folders);

    product.expiration_ms = read_expiration(row, expiration_attribute);
    if (!product.expiration_ms && row.contains("attributes")) {
        for (const auto& attr : row["attributes"]) {
            if (has_name(attr, expiration_attribute)) {
                log.warn("Unparsable expiration date for {}: {}", product.name,
                         attr.contains("value") ? attr["value"].dump() : "null");
                break;
            }
        }
    }

    return product;
}

std::vector<Product> AssortmentParser::parse_products(const nlohmann::json& page,
                                                      const FolderMap& folders,
                                                      const std::string& expiration_attribute,
                                                      spdlog::logger& log) {
    std::vector<Product> products;
    if (!page.contains("rows") || !page["rows"].is_array()) return products;

    for (const auto& row : page["rows"]) {
        if (!row.is_object() ||
            !row.contains("id") || !row["id"].is_string() ||
            !row.contains("name") || !row["name"].is_string()) {
            log.warn("Skipping malformed assortment row: {}", row.dump().substr(0, 200));
            continue;
        }

        try {
            products.push_back(parse_product(row, folders, expiration_attribute, log));
        } catch (const nlohmann::json::exception& e) {
            log.warn("Skipping assortment row {}: {}", row["id"].get<std::string>(), e.what());
        }
    }

    return products;
}

std::optional<Counterparty> AssortmentParser::parse_counterparty(const nlohmann::json& row) {
    if (!row.is_object() || !row.contains("id") || !row["id"].is_string()) {
        return std::nullopt;
    }

    Counterparty cp;
    cp.id = row["id"].get<std::string>();
    cp.name = string_or(row, "name", "");
    cp.phone = string_or(row, "phone", "");
    cp.company_type = string_or(row, "companyType", "legal");
    return cp;
}
