#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ProductFolder {
    std::string name;
    std::optional<std::string> parent_id;
};

using FolderMap = std::map<std::string, ProductFolder>;

// Turns MoySklad remap 1.2 payloads into domain types.
class AssortmentParser {
public:
    static constexpr const char* kNoGroup = "No group";

    // ".../entity/productfolder/<id>" -> "<id>"
    static std::string id_from_href(const std::string& href);

    static void parse_folders(const nlohmann::json& page, FolderMap& folders);

    // Folder chain from the root, joined with " > ".
    static std::string group_path(const std::optional<std::string>& folder_id,
                                  const FolderMap& folders);

    // Rows without an id or name are skipped with a warning.
    static std::vector<Product> parse_products(const nlohmann::json& page,
                                               const FolderMap& folders,
                                               const std::string& expiration_attribute,
                                               spdlog::logger& log);

    static std::optional<Counterparty> parse_counterparty(const nlohmann::json& row);

private:
    static std::optional<std::string> meta_id(const nlohmann::json& obj, const char* field);
    static std::optional<int64_t> read_expiration(const nlohmann::json& row,
                                                  const std::string& attribute);
    // Throws nlohmann::json::exception on a field of the wrong type
    static Product parse_product(const nlohmann::json& row, const FolderMap& folders,
                                 const std::string& expiration_attribute,
                                 spdlog::logger& log);
};
