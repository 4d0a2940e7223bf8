#include "humidor/core/json_file_inventory_store.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "humidor/core/inventory_codec.h"
#include "humidor/core/simple_json.h"

namespace humidor {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

// Returns true with *found=false when the file does not exist.
bool ReadJsonFile(const std::string& path, json::Value* out, bool* found, std::string* error) {
    *found = false;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return SetError("unable to open " + path, error);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const auto text = buffer.str();
    *found = true;
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        *out = json::Value::Null();
        return true;
    }
    std::string parse_error;
    if (!json::Parse(text, out, &parse_error)) {
        return SetError("invalid json in " + path + ": " + parse_error, error);
    }
    return true;
}

// Writes next to the target and renames over it so a failed write never
// truncates the previous document.
bool WriteJsonFile(const std::string& path, const json::Value& value, std::string* error) {
    const std::filesystem::path output_path(path);
    const std::filesystem::path tmp_path(path + ".tmp");
    try {
        if (!output_path.parent_path().empty()) {
            std::filesystem::create_directories(output_path.parent_path());
        }
        {
            std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
            if (!out.is_open()) {
                return SetError("unable to open output file: " + tmp_path.string(), error);
            }
            out << json::Dump(value, 2) << '\n';
            out.flush();
            if (!out.good()) {
                std::error_code ec;
                std::filesystem::remove(tmp_path, ec);
                return SetError("failed to write " + tmp_path.string(), error);
            }
        }
        std::filesystem::rename(tmp_path, output_path);
    } catch (const std::exception& ex) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError(std::string("failed to save ") + path + ": " + ex.what(), error);
    }
    return true;
}

}  // namespace

JsonFileInventoryStore::JsonFileInventoryStore(EngineConfig config) : config_(std::move(config)) {}

bool JsonFileInventoryStore::Load(InventorySnapshot* snapshot, std::string* error) {
    if (snapshot == nullptr) {
        return SetError("snapshot output is null", error);
    }

    InventorySnapshot loaded;
    json::Value document;
    bool found = false;
    std::string codec_error;

    if (!ReadJsonFile(inventory_path(), &document, &found, error)) {
        return false;
    }
    if (found && !document.IsNull() &&
        !InventoryCodec::DecodeInventory(document, &loaded.lots, &codec_error)) {
        return SetError(inventory_path() + ": " + codec_error, error);
    }

    if (!ReadJsonFile(ledger_path(), &document, &found, error)) {
        return false;
    }
    std::string ledger_source = ledger_path();
    if (!found) {
        ledger_source = legacy_sales_path();
        if (!ReadJsonFile(ledger_source, &document, &found, error)) {
            return false;
        }
    }
    if (found && !document.IsNull() &&
        !InventoryCodec::DecodeLedger(document, &loaded.entries, &loaded.transactions, &codec_error)) {
        return SetError(ledger_source + ": " + codec_error, error);
    }

    if (!ReadJsonFile(catalog_path(), &document, &found, error)) {
        return false;
    }
    if (found && !document.IsNull() &&
        !InventoryCodec::DecodeCatalog(document, &loaded.catalog, &codec_error)) {
        return SetError(catalog_path() + ": " + codec_error, error);
    }

    *snapshot = std::move(loaded);
    return true;
}

bool JsonFileInventoryStore::Save(const InventorySnapshot& snapshot, std::string* error) {
    return WriteJsonFile(inventory_path(), InventoryCodec::EncodeInventory(snapshot.lots), error) &&
           WriteJsonFile(ledger_path(),
                         InventoryCodec::EncodeLedger(snapshot.entries, snapshot.transactions),
                         error) &&
           WriteJsonFile(catalog_path(), InventoryCodec::EncodeCatalog(snapshot.catalog), error);
}

std::string JsonFileInventoryStore::inventory_path() const {
    return PathFor(config_.inventory_file);
}

std::string JsonFileInventoryStore::ledger_path() const {
    return PathFor(config_.ledger_file);
}

std::string JsonFileInventoryStore::catalog_path() const {
    return PathFor(config_.catalog_file);
}

std::string JsonFileInventoryStore::legacy_sales_path() const {
    return PathFor(config_.legacy_sales_file);
}

std::string JsonFileInventoryStore::PathFor(const std::string& file_name) const {
    const std::filesystem::path file(file_name);
    if (file.is_absolute() || config_.data_dir.empty()) {
        return file.string();
    }
    return (std::filesystem::path(config_.data_dir) / file).string();
}

}  // namespace humidor
