#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "humidor/apps/cli_support.h"
#include "humidor/common/timestamp.h"
#include "humidor/core/engine_config.h"
#include "humidor/core/fixed_decimal.h"
#include "humidor/core/json_file_inventory_store.h"
#include "humidor/core/simple_json.h"
#include "humidor/services/inventory_engine.h"

namespace {

using humidor::json::Value;

constexpr const char* kUsage =
    "usage: humidor_cli <command> [--config path] [--data-dir dir] [--output file]\n"
    "  summary\n"
    "  list [--search text] [--sort column] [--desc]\n"
    "  sell --lot id --qty n\n"
    "  resupply --brand b --name n --size s --count n --price p [--type t]\n"
    "           [--shipping x] [--tax-percent r]\n"
    "  reverse --entry id [--qty n]\n"
    "  reverse-txn --id transaction_id\n"
    "  history\n"
    "  quote --shipping x --units n\n";

Value Money(double value) {
    return Value::Number(humidor::FixedDecimal::RoundMoney(value));
}

Value EncodeIssues(const std::vector<humidor::EngineIssue>& issues) {
    Value out = Value::Array();
    for (const auto& issue : issues) {
        Value item = Value::Object();
        item.Set("kind", Value::String(humidor::ToString(issue.kind)));
        item.Set("message", Value::String(issue.message));
        if (!issue.lot_id.empty()) {
            item.Set("lot_id", Value::String(issue.lot_id));
        }
        if (!issue.entry_id.empty()) {
            item.Set("entry_id", Value::String(issue.entry_id));
        }
        out.Append(std::move(item));
    }
    return out;
}

Value EncodeLotRow(const humidor::Lot& lot) {
    Value row = Value::Object();
    row.Set("lot_id", Value::String(lot.lot_id));
    row.Set("brand", Value::String(lot.brand));
    row.Set("name", Value::String(lot.name));
    row.Set("size", Value::String(lot.size));
    row.Set("type", Value::String(lot.type));
    row.Set("count", Value::Number(lot.count));
    row.Set("price", Money(lot.price));
    row.Set("shipping", Money(lot.shipping()));
    row.Set("unit_cost", Money(lot.unit_cost));
    row.Set("rating", lot.rating.has_value() ? Value::Number(*lot.rating) : Value::Null());
    return row;
}

Value EncodeEntryRow(const humidor::LedgerEntry& entry) {
    Value row = Value::Object();
    row.Set("entry_id", Value::String(entry.entry_id));
    row.Set("transaction_id", Value::String(entry.transaction_id));
    row.Set("date", Value::String(humidor::Timestamp(entry.ts_ns).ToText()));
    row.Set("kind", Value::String(humidor::ToString(entry.kind)));
    row.Set("brand", Value::String(entry.brand));
    row.Set("name", Value::String(entry.name));
    row.Set("size", Value::String(entry.size));
    row.Set("unit_price", Money(entry.unit_price));
    row.Set("quantity", Value::Number(entry.quantity));
    row.Set("total_cost", Money(entry.total_cost));
    return row;
}

void SetPersistence(bool persisted, const std::string& error, Value* out) {
    out->Set("persisted", Value::Bool(persisted));
    if (!error.empty()) {
        out->Set("persist_error", Value::String(error));
    }
}

int RunSummary(const humidor::InventoryEngine& engine, Value* out) {
    const auto summary = engine.Aggregate();
    out->Set("total_count", Value::Number(static_cast<double>(summary.total_count)));
    out->Set("total_value", Money(summary.total_value));
    out->Set("average_shipping", Money(summary.average_shipping));
    out->Set("average_unit_cost", Money(summary.average_unit_cost));
    out->Set("stocked_lots", Value::Number(static_cast<double>(summary.stocked_lots)));
    out->Set("tax_rate", Value::Number(engine.tax_rate()));
    return 0;
}

int RunList(const humidor::InventoryEngine& engine, const humidor::apps::ArgMap& args, Value* out) {
    humidor::LotQuery query;
    query.search = humidor::apps::GetArg(args, "search");
    query.descending = humidor::apps::HasArg(args, "desc");
    const auto sort = humidor::apps::GetArg(args, "sort");
    if (!sort.empty() && !humidor::ParseLotSortKey(sort, &query.sort_key)) {
        std::cerr << "humidor_cli: unknown sort column: " << sort << '\n';
        return 1;
    }
    Value rows = Value::Array();
    for (const auto& lot : engine.QueryLots(query)) {
        rows.Append(EncodeLotRow(lot));
    }
    out->Set("lots", std::move(rows));
    return 0;
}

int RunSell(humidor::InventoryEngine* engine, const humidor::apps::ArgMap& args, Value* out) {
    std::string error;
    std::int32_t quantity = 0;
    if (!humidor::apps::HasArg(args, "lot") ||
        !humidor::apps::GetCountArg(args, "qty", &quantity, &error)) {
        std::cerr << "humidor_cli: " << (error.empty() ? "missing --lot" : error) << '\n';
        return 1;
    }
    const auto result =
        engine->RecordSale({humidor::SaleItem{humidor::apps::GetArg(args, "lot"), quantity}});
    Value entries = Value::Array();
    for (const auto& entry : result.entries) {
        entries.Append(EncodeEntryRow(entry));
    }
    out->Set("transaction_id", Value::String(result.transaction_id));
    out->Set("entries", std::move(entries));
    out->Set("issues", EncodeIssues(result.issues));
    SetPersistence(result.persisted, result.persist_error, out);
    return result.entries.empty() ? 2 : 0;
}

int RunResupply(humidor::InventoryEngine* engine, const humidor::apps::ArgMap& args, Value* out) {
    std::string error;
    humidor::ResupplyItem item;
    item.brand = humidor::apps::GetArg(args, "brand");
    item.name = humidor::apps::GetArg(args, "name");
    item.size = humidor::apps::GetArg(args, "size");
    item.type = humidor::apps::GetArg(args, "type");

    humidor::ResupplyOrder order;
    if (item.name.empty()) {
        std::cerr << "humidor_cli: missing --name\n";
        return 1;
    }
    if (!humidor::apps::GetCountArg(args, "count", &item.count, &error) ||
        !humidor::apps::GetDecimalArg(args, "price", 0.0, &item.price, &error) ||
        !humidor::apps::GetDecimalArg(args, "shipping", 0.0, &order.total_shipping, &error) ||
        !humidor::apps::GetDecimalArg(
            args, "tax-percent", engine->tax_rate() * 100.0, &order.tax_rate_percent, &error)) {
        std::cerr << "humidor_cli: " << error << '\n';
        return 1;
    }
    order.items.push_back(item);

    const auto result = engine->RecordResupply(order);
    Value lot_ids = Value::Array();
    for (const auto& lot_id : result.lot_ids) {
        lot_ids.Append(Value::String(lot_id));
    }
    out->Set("order_id", Value::String(result.order_id));
    out->Set("lot_ids", std::move(lot_ids));
    out->Set("issues", EncodeIssues(result.issues));
    SetPersistence(result.persisted, result.persist_error, out);
    return result.entries.empty() ? 2 : 0;
}

int RunReverse(humidor::InventoryEngine* engine, const humidor::apps::ArgMap& args, Value* out) {
    const auto entry_id = humidor::apps::GetArg(args, "entry");
    const auto entry = engine->FindEntry(entry_id);
    if (!entry.has_value()) {
        std::cerr << "humidor_cli: no ledger entry: " << entry_id << '\n';
        return 2;
    }
    std::int32_t quantity = entry->quantity;
    std::string error;
    if (humidor::apps::HasArg(args, "qty") &&
        !humidor::apps::GetCountArg(args, "qty", &quantity, &error)) {
        std::cerr << "humidor_cli: " << error << '\n';
        return 1;
    }
    const auto result = engine->ReverseEntry(entry_id, quantity);
    out->Set("entries_reversed", Value::Number(static_cast<double>(result.entries_reversed)));
    out->Set("quantity_reversed", Value::Number(result.quantity_reversed));
    out->Set("transaction_state",
             Value::String(humidor::ToString(engine->GetTransactionState(entry->transaction_id))));
    out->Set("issues", EncodeIssues(result.issues));
    SetPersistence(result.persisted, result.persist_error, out);
    return result.ok() ? 0 : 2;
}

int RunReverseTransaction(humidor::InventoryEngine* engine,
                          const humidor::apps::ArgMap& args,
                          Value* out) {
    const auto transaction_id = humidor::apps::GetArg(args, "id");
    const auto result = engine->ReverseWholeTransaction(transaction_id);
    out->Set("entries_reversed", Value::Number(static_cast<double>(result.entries_reversed)));
    out->Set("quantity_reversed", Value::Number(result.quantity_reversed));
    out->Set("transaction_state",
             Value::String(humidor::ToString(engine->GetTransactionState(transaction_id))));
    out->Set("issues", EncodeIssues(result.issues));
    SetPersistence(result.persisted, result.persist_error, out);
    return result.ok() ? 0 : 2;
}

int RunHistory(const humidor::InventoryEngine& engine, Value* out) {
    Value rows = Value::Array();
    double total = 0.0;
    for (const auto& entry : engine.SalesHistory()) {
        total += entry.total_cost;
        rows.Append(EncodeEntryRow(entry));
    }
    out->Set("sales", std::move(rows));
    out->Set("total", Money(total));
    return 0;
}

int RunQuote(const humidor::apps::ArgMap& args, Value* out) {
    std::string error;
    double shipping = 0.0;
    double units = 0.0;
    if (!humidor::apps::GetDecimalArg(args, "shipping", 0.0, &shipping, &error) ||
        !humidor::apps::GetDecimalArg(args, "units", 0.0, &units, &error)) {
        std::cerr << "humidor_cli: " << error << '\n';
        return 1;
    }
    const auto quote =
        humidor::InventoryEngine::QuoteShipping(shipping, static_cast<std::int64_t>(units));
    out->Set("per_unit", Money(quote.per_unit));
    out->Set("five_pack", Money(quote.five_pack));
    out->Set("ten_pack", Money(quote.ten_pack));
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace humidor;
    const auto command_line = apps::ParseCommandLine(argc, argv);
    const auto& args = command_line.args;
    if (command_line.command.empty() || apps::HasArg(args, "help")) {
        std::cerr << kUsage;
        return command_line.command.empty() ? 1 : 0;
    }

    std::string error;
    EngineConfig config;
    const auto config_path = apps::GetArg(args, "config");
    const bool config_ok = config_path.empty()
                               ? EngineConfigLoader::LoadFromEnvironment(&config, &error)
                               : EngineConfigLoader::LoadFromYaml(config_path, &config, &error);
    if (!config_ok) {
        std::cerr << "humidor_cli: " << error << '\n';
        return 1;
    }
    if (apps::HasArg(args, "data-dir")) {
        config.data_dir = apps::GetArg(args, "data-dir");
    }

    Value out = Value::Object();
    out.Set("command", Value::String(command_line.command));
    int status = 0;
    if (command_line.command == "quote") {
        status = RunQuote(args, &out);
    } else {
        auto store = std::make_shared<JsonFileInventoryStore>(config);
        InventoryEngine engine(config, store);
        if (!engine.Load(&error)) {
            std::cerr << "humidor_cli: " << error << '\n';
            return 1;
        }

        const auto& command = command_line.command;
        if (command == "summary") {
            status = RunSummary(engine, &out);
        } else if (command == "list") {
            status = RunList(engine, args, &out);
        } else if (command == "sell") {
            status = RunSell(&engine, args, &out);
        } else if (command == "resupply") {
            status = RunResupply(&engine, args, &out);
        } else if (command == "reverse") {
            status = RunReverse(&engine, args, &out);
        } else if (command == "reverse-txn") {
            status = RunReverseTransaction(&engine, args, &out);
        } else if (command == "history") {
            status = RunHistory(engine, &out);
        } else {
            std::cerr << "humidor_cli: unknown command: " << command << '\n' << kUsage;
            return 1;
        }
    }
    if (status == 1) {
        return status;
    }

    const auto rendered = json::Dump(out, 2) + "\n";
    if (!apps::WriteTextFile(apps::GetArg(args, "output"), rendered, &error)) {
        std::cerr << "humidor_cli: " << error << '\n';
        return 1;
    }
    std::cout << rendered;
    return status;
}
