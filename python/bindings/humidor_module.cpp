#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "humidor/common/timestamp.h"
#include "humidor/core/engine_config.h"
#include "humidor/core/json_file_inventory_store.h"
#include "humidor/monitoring/exporter.h"
#include "humidor/services/inventory_engine.h"

namespace py = pybind11;

namespace humidor {
namespace {

std::string DictString(const py::dict& cfg, const char* key, const std::string& fallback = "") {
    if (!cfg.contains(py::str(key))) {
        return fallback;
    }
    return py::cast<std::string>(cfg[py::str(key)]);
}

int DictInt(const py::dict& cfg, const char* key, int fallback) {
    if (!cfg.contains(py::str(key))) {
        return fallback;
    }
    return py::cast<int>(cfg[py::str(key)]);
}

double DictDouble(const py::dict& cfg, const char* key, double fallback) {
    if (!cfg.contains(py::str(key))) {
        return fallback;
    }
    return py::cast<double>(cfg[py::str(key)]);
}

py::list ToIssueList(const std::vector<EngineIssue>& issues) {
    py::list out;
    for (const auto& issue : issues) {
        py::dict item;
        item["kind"] = ToString(issue.kind);
        item["message"] = issue.message;
        item["lot_id"] = issue.lot_id;
        item["transaction_id"] = issue.transaction_id;
        item["entry_id"] = issue.entry_id;
        out.append(item);
    }
    return out;
}

py::dict ToLotDict(const Lot& lot) {
    py::dict out;
    out["lot_id"] = lot.lot_id;
    out["brand"] = lot.brand;
    out["name"] = lot.name;
    out["size"] = lot.size;
    out["type"] = lot.type;
    out["count"] = lot.count;
    out["price"] = lot.price;
    out["shipping"] = lot.shipping();
    out["allocated_shipping"] = lot.allocated_shipping;
    out["allocated_tax"] = lot.allocated_tax;
    out["unit_cost"] = lot.unit_cost;
    out["original_quantity"] =
        lot.original_quantity.has_value() ? py::cast(*lot.original_quantity) : py::none();
    out["rating"] = lot.rating.has_value() ? py::cast(*lot.rating) : py::none();
    return out;
}

py::dict ToEntryDict(const LedgerEntry& entry) {
    py::dict out;
    out["entry_id"] = entry.entry_id;
    out["transaction_id"] = entry.transaction_id;
    out["date"] = Timestamp(entry.ts_ns).ToText();
    out["kind"] = ToString(entry.kind);
    out["lot_id"] = entry.lot_id;
    out["brand"] = entry.brand;
    out["name"] = entry.name;
    out["size"] = entry.size;
    out["unit_price"] = entry.unit_price;
    out["quantity"] = entry.quantity;
    out["total_cost"] = entry.total_cost;
    out["total_price"] = entry.total_price;
    out["shipping_tax_allocated"] = entry.shipping_tax_allocated();
    return out;
}

py::list ToEntryList(const std::vector<LedgerEntry>& entries) {
    py::list out;
    for (const auto& entry : entries) {
        out.append(ToEntryDict(entry));
    }
    return out;
}

py::dict ToMutationDict(const MutationResult& result) {
    py::dict out;
    out["applied"] = result.applied;
    out["persisted"] = result.persisted;
    out["persist_error"] = result.persist_error;
    out["issues"] = ToIssueList(result.issue.has_value() ? std::vector<EngineIssue>{*result.issue}
                                                         : std::vector<EngineIssue>{});
    return out;
}

py::dict ToReversalDict(const ReversalResult& result) {
    py::dict out;
    out["entries_reversed"] = result.entries_reversed;
    out["quantity_reversed"] = result.quantity_reversed;
    out["issues"] = ToIssueList(result.issues);
    out["persisted"] = result.persisted;
    out["persist_error"] = result.persist_error;
    return out;
}

class PyInventoryEngine {
public:
    explicit PyInventoryEngine(const py::dict& config) {
        EngineConfig parsed;
        std::string error;
        const auto path = DictString(config, "config_path");
        if (!path.empty() && !EngineConfigLoader::LoadFromYaml(path, &parsed, &error)) {
            throw std::runtime_error(error);
        }
        parsed.data_dir = DictString(config, "data_dir", parsed.data_dir);
        parsed.default_tax_rate = DictDouble(config, "default_tax_rate", parsed.default_tax_rate);
        parsed.log_level = DictString(config, "log_level", parsed.log_level);
        impl_ = std::make_unique<InventoryEngine>(
            parsed, std::make_shared<JsonFileInventoryStore>(parsed));
        if (!impl_->Load(&error)) {
            throw std::runtime_error(error);
        }
    }

    double compute_unit_cost(double price,
                             double shipping,
                             int count,
                             std::optional<int> original_quantity) const {
        return impl_->ComputeUnitCost(price, shipping, count, original_quantity);
    }

    py::dict set_tax_rate(double rate) { return ToMutationDict(impl_->SetTaxRate(rate)); }

    double tax_rate() const { return impl_->tax_rate(); }

    py::list lots(const std::string& search, const std::string& sort, bool descending) const {
        LotQuery query;
        query.search = search;
        query.descending = descending;
        if (!sort.empty() && !ParseLotSortKey(sort, &query.sort_key)) {
            throw std::invalid_argument("unknown sort column: " + sort);
        }
        py::list out;
        for (const auto& lot : impl_->QueryLots(query)) {
            out.append(ToLotDict(lot));
        }
        return out;
    }

    py::object find_duplicate(const std::string& brand,
                              const std::string& name,
                              const std::string& size) const {
        const auto lot = impl_->FindDuplicateLot(brand, name, size);
        return lot.has_value() ? py::object(ToLotDict(*lot)) : py::object(py::none());
    }

    py::dict merge_lots(const std::string& lot_id,
                        int count,
                        double price,
                        double shipping,
                        double tax) {
        return ToMutationDict(impl_->MergeLots(lot_id, count, price, shipping, tax));
    }

    py::dict record_sale(const py::list& items) {
        std::vector<SaleItem> parsed;
        for (const auto& handle : items) {
            const auto item = py::cast<py::dict>(handle);
            parsed.push_back(SaleItem{DictString(item, "lot_id"), DictInt(item, "quantity", 0)});
        }
        const auto result = impl_->RecordSale(parsed);
        py::dict out;
        out["transaction_id"] = result.transaction_id;
        out["entries"] = ToEntryList(result.entries);
        out["issues"] = ToIssueList(result.issues);
        out["persisted"] = result.persisted;
        out["persist_error"] = result.persist_error;
        return out;
    }

    py::dict record_resupply(const py::list& items, double total_shipping, double tax_rate_percent) {
        ResupplyOrder order;
        order.total_shipping = total_shipping;
        order.tax_rate_percent = tax_rate_percent;
        for (const auto& handle : items) {
            const auto item = py::cast<py::dict>(handle);
            ResupplyItem parsed;
            parsed.brand = DictString(item, "brand");
            parsed.name = DictString(item, "name");
            parsed.size = DictString(item, "size");
            parsed.type = DictString(item, "type");
            parsed.count = DictInt(item, "count", 0);
            parsed.price = DictDouble(item, "price", 0.0);
            order.items.push_back(std::move(parsed));
        }
        const auto result = impl_->RecordResupply(order);
        py::dict out;
        out["order_id"] = result.order_id;
        out["entries"] = ToEntryList(result.entries);
        out["lot_ids"] = result.lot_ids;
        out["issues"] = ToIssueList(result.issues);
        out["persisted"] = result.persisted;
        out["persist_error"] = result.persist_error;
        return out;
    }

    py::dict reverse_sale_entry(const std::string& entry_id, int quantity) {
        return ToReversalDict(impl_->ReverseSaleEntry(entry_id, quantity));
    }

    py::dict reverse_resupply_entry(const std::string& entry_id, int quantity) {
        return ToReversalDict(impl_->ReverseResupplyEntry(entry_id, quantity));
    }

    py::dict reverse_transaction(const std::string& transaction_id) {
        return ToReversalDict(impl_->ReverseWholeTransaction(transaction_id));
    }

    std::string transaction_state(const std::string& transaction_id) const {
        return ToString(impl_->GetTransactionState(transaction_id));
    }

    py::list sales_history() const { return ToEntryList(impl_->SalesHistory()); }

    py::dict aggregate() const {
        const auto summary = impl_->Aggregate();
        py::dict out;
        out["total_count"] = summary.total_count;
        out["total_value"] = summary.total_value;
        out["average_shipping"] = summary.average_shipping;
        out["average_unit_cost"] = summary.average_unit_cost;
        out["stocked_lots"] = summary.stocked_lots;
        return out;
    }

    void start_metrics_exporter(int port) {
        std::string error;
        if (!exporter_.Start(port, &error)) {
            throw std::runtime_error(error);
        }
    }

    void stop_metrics_exporter() { exporter_.Stop(); }

    bool metrics_exporter_running() const { return exporter_.IsRunning(); }

private:
    std::unique_ptr<InventoryEngine> impl_;
    MetricsExporter exporter_;
};

}  // namespace
}  // namespace humidor

PYBIND11_MODULE(humidor_py, m) {
    using humidor::PyInventoryEngine;
    py::class_<PyInventoryEngine>(m, "InventoryEngine")
        .def(py::init<const py::dict&>(), py::arg("config") = py::dict())
        .def("compute_unit_cost", &PyInventoryEngine::compute_unit_cost, py::arg("price"),
             py::arg("shipping"), py::arg("count"), py::arg("original_quantity") = py::none())
        .def("set_tax_rate", &PyInventoryEngine::set_tax_rate)
        .def("tax_rate", &PyInventoryEngine::tax_rate)
        .def("lots", &PyInventoryEngine::lots, py::arg("search") = "", py::arg("sort") = "",
             py::arg("descending") = false)
        .def("find_duplicate", &PyInventoryEngine::find_duplicate)
        .def("merge_lots", &PyInventoryEngine::merge_lots, py::arg("lot_id"), py::arg("count"),
             py::arg("price"), py::arg("shipping"), py::arg("tax") = 0.0)
        .def("record_sale", &PyInventoryEngine::record_sale)
        .def("record_resupply", &PyInventoryEngine::record_resupply, py::arg("items"),
             py::arg("total_shipping"), py::arg("tax_rate_percent"))
        .def("reverse_sale_entry", &PyInventoryEngine::reverse_sale_entry)
        .def("reverse_resupply_entry", &PyInventoryEngine::reverse_resupply_entry)
        .def("reverse_transaction", &PyInventoryEngine::reverse_transaction)
        .def("transaction_state", &PyInventoryEngine::transaction_state)
        .def("sales_history", &PyInventoryEngine::sales_history)
        .def("aggregate", &PyInventoryEngine::aggregate)
        .def("start_metrics_exporter", &PyInventoryEngine::start_metrics_exporter,
             py::arg("port"))
        .def("stop_metrics_exporter", &PyInventoryEngine::stop_metrics_exporter)
        .def("metrics_exporter_running", &PyInventoryEngine::metrics_exporter_running);
}
