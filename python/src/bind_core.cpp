#include "bind_forward.hpp"
#include <agenttreasury/agenttreasury.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace agenttreasury;

// ---------------------------------------------------------------------------
// Wrapper for std::future<AuthorizationResult>
// ---------------------------------------------------------------------------
struct FutureAuthorization {
    std::future<AuthorizationResult> fut;

    // Rethrows the denial, if any, as the matching Python exception
    AuthorizationResult result() {
        py::gil_scoped_release release;
        return fut.get();
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// ---------------------------------------------------------------------------
// bind_stores  --  cache and ledger store adapters
// ---------------------------------------------------------------------------
void bind_stores(py::module_& m) {
    py::class_<CacheStore, std::shared_ptr<CacheStore>>(m, "CacheStore");

    py::class_<InMemoryCacheStore, CacheStore, std::shared_ptr<InMemoryCacheStore>>(
        m, "InMemoryCacheStore")
        .def(py::init<>())
        .def("size", &InMemoryCacheStore::size);

    py::class_<LedgerStore, std::shared_ptr<LedgerStore>>(m, "LedgerStore");

    py::class_<InMemoryLedgerStore, LedgerStore, std::shared_ptr<InMemoryLedgerStore>>(
        m, "InMemoryLedgerStore")
        .def(py::init<>())
        .def("transaction_count", &InMemoryLedgerStore::transaction_count)
        .def("admin_event_count", &InMemoryLedgerStore::admin_event_count);

    py::class_<SqliteLedgerStore, LedgerStore, std::shared_ptr<SqliteLedgerStore>>(
        m, "SqliteLedgerStore")
        .def(py::init<const std::string&>(), py::arg("path"))
        .def("schema_version", &SqliteLedgerStore::schema_version)
        .def("path",           &SqliteLedgerStore::path);
}

// ---------------------------------------------------------------------------
// bind_core  --  FutureAuthorization, Treasury
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // FutureAuthorization
    // ===================================================================
    py::class_<FutureAuthorization>(m, "FutureAuthorization")
        .def("result", &FutureAuthorization::result,
             "Block until the authorization finishes (releases the GIL while waiting).")
        .def("ready",  &FutureAuthorization::ready,
             "Return True if the result is available without blocking.");

    // ===================================================================
    // Treasury
    // ===================================================================
    py::class_<Treasury>(m, "Treasury")
        .def(py::init([](Config config, std::shared_ptr<CacheStore> cache,
                         std::shared_ptr<LedgerStore> store) {
                 return std::make_unique<Treasury>(std::move(config), std::move(cache),
                                                   std::move(store));
             }),
             py::arg("config") = Config{},
             py::arg("cache") = py::none(),
             py::arg("store") = py::none())

        // ------------- Agent Lifecycle -------------
        .def("provision_agent", &Treasury::provision_agent,
             py::arg("agent_id"), py::arg("seed") = BudgetSeed{},
             py::arg("actor") = "system",
             py::call_guard<py::gil_scoped_release>())
        .def("set_agent_status", &Treasury::set_agent_status,
             py::arg("agent_id"), py::arg("status"),
             py::arg("actor"), py::arg("reason"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_budget",  &Treasury::get_budget, py::arg("agent_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("list_agents", &Treasury::list_agents,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Spending -------------
        .def("authorize",
             py::overload_cast<const std::string&, MinorUnits, const std::string&,
                               const Metadata&>(&Treasury::authorize),
             py::arg("agent_id"), py::arg("amount"),
             py::arg("description"), py::arg("metadata") = Metadata{},
             py::call_guard<py::gil_scoped_release>())
        .def("authorize_request",
             py::overload_cast<const SpendRequest&>(&Treasury::authorize),
             py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("authorize_async",
             [](Treasury& self, SpendRequest request) {
                 return FutureAuthorization{self.authorize_async(std::move(request))};
             },
             py::arg("request"))
        .def("credit", &Treasury::credit,
             py::arg("agent_id"), py::arg("amount"), py::arg("description"),
             py::arg("roi_data") = std::nullopt,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Emergency Stop -------------
        .def("freeze",   &Treasury::freeze, py::arg("reason"), py::arg("actor"),
             py::call_guard<py::gil_scoped_release>())
        .def("unfreeze", &Treasury::unfreeze, py::arg("reason"), py::arg("actor"),
             py::call_guard<py::gil_scoped_release>())
        .def("is_frozen",     &Treasury::is_frozen)
        .def("breaker_state", &Treasury::breaker_state)

        // ------------- Audit Trail -------------
        .def("get_transactions", &Treasury::get_transactions,
             py::arg("agent_id"), py::arg("range") = TimeRange::all(),
             py::arg("limit") = 0,
             py::call_guard<py::gil_scoped_release>())
        .def("recent_activity", &Treasury::recent_activity,
             py::arg("agent_id"), py::arg("limit") = 50)
        .def("get_admin_events", &Treasury::get_admin_events,
             py::arg("range") = TimeRange::all(), py::arg("limit") = 0,
             py::call_guard<py::gil_scoped_release>())
        .def("agent_totals", &Treasury::agent_totals, py::arg("agent_id"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Performance -------------
        .def("performance", &Treasury::performance, py::arg("agent_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("rescale", &Treasury::rescale,
             py::arg("agent_id"), py::arg("actor") = "performance_scaler",
             py::call_guard<py::gil_scoped_release>())
        .def("rescale_all", &Treasury::rescale_all,
             py::arg("actor") = "performance_scaler",
             py::call_guard<py::gil_scoped_release>())
        .def("run_daily_reset", &Treasury::run_daily_reset,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Queries -------------
        .def("economic_summary", &Treasury::economic_summary,
             py::call_guard<py::gil_scoped_release>())
        .def("status", &Treasury::status)

        // ------------- Configuration / Lifecycle -------------
        .def("add_monitor", &Treasury::add_monitor, py::arg("monitor"))
        .def("config", &Treasury::config, py::return_value_policy::copy)
        .def("start",      &Treasury::start)
        .def("stop",       &Treasury::stop, py::call_guard<py::gil_scoped_release>())
        .def("is_running", &Treasury::is_running)
        .def("flush",      &Treasury::flush, py::call_guard<py::gil_scoped_release>());
}
