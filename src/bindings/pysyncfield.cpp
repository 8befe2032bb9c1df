/**
 * pysyncfield — Python bindings for the SyncField oscillator engines
 *
 * Exposes KuramotoEngine, AttentionFieldEngine, the topology generators and
 * run metrics to Python via pybind11. Phases, attention maps and adjacency
 * matrices come back as numpy arrays for plotting.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "core/errors.h"
#include "core/random_source.h"
#include "network/topology.h"
#include "engine/kuramoto_engine.h"
#include "engine/attention_field.h"
#include "analysis/run_metrics.h"
#include "analysis/run_record.h"

namespace py = pybind11;
using namespace syncfield;

// Helper: 1-D vector → numpy float64 array (copy)
static py::array_t<double> vec_to_numpy(const std::vector<double>& v) {
    return py::array_t<double>(
        {static_cast<py::ssize_t>(v.size())},
        v.data()
    );
}

// Helper: Matrix → numpy (N, N) array (copy)
static py::array_t<double> matrix_to_numpy(const Matrix& m) {
    const auto n = static_cast<py::ssize_t>(m.size());
    return py::array_t<double>({n, n}, m.data().data());
}

// Helper: numpy (N, N) array → Matrix
static Matrix numpy_to_matrix(py::array_t<double, py::array::c_style | py::array::forcecast> a) {
    if (a.ndim() != 2 || a.shape(0) != a.shape(1)) {
        throw TopologyMismatchError("adjacency must be a square 2-D array");
    }
    const size_t n = static_cast<size_t>(a.shape(0));
    Matrix m(n);
    auto r = a.unchecked<2>();
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < n; ++j)
            m.at(i, j) = r(static_cast<py::ssize_t>(i), static_cast<py::ssize_t>(j));
    return m;
}

// Helper: attention map reshaped to (grid, grid)
static py::array_t<double> map_to_numpy(const std::vector<double>& map, size_t grid) {
    const auto g = static_cast<py::ssize_t>(grid);
    return py::array_t<double>({g, g}, map.data());
}

PYBIND11_MODULE(pysyncfield, m) {
    m.doc() = "SyncField coupled-oscillator engine Python bindings";

    // Both derive std::invalid_argument; Python sees ValueError subclasses
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<TopologyMismatchError>(m, "TopologyMismatchError", PyExc_ValueError);

    // =========================================================================
    // Phase helpers
    // =========================================================================
    m.def("wrap_phase", &wrap_phase, py::arg("theta"), "Wrap a phase into (-pi, pi]");
    m.def("phase_difference", &phase_difference, py::arg("a"), py::arg("b"));
    m.def("order_parameter", [](const std::vector<double>& theta) {
        return order_parameter(theta);
    }, py::arg("theta"), "Kuramoto order parameter r = |<exp(i theta)>|");

    // =========================================================================
    // Topology
    // =========================================================================
    py::enum_<TopologyType>(m, "TopologyType")
        .value("ALL_TO_ALL",  TopologyType::ALL_TO_ALL)
        .value("RANDOM",      TopologyType::RANDOM)
        .value("SMALL_WORLD", TopologyType::SMALL_WORLD)
        .value("SCALE_FREE",  TopologyType::SCALE_FREE)
        .value("RING",        TopologyType::RING)
        .value("CUSTOM",      TopologyType::CUSTOM);

    py::class_<TopologyParams>(m, "TopologyParams")
        .def(py::init<>())
        .def_readwrite("p",    &TopologyParams::p)
        .def_readwrite("k",    &TopologyParams::k)
        .def_readwrite("beta", &TopologyParams::beta)
        .def_readwrite("m",    &TopologyParams::m);

    py::class_<Edge>(m, "Edge")
        .def_readonly("source", &Edge::source)
        .def_readonly("target", &Edge::target)
        .def("__repr__", [](const Edge& e) {
            return "Edge(" + std::to_string(e.source) + ", " + std::to_string(e.target) + ")";
        });

    py::class_<Network>(m, "Network")
        .def_readonly("edges",  &Network::edges)
        .def_readonly("type",   &Network::type)
        .def_readonly("params", &Network::params)
        .def("adjacency", [](const Network& n) { return matrix_to_numpy(n.adjacency); },
             "Adjacency matrix as numpy (N, N) array")
        .def("n_nodes", &Network::n_nodes)
        .def("n_edges", &Network::n_edges)
        .def("__repr__", [](const Network& n) { return network_summary(n); });

    py::class_<NetworkStats>(m, "NetworkStats")
        .def_readonly("avg_degree", &NetworkStats::avg_degree)
        .def_readonly("max_degree", &NetworkStats::max_degree)
        .def_readonly("min_degree", &NetworkStats::min_degree)
        .def_readonly("degrees",    &NetworkStats::degrees);

    m.def("create_all_to_all", &create_all_to_all, py::arg("n"));
    m.def("create_ring", &create_ring, py::arg("n"), py::arg("k") = 2);
    m.def("create_random", [](size_t n, double p, uint32_t seed) {
        MersenneSource rng(seed);
        return create_random(n, p, rng);
    }, py::arg("n"), py::arg("p") = 0.1, py::arg("seed") = 42);
    m.def("create_small_world", [](size_t n, int k, double beta, uint32_t seed) {
        MersenneSource rng(seed);
        return create_small_world(n, k, beta, rng);
    }, py::arg("n"), py::arg("k") = 4, py::arg("beta") = 0.1, py::arg("seed") = 42);
    m.def("create_scale_free", [](size_t n, int m_edges, uint32_t seed) {
        MersenneSource rng(seed);
        return create_scale_free(n, m_edges, rng);
    }, py::arg("n"), py::arg("m") = 2, py::arg("seed") = 42);
    m.def("create_network", [](TopologyType type, size_t n, const TopologyParams& params,
                               uint32_t seed) {
        MersenneSource rng(seed);
        return create_network(type, n, params, rng);
    }, py::arg("type"), py::arg("n"), py::arg("params") = TopologyParams{},
       py::arg("seed") = 42);
    m.def("network_stats", [](py::array_t<double> adjacency) {
        return network_stats(numpy_to_matrix(adjacency));
    }, py::arg("adjacency"));
    m.def("topology_name", [](TopologyType t) { return std::string(topology_name(t)); });

    // =========================================================================
    // KuramotoEngine
    // =========================================================================
    py::class_<KuramotoConfig>(m, "KuramotoConfig")
        .def(py::init<>())
        .def_readwrite("n",           &KuramotoConfig::n)
        .def_readwrite("K",           &KuramotoConfig::K)
        .def_readwrite("dt",          &KuramotoConfig::dt)
        .def_readwrite("noise_level", &KuramotoConfig::noise_level)
        .def_readwrite("phase_lag",   &KuramotoConfig::phase_lag)
        .def_readwrite("omega_std",   &KuramotoConfig::omega_std)
        .def_readwrite("history_cap", &KuramotoConfig::history_cap)
        .def_readwrite("seed",        &KuramotoConfig::seed);

    py::class_<KuramotoUpdate>(m, "KuramotoUpdate")
        .def(py::init<>())
        .def_readwrite("n",           &KuramotoUpdate::n)
        .def_readwrite("K",           &KuramotoUpdate::K)
        .def_readwrite("dt",          &KuramotoUpdate::dt)
        .def_readwrite("noise_level", &KuramotoUpdate::noise_level)
        .def_readwrite("phase_lag",   &KuramotoUpdate::phase_lag);

    py::class_<KuramotoState>(m, "KuramotoState")
        .def_readonly("theta",           &KuramotoState::theta)
        .def_readonly("omega",           &KuramotoState::omega)
        .def_readonly("time",            &KuramotoState::time)
        .def_readonly("order_parameter", &KuramotoState::order_parameter)
        .def_readonly("n",               &KuramotoState::n)
        .def_readonly("K",               &KuramotoState::K);

    py::class_<KuramotoEngine>(m, "KuramotoEngine",
        "Population of coupled phase oscillators (RK4)")
        .def(py::init([](const KuramotoConfig& config) {
            return std::make_unique<KuramotoEngine>(config);
        }), py::arg("config") = KuramotoConfig{})
        .def("initialize", &KuramotoEngine::initialize)
        .def("step", &KuramotoEngine::step)
        .def("run", &KuramotoEngine::run, py::arg("n_steps"))
        .def("update_parameters", &KuramotoEngine::update_parameters, py::arg("update"))
        .def("set_network", static_cast<void (KuramotoEngine::*)(const Network&)>(
             &KuramotoEngine::set_network), py::arg("network"))
        .def("set_adjacency", [](KuramotoEngine& e, py::array_t<double> adjacency) {
            e.set_network(numpy_to_matrix(adjacency));
        }, py::arg("adjacency"), "Replace coupling with a custom (N, N) matrix")
        .def("clear_network", &KuramotoEngine::clear_network)
        .def("has_network", &KuramotoEngine::has_network)
        .def("topology_type", &KuramotoEngine::topology_type)
        .def("adjacency", [](const KuramotoEngine& e) { return matrix_to_numpy(e.adjacency()); })
        .def("order_parameter", &KuramotoEngine::order_parameter)
        .def("state", &KuramotoEngine::state)
        .def("theta", [](const KuramotoEngine& e) { return vec_to_numpy(e.theta()); })
        .def("omega", [](const KuramotoEngine& e) { return vec_to_numpy(e.omega()); })
        .def("time_series", [](const KuramotoEngine& e) { return vec_to_numpy(e.time_series()); })
        .def("order_parameter_series", [](const KuramotoEngine& e) {
            return vec_to_numpy(e.order_parameter_series());
        })
        .def("size", &KuramotoEngine::size)
        .def("time", &KuramotoEngine::time)
        .def("config", &KuramotoEngine::config)
        .def("__repr__", &KuramotoEngine::summary);

    // =========================================================================
    // Stimulus objects
    // =========================================================================
    py::class_<StimulusObject>(m, "StimulusObject")
        .def_readonly("id",        &StimulusObject::id)
        .def_readonly("x",         &StimulusObject::x)
        .def_readonly("y",         &StimulusObject::y)
        .def_readonly("vx",        &StimulusObject::vx)
        .def_readonly("vy",        &StimulusObject::vy)
        .def_readonly("radius",    &StimulusObject::radius)
        .def_readonly("intensity", &StimulusObject::intensity)
        .def_readonly("features",  &StimulusObject::features);

    py::class_<StimulusObjectConfig>(m, "StimulusObjectConfig")
        .def(py::init<>())
        .def_readwrite("id",        &StimulusObjectConfig::id)
        .def_readwrite("x",         &StimulusObjectConfig::x)
        .def_readwrite("y",         &StimulusObjectConfig::y)
        .def_readwrite("vx",        &StimulusObjectConfig::vx)
        .def_readwrite("vy",        &StimulusObjectConfig::vy)
        .def_readwrite("radius",    &StimulusObjectConfig::radius)
        .def_readwrite("intensity", &StimulusObjectConfig::intensity)
        .def_readwrite("features",  &StimulusObjectConfig::features);

    py::class_<TrackedObject>(m, "TrackedObject")
        .def_readonly("id",        &TrackedObject::id)
        .def_readonly("attention", &TrackedObject::attention)
        .def_readonly("x",         &TrackedObject::x)
        .def_readonly("y",         &TrackedObject::y);

    // =========================================================================
    // AttentionFieldEngine
    // =========================================================================
    py::class_<AttentionFieldConfig>(m, "AttentionFieldConfig")
        .def(py::init<>())
        .def_readwrite("grid_size",     &AttentionFieldConfig::grid_size)
        .def_readwrite("K",             &AttentionFieldConfig::K)
        .def_readwrite("dt",            &AttentionFieldConfig::dt)
        .def_readwrite("noise_level",   &AttentionFieldConfig::noise_level)
        .def_readwrite("phase_lag",     &AttentionFieldConfig::phase_lag)
        .def_readwrite("K_stim",        &AttentionFieldConfig::K_stim)
        .def_readwrite("K_feat",        &AttentionFieldConfig::K_feat)
        .def_readwrite("spatial_range", &AttentionFieldConfig::spatial_range)
        .def_readwrite("spatial_decay", &AttentionFieldConfig::spatial_decay)
        .def_readwrite("num_features",  &AttentionFieldConfig::num_features)
        .def_readwrite("omega_std",     &AttentionFieldConfig::omega_std)
        .def_readwrite("history_cap",   &AttentionFieldConfig::history_cap)
        .def_readwrite("seed",          &AttentionFieldConfig::seed);

    py::class_<AttentionUpdate>(m, "AttentionUpdate")
        .def(py::init<>())
        .def_readwrite("grid_size",     &AttentionUpdate::grid_size)
        .def_readwrite("K",             &AttentionUpdate::K)
        .def_readwrite("dt",            &AttentionUpdate::dt)
        .def_readwrite("noise_level",   &AttentionUpdate::noise_level)
        .def_readwrite("phase_lag",     &AttentionUpdate::phase_lag)
        .def_readwrite("K_stim",        &AttentionUpdate::K_stim)
        .def_readwrite("K_feat",        &AttentionUpdate::K_feat)
        .def_readwrite("spatial_range", &AttentionUpdate::spatial_range)
        .def_readwrite("spatial_decay", &AttentionUpdate::spatial_decay);

    py::class_<AttentionState>(m, "AttentionState")
        .def_readonly("theta",         &AttentionState::theta)
        .def_readonly("stimulus",      &AttentionState::stimulus)
        .def_readonly("features",      &AttentionState::features)
        .def_readonly("attention_map", &AttentionState::attention_map)
        .def_readonly("objects",       &AttentionState::objects)
        .def_readonly("tracked",       &AttentionState::tracked)
        .def_readonly("time",          &AttentionState::time)
        .def_readonly("grid_size",     &AttentionState::grid_size);

    py::class_<AttentionFieldEngine>(m, "AttentionFieldEngine",
        "2-D grid of oscillators with stimulus- and feature-gated coupling")
        .def(py::init([](const AttentionFieldConfig& config) {
            return std::make_unique<AttentionFieldEngine>(config);
        }), py::arg("config") = AttentionFieldConfig{})
        .def("initialize", &AttentionFieldEngine::initialize)
        .def("step", &AttentionFieldEngine::step)
        .def("run", &AttentionFieldEngine::run, py::arg("n_steps"))
        .def("update_parameters", &AttentionFieldEngine::update_parameters, py::arg("update"))
        .def("set_network", static_cast<void (AttentionFieldEngine::*)(const Network&)>(
             &AttentionFieldEngine::set_network), py::arg("network"))
        .def("set_adjacency", [](AttentionFieldEngine& e, py::array_t<double> adjacency) {
            e.set_network(numpy_to_matrix(adjacency));
        }, py::arg("adjacency"))
        .def("clear_network", &AttentionFieldEngine::clear_network)
        .def("has_network", &AttentionFieldEngine::has_network)
        .def("network_label", &AttentionFieldEngine::network_label)
        .def("add_stimulus_object", &AttentionFieldEngine::add_stimulus_object,
             py::arg("config") = StimulusObjectConfig{}, "Add a moving stimulus, returns its id")
        .def("remove_stimulus_object", &AttentionFieldEngine::remove_stimulus_object,
             py::arg("id"))
        .def("clear_stimulus_objects", &AttentionFieldEngine::clear_stimulus_objects)
        .def("stimulus_objects", &AttentionFieldEngine::stimulus_objects)
        .def("attention_map", [](const AttentionFieldEngine& e) {
            return map_to_numpy(e.attention_map(), e.grid_size());
        }, "Local order parameter per cell as (grid, grid) array")
        .def("stimulus", [](const AttentionFieldEngine& e) {
            return map_to_numpy(e.field().stimulus(), e.grid_size());
        })
        .def("detect_tracked_objects", [](const AttentionFieldEngine& e) {
            return e.detect_tracked_objects();
        })
        .def("state", &AttentionFieldEngine::state)
        .def("theta", [](const AttentionFieldEngine& e) { return vec_to_numpy(e.theta()); })
        .def("time_series", [](const AttentionFieldEngine& e) {
            return vec_to_numpy(e.time_series());
        })
        .def("mean_attention_series", [](const AttentionFieldEngine& e) {
            return vec_to_numpy(e.mean_attention_series());
        })
        .def("render_ascii", [](const AttentionFieldEngine& e) {
            return e.render_ascii(e.attention_map());
        })
        .def("grid_size", &AttentionFieldEngine::grid_size)
        .def("time", &AttentionFieldEngine::time)
        .def("config", &AttentionFieldEngine::config)
        .def("__repr__", &AttentionFieldEngine::summary);

    // =========================================================================
    // Run metrics + record
    // =========================================================================
    py::class_<RunMetrics>(m, "RunMetrics")
        .def_readonly("final_r",       &RunMetrics::final_r)
        .def_readonly("mean_r",        &RunMetrics::mean_r)
        .def_readonly("std_r",         &RunMetrics::std_r)
        .def_readonly("min_r",         &RunMetrics::min_r)
        .def_readonly("max_r",         &RunMetrics::max_r)
        .def_readonly("settling_time", &RunMetrics::settling_time)
        .def_readonly("converged",     &RunMetrics::converged)
        .def_readonly("oscillating",   &RunMetrics::oscillating)
        .def("__repr__", &RunMetrics::summary);

    m.def("compute_run_metrics", &compute_run_metrics, py::arg("time"), py::arg("r"));
    m.def("estimate_critical_coupling", &estimate_critical_coupling, py::arg("type"));
    m.def("classify_sync_state", [](double r) { return std::string(classify_sync_state(r)); },
          py::arg("final_r"));
    m.def("classify_regime", [](double K, TopologyType t) {
        return std::string(classify_regime(K, t));
    }, py::arg("K"), py::arg("type"));

    py::class_<RunRecord>(m, "RunRecord")
        .def_readonly("id",         &RunRecord::id)
        .def_readonly("timestamp",  &RunRecord::timestamp)
        .def_readwrite("name",      &RunRecord::name)
        .def_readonly("mode",       &RunRecord::mode)
        .def_readonly("parameters", &RunRecord::parameters)
        .def_readonly("metrics",    &RunRecord::metrics)
        .def_readwrite("notes",     &RunRecord::notes)
        .def("to_json", &RunRecord::to_json);

    m.def("make_run_record",
          static_cast<RunRecord (*)(const KuramotoEngine&, const std::string&, const std::string&)>(
              &make_run_record),
          py::arg("engine"), py::arg("name") = "", py::arg("notes") = "");
    m.def("make_run_record",
          static_cast<RunRecord (*)(const AttentionFieldEngine&, const std::string&,
                                    const std::string&)>(&make_run_record),
          py::arg("engine"), py::arg("name") = "", py::arg("notes") = "");
}
