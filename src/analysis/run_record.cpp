#include "analysis/run_record.h"
#include "engine/kuramoto_engine.h"
#include "engine/attention_field.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace syncfield {

namespace {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// JSON has no NaN/Inf
void write_number(std::ostringstream& ss, double v) {
    if (std::isfinite(v)) ss << v;
    else                  ss << "null";
}

NetworkDescriptor describe_degrees(const CouplingWeights& weights) {
    NetworkDescriptor d;
    const size_t n = weights.size();
    if (n == 0) return d;
    size_t total = 0;
    d.min_degree = weights.neighbors(0).size();
    for (size_t i = 0; i < n; ++i) {
        size_t deg = weights.neighbors(i).size();
        total += deg;
        d.max_degree = std::max(d.max_degree, deg);
        d.min_degree = std::min(d.min_degree, deg);
    }
    d.avg_degree = static_cast<double>(total) / static_cast<double>(n);
    return d;
}

} // namespace

// =============================================================================
// Id / timestamp
// =============================================================================

std::string generate_run_id() {
    using namespace std::chrono;
    const long long ms = duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();

    static const char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);

    std::string suffix(9, '0');
    for (auto& c : suffix) c = ALPHABET[pick(gen)];
    return "run_" + std::to_string(ms) + "_" + suffix;
}

std::string iso_timestamp_now() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const long long ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &secs);
#else
    gmtime_r(&secs, &utc);
#endif
    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
             utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
             utc.tm_hour, utc.tm_min, utc.tm_sec, ms);
    return std::string(buf);
}

// =============================================================================
// Builders
// =============================================================================

RunRecord make_run_record(const KuramotoEngine& engine,
                          const std::string& name, const std::string& notes) {
    RunRecord rec;
    rec.id = generate_run_id();
    rec.timestamp = iso_timestamp_now();
    rec.mode = "kuramoto";
    rec.notes = notes;

    rec.parameters = {
        {"N",           static_cast<double>(engine.size())},
        {"K",           engine.K()},
        {"dt",          engine.dt()},
        {"noise_level", engine.noise_level()},
        {"phase_lag",   engine.phase_lag()},
        {"steps",       static_cast<double>(engine.history().size() +
                                            engine.history().evicted())},
        {"time",        engine.time()},
    };

    if (engine.has_network()) {
        NetworkStats st = network_stats(engine.adjacency());
        rec.network.avg_degree = st.avg_degree;
        rec.network.max_degree = st.max_degree;
        rec.network.min_degree = st.min_degree;
        rec.network.has_params = engine.topology_type() != TopologyType::CUSTOM;
    } else {
        // Implicit all-to-all: every node sees the other N-1
        const size_t deg = engine.size() - 1;
        rec.network.avg_degree = static_cast<double>(deg);
        rec.network.max_degree = deg;
        rec.network.min_degree = deg;
    }
    rec.network.type = topology_name(engine.topology_type());
    rec.network.params = engine.topology_params();

    rec.metrics = compute_run_metrics(engine.time_series(), engine.order_parameter_series());

    if (name.empty()) {
        char buf[96];
        snprintf(buf, sizeof(buf), "%s N=%zu K=%.2f",
                 rec.network.type.c_str(), engine.size(), engine.K());
        rec.name = buf;
    } else {
        rec.name = name;
    }
    return rec;
}

RunRecord make_run_record(const AttentionFieldEngine& engine,
                          const std::string& name, const std::string& notes) {
    const AttentionFieldConfig& cfg = engine.config();

    RunRecord rec;
    rec.id = generate_run_id();
    rec.timestamp = iso_timestamp_now();
    rec.mode = "attention";
    rec.notes = notes;

    rec.parameters = {
        {"grid_size",     static_cast<double>(cfg.grid_size)},
        {"K",             cfg.K},
        {"dt",            cfg.dt},
        {"noise_level",   cfg.noise_level},
        {"phase_lag",     cfg.phase_lag},
        {"K_stim",        cfg.K_stim},
        {"K_feat",        cfg.K_feat},
        {"spatial_range", cfg.spatial_range},
        {"spatial_decay", cfg.spatial_decay},
        {"num_features",  static_cast<double>(cfg.num_features)},
        {"objects",       static_cast<double>(engine.stimulus_objects().size())},
        {"time",          engine.time()},
    };

    NetworkDescriptor d = describe_degrees(engine.active_coupling());
    d.type = engine.network_label();
    d.params = engine.topology_params();
    d.has_params = engine.has_network() && engine.topology_type() != TopologyType::CUSTOM;
    rec.network = d;

    rec.metrics = compute_run_metrics(engine.time_series(), engine.mean_attention_series());

    if (name.empty()) {
        char buf[96];
        snprintf(buf, sizeof(buf), "attention %dx%d K=%.2f",
                 cfg.grid_size, cfg.grid_size, cfg.K);
        rec.name = buf;
    } else {
        rec.name = name;
    }
    return rec;
}

// =============================================================================
// JSON
// =============================================================================

std::string RunRecord::to_json() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);
    ss << "{\n";
    ss << "  \"id\": \"" << json_escape(id) << "\",\n";
    ss << "  \"timestamp\": \"" << json_escape(timestamp) << "\",\n";
    ss << "  \"name\": \"" << json_escape(name) << "\",\n";
    ss << "  \"mode\": \"" << json_escape(mode) << "\",\n";

    ss << "  \"parameters\": {\n";
    for (size_t i = 0; i < parameters.size(); ++i) {
        ss << "    \"" << json_escape(parameters[i].first) << "\": ";
        write_number(ss, parameters[i].second);
        if (i + 1 < parameters.size()) ss << ",";
        ss << "\n";
    }
    ss << "  },\n";

    ss << "  \"network\": {\n";
    ss << "    \"type\": \"" << json_escape(network.type) << "\",\n";
    if (network.has_params) {
        ss << "    \"params\": {\"p\": ";
        write_number(ss, network.params.p);
        ss << ", \"k\": " << network.params.k << ", \"beta\": ";
        write_number(ss, network.params.beta);
        ss << ", \"m\": " << network.params.m << "},\n";
    }
    ss << "    \"avg_degree\": ";
    write_number(ss, network.avg_degree);
    ss << ",\n";
    ss << "    \"max_degree\": " << network.max_degree << ",\n";
    ss << "    \"min_degree\": " << network.min_degree << "\n";
    ss << "  },\n";

    ss << "  \"metrics\": {\n";
    ss << "    \"final_r\": ";       write_number(ss, metrics.final_r); ss << ",\n";
    ss << "    \"mean_r\": ";        write_number(ss, metrics.mean_r);  ss << ",\n";
    ss << "    \"std_r\": ";         write_number(ss, metrics.std_r);   ss << ",\n";
    ss << "    \"min_r\": ";         write_number(ss, metrics.min_r);   ss << ",\n";
    ss << "    \"max_r\": ";         write_number(ss, metrics.max_r);   ss << ",\n";
    ss << "    \"settling_time\": ";
    if (metrics.settling_time) write_number(ss, *metrics.settling_time);
    else                       ss << "null";
    ss << ",\n";
    ss << "    \"converged\": " << (metrics.converged ? "true" : "false") << ",\n";
    ss << "    \"oscillating\": " << (metrics.oscillating ? "true" : "false") << "\n";
    ss << "  },\n";

    ss << "  \"notes\": \"" << json_escape(notes) << "\"\n";
    ss << "}";
    return ss.str();
}

} // namespace syncfield
