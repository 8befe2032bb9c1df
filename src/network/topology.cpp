#include "network/topology.h"
#include <algorithm>
#include <cstdio>
#include <utility>

namespace syncfield {

namespace {

constexpr int REWIRE_MAX_ATTEMPTS = 100;

Network finish(Matrix adjacency, TopologyType type, const TopologyParams& params) {
    Network net;
    net.edges = extract_edges(adjacency);
    net.adjacency = std::move(adjacency);
    net.type = type;
    net.params = params;
    return net;
}

bool contains(const std::vector<size_t>& v, size_t x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

} // namespace

// =============================================================================
// All-to-all
// =============================================================================

Network create_all_to_all(size_t n) {
    Matrix adj(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i != j) adj.at(i, j) = 1.0;
        }
    }
    return finish(std::move(adj), TopologyType::ALL_TO_ALL, TopologyParams{});
}

// =============================================================================
// Erdős-Rényi: one Bernoulli trial per unordered pair
// =============================================================================

Network create_random(size_t n, double p, RandomSource& rng) {
    Matrix adj(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (rng.next_uniform() < p) {
                adj.set_symmetric(i, j, 1.0);
            }
        }
    }
    TopologyParams params;
    params.p = p;
    return finish(std::move(adj), TopologyType::RANDOM, params);
}

// =============================================================================
// Watts-Strogatz
// =============================================================================

Network create_small_world(size_t n, int k, double beta, RandomSource& rng) {
    Matrix adj(n);
    const long nn = static_cast<long>(n);

    // 1. Ring lattice, offsets 1..k/2 (integer division: odd k drops one offset)
    for (long i = 0; i < nn; ++i) {
        for (long j = 1; j <= k / 2; ++j) {
            long nb1 = (i + j) % nn;
            long nb2 = ((i - j) % nn + nn) % nn;
            size_t ui = static_cast<size_t>(i);
            if (nb1 != i) adj.set_symmetric(ui, static_cast<size_t>(nb1), 1.0);
            if (nb2 != i && nb2 != nb1) adj.set_symmetric(ui, static_cast<size_t>(nb2), 1.0);
        }
    }

    // 2. Rewire each lattice edge (i, j) to (i, t) with probability beta
    std::vector<Edge> lattice = extract_edges(adj);
    for (const auto& e : lattice) {
        if (rng.next_uniform() >= beta) continue;

        size_t i = e.source;
        size_t j = e.target;
        adj.set_symmetric(i, j, 0.0);

        bool placed = false;
        for (int attempt = 0; attempt < REWIRE_MAX_ATTEMPTS; ++attempt) {
            size_t t = rng.next_index(n);
            if (t == i || adj.at(i, t) != 0.0) continue;
            adj.set_symmetric(i, t, 1.0);
            placed = true;
            break;
        }
        // No free target: keep the original edge so the edge count is preserved
        if (!placed) adj.set_symmetric(i, j, 1.0);
    }

    TopologyParams params;
    params.k = k;
    params.beta = beta;
    return finish(std::move(adj), TopologyType::SMALL_WORLD, params);
}

// =============================================================================
// Barabási-Albert
// =============================================================================

Network create_scale_free(size_t n, int m, RandomSource& rng) {
    Matrix adj(n);
    const size_t mm = m > 0 ? static_cast<size_t>(m) : 0;
    const size_t m0 = std::min(mm + 1, n);

    std::vector<double> degree(n, 0.0);

    // Seed: complete graph on m0 nodes
    for (size_t i = 0; i < m0; ++i) {
        for (size_t j = i + 1; j < m0; ++j) {
            adj.set_symmetric(i, j, 1.0);
            degree[i] += 1.0;
            degree[j] += 1.0;
        }
    }

    std::vector<size_t> targets;
    for (size_t i = m0; i < n; ++i) {
        double total_degree = 0.0;
        for (size_t j = 0; j < i; ++j) total_degree += degree[j];

        const size_t want = std::min(mm, i);
        targets.clear();
        while (targets.size() < want) {
            // Roulette wheel over cumulative degree
            double r = rng.next_uniform() * total_degree;
            double sum = 0.0;
            for (size_t j = 0; j < i; ++j) {
                sum += degree[j];
                if (sum >= r && !contains(targets, j)) {
                    targets.push_back(j);
                    break;
                }
            }

            // Fallback: uniform pick when the roulette pass came up short
            if (targets.size() < want) {
                size_t t = rng.next_index(i);
                if (!contains(targets, t)) targets.push_back(t);
            }
        }

        for (size_t t : targets) {
            adj.set_symmetric(i, t, 1.0);
            degree[i] += 1.0;
            degree[t] += 1.0;
        }
    }

    TopologyParams params;
    params.m = m;
    return finish(std::move(adj), TopologyType::SCALE_FREE, params);
}

// =============================================================================
// Ring lattice
// =============================================================================

Network create_ring(size_t n, int k) {
    Matrix adj(n);
    for (size_t i = 0; i < n; ++i) {
        for (int j = 1; j <= k; ++j) {
            size_t nb = (i + static_cast<size_t>(j)) % n;
            if (nb != i) adj.set_symmetric(i, nb, 1.0);
        }
    }
    TopologyParams params;
    params.k = k;
    return finish(std::move(adj), TopologyType::RING, params);
}

Network create_network(TopologyType type, size_t n,
                       const TopologyParams& params, RandomSource& rng) {
    switch (type) {
        case TopologyType::ALL_TO_ALL:  return create_all_to_all(n);
        case TopologyType::RANDOM:      return create_random(n, params.p, rng);
        case TopologyType::SMALL_WORLD: return create_small_world(n, params.k, params.beta, rng);
        case TopologyType::SCALE_FREE:  return create_scale_free(n, params.m, rng);
        case TopologyType::RING:        return create_ring(n, params.k);
        case TopologyType::CUSTOM:      break;
    }
    return finish(Matrix(n), TopologyType::CUSTOM, params);
}

// =============================================================================
// Helpers
// =============================================================================

std::vector<Edge> extract_edges(const Matrix& adjacency) {
    std::vector<Edge> edges;
    const size_t n = adjacency.size();
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (adjacency.at(i, j) != 0.0) {
                edges.push_back({static_cast<uint32_t>(i), static_cast<uint32_t>(j)});
            }
        }
    }
    return edges;
}

NetworkStats network_stats(const Matrix& adjacency) {
    NetworkStats s;
    const size_t n = adjacency.size();
    if (n == 0) return s;

    s.degrees.assign(n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i != j && adjacency.at(i, j) != 0.0) s.degrees[i]++;
        }
    }

    size_t total = 0;
    for (size_t d : s.degrees) total += d;
    s.avg_degree = static_cast<double>(total) / static_cast<double>(n);
    s.max_degree = *std::max_element(s.degrees.begin(), s.degrees.end());
    s.min_degree = *std::min_element(s.degrees.begin(), s.degrees.end());
    return s;
}

const char* topology_name(TopologyType type) {
    switch (type) {
        case TopologyType::ALL_TO_ALL:  return "all-to-all";
        case TopologyType::RANDOM:      return "random";
        case TopologyType::SMALL_WORLD: return "small-world";
        case TopologyType::SCALE_FREE:  return "scale-free";
        case TopologyType::RING:        return "ring";
        case TopologyType::CUSTOM:      return "custom";
    }
    return "custom";
}

bool parse_topology(const std::string& name, TopologyType& out) {
    static const TopologyType all[] = {
        TopologyType::ALL_TO_ALL, TopologyType::RANDOM, TopologyType::SMALL_WORLD,
        TopologyType::SCALE_FREE, TopologyType::RING,   TopologyType::CUSTOM,
    };
    for (TopologyType t : all) {
        if (name == topology_name(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

std::string network_summary(const Network& net) {
    NetworkStats s = network_stats(net.adjacency);
    char buf[160];
    snprintf(buf, sizeof(buf), "%s N=%zu E=%zu deg=%.2f [%zu,%zu]",
             topology_name(net.type), net.n_nodes(), net.n_edges(),
             s.avg_degree, s.min_degree, s.max_degree);
    return std::string(buf);
}

} // namespace syncfield
