#pragma once

// use a compact include style per user's preference
#include <bits/stdc++.h>
using namespace std;

using u8 = uint8_t;
using Bytes = vector<u8>;

class GGM {
public:
    static constexpr size_t NODE_SIZE = 16;
    static constexpr uint32_t MAX_HEIGHT = 32;

    using Layer = vector<Bytes>;
    using Tree = vector<Layer>;

    // Nodes revealed at one layer; indices and values are parallel arrays
    struct OpeningStep {
        uint32_t layer = 0;
        vector<uint32_t> indices;
        vector<Bytes> values;
    };

    using Proof = vector<OpeningStep>;
    using Recovered = vector<optional<Bytes>>;

    GGM(uint32_t M, uint32_t N, bool keep_empty_steps = true);

    // Layer-pruning planner; all three throw invalid_argument for M == 0 or N == 0
    static uint32_t height(uint32_t M, uint32_t N);
    static vector<uint32_t> abandon_layers(uint32_t M, uint32_t N);
    static vector<uint64_t> layer_sizes(uint32_t M, uint32_t N);

    // G: {0,1}^128 -> {0,1}^256 via SHAKE-256, split as left || right
    static void split(const Bytes& node, Bytes& left, Bytes& right);

    static Bytes generate_seed();
    static void wipe(Tree& tree);

    bool build(const Bytes& seed, Tree& tree) const;
    bool open(const Tree& tree, const vector<uint32_t>& challenge, Proof& proof) const;
    bool verify(const Proof& proof, Recovered& leaves) const;

    static Bytes serialize_proof(const Proof& proof);
    static bool deserialize_proof(const Bytes& data, Proof& proof);
    static size_t proof_size(const Proof& proof);

    uint32_t get_M() const;
    uint32_t get_N() const;
    uint32_t get_height() const;
    uint64_t get_leaf_count() const;
    const vector<uint64_t>& get_layer_sizes() const;

    void set_verbose(bool v);

private:
    void expand_to_leaves(const Bytes& node, uint32_t layer, uint64_t index,
                          uint64_t& first_leaf, vector<Bytes>& leaves) const;
    bool check_step_layers(const Proof& proof) const;

    uint32_t M = 1;
    uint32_t N = 1;
    uint32_t H = 0;
    bool keep_empty_steps = true;
    bool verbose = false;
    vector<uint64_t> sizes;
    set<uint32_t> abandoned;
};

void print_bytes(const Bytes& data);
Bytes hex_to_bytes(const string &hex);

