#include "ggm.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

using namespace std;

namespace {

// RAII wrapper for the EVP digest context backing the PRG
struct MdCtx {
    EVP_MD_CTX *ctx = nullptr;
    MdCtx() : ctx(EVP_MD_CTX_new()) { if (!ctx) throw bad_alloc(); }
    MdCtx(const MdCtx&) = delete;
    MdCtx& operator=(const MdCtx&) = delete;
    ~MdCtx() { EVP_MD_CTX_free(ctx); }
};

uint32_t bit_length(uint32_t x) {
    return x == 0 ? 0 : 32 - static_cast<uint32_t>(__builtin_clz(x));
}

void cleanse_layer(vector<Bytes>& layer) {
    for (Bytes& node : layer) {
        if (!node.empty()) OPENSSL_cleanse(node.data(), node.size());
    }
    layer.clear();
}

void put_u32(Bytes& out, uint32_t v) {
    out.push_back(static_cast<u8>(v >> 24));
    out.push_back(static_cast<u8>(v >> 16));
    out.push_back(static_cast<u8>(v >> 8));
    out.push_back(static_cast<u8>(v));
}

bool get_u32(const Bytes& in, size_t& pos, uint32_t& v) {
    if (in.size() - pos < 4) return false;
    v = (static_cast<uint32_t>(in[pos]) << 24) |
        (static_cast<uint32_t>(in[pos + 1]) << 16) |
        (static_cast<uint32_t>(in[pos + 2]) << 8) |
        static_cast<uint32_t>(in[pos + 3]);
    pos += 4;
    return true;
}

} // namespace

GGM::GGM(uint32_t M_, uint32_t N_, bool keep_empty_steps_)
    : M(M_), N(N_), keep_empty_steps(keep_empty_steps_) {
    H = height(M, N);
    sizes = layer_sizes(M, N);
    vector<uint32_t> layers = abandon_layers(M, N);
    abandoned = set<uint32_t>(layers.begin(), layers.end());
}

// H = bitlength(M-1) + bitlength(N-1), i.e. each factor rounded up to a power of two.
// The cap applies to H itself, so (65537, 65535) is rejected even though M*N < 2^32.
uint32_t GGM::height(uint32_t M, uint32_t N) {
    if (M == 0 || N == 0) {
        throw invalid_argument("Invalid parameters: M and N must be >= 1");
    }
    uint32_t h = bit_length(M - 1) + bit_length(N - 1);
    if (h > MAX_HEIGHT) {
        throw invalid_argument("Invalid parameters: tree height " + to_string(h) +
                               " exceeds " + to_string(MAX_HEIGHT));
    }
    return h;
}

// One abandon layer per set bit of 2^H - M*N; bit i drops a node at layer H - i
vector<uint32_t> GGM::abandon_layers(uint32_t M, uint32_t N) {
    uint32_t h = height(M, N);
    uint64_t diff = (1ULL << h) - static_cast<uint64_t>(M) * N;
    vector<uint32_t> out;
    while (diff) {
        uint32_t i = 63 - static_cast<uint32_t>(__builtin_clzll(diff));
        out.push_back(h - i);
        diff ^= (1ULL << i);
    }
    return out;
}

vector<uint64_t> GGM::layer_sizes(uint32_t M, uint32_t N) {
    uint32_t h = height(M, N);
    vector<uint32_t> layers = abandon_layers(M, N);
    set<uint32_t> abandon(layers.begin(), layers.end());

    vector<uint64_t> out;
    out.reserve(h + 1);
    out.push_back(1);
    for (uint32_t d = 0; d < h; d++) {
        uint64_t s = out.back();
        uint64_t next = abandon.count(d + 1) ? 2 * s - 1 : 2 * s;
        if (next == 0) {
            throw runtime_error("Layer " + to_string(d + 1) + " collapsed to zero nodes");
        }
        out.push_back(next);
    }
    if (out.back() != static_cast<uint64_t>(M) * N) {
        throw runtime_error("Leaf layer size " + to_string(out.back()) + " != M*N");
    }
    return out;
}

// PRG G(k) = SHAKE-256(k) truncated to 2 * NODE_SIZE bytes
void GGM::split(const Bytes& node, Bytes& left, Bytes& right) {
    if (node.size() != NODE_SIZE) {
        throw invalid_argument("PRG input must be " + to_string(NODE_SIZE) + " bytes");
    }
    u8 stream[2 * NODE_SIZE];
    MdCtx md;
    bool ok = EVP_DigestInit_ex(md.ctx, EVP_shake256(), nullptr) == 1 &&
              EVP_DigestUpdate(md.ctx, node.data(), node.size()) == 1 &&
              EVP_DigestFinalXOF(md.ctx, stream, sizeof(stream)) == 1;
    if (!ok) {
        OPENSSL_cleanse(stream, sizeof(stream));
        throw runtime_error("SHAKE-256 evaluation failed");
    }
    left.assign(stream, stream + NODE_SIZE);
    right.assign(stream + NODE_SIZE, stream + 2 * NODE_SIZE);
    OPENSSL_cleanse(stream, sizeof(stream));
}

Bytes GGM::generate_seed() {
    Bytes seed(NODE_SIZE);
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) <= 0) {
        throw runtime_error("Failed to generate random bytes");
    }
    return seed;
}

void GGM::wipe(Tree& tree) {
    for (Layer& layer : tree) cleanse_layer(layer);
    tree.clear();
}

// GGM.Build: expand the root seed layer by layer, dropping the last node
// of every abandon layer so that the leaf layer holds exactly M*N nodes
bool GGM::build(const Bytes& seed, Tree& tree) const {
    if (verbose) cout << "\n=== GGM.Build(M=" << M << ", N=" << N << ") ===" << endl;

    wipe(tree);
    if (seed.size() != NODE_SIZE) {
        cerr << "Invalid seed length: " << seed.size() << " (expected " << NODE_SIZE << ")" << endl;
        return false;
    }

    tree.reserve(H + 1);
    tree.push_back(Layer{seed});
    for (uint32_t d = 0; d < H; d++) {
        const Layer& current = tree[d];
        Layer next;
        next.reserve(2 * current.size());
        for (const Bytes& node : current) {
            Bytes l, r;
            split(node, l, r);
            next.push_back(move(l));
            next.push_back(move(r));
        }
        if (abandoned.count(d + 1)) {
            OPENSSL_cleanse(next.back().data(), next.back().size());
            next.pop_back();
        }
        tree.push_back(move(next));
    }

    if (verbose) {
        cout << "Height H = " << H << ", abandon layers:";
        for (uint32_t a : abandoned) cout << " " << a;
        cout << endl << "Layer sizes:";
        for (const Layer& layer : tree) cout << " " << layer.size();
        cout << endl;
    }
    return true;
}

// GGM.Open: octopus opening of every leaf outside the challenge set.
// Walking from the leaves upwards, the siblings of the current targets that
// are not themselves targets are revealed; the parents of all targets form
// the targets of the next layer, so shared ancestors are paid for once.
bool GGM::open(const Tree& tree, const vector<uint32_t>& challenge, Proof& proof) const {
    if (verbose) cout << "\n=== GGM.Open(|A|=" << challenge.size() << ") ===" << endl;

    proof.clear();
    if (tree.size() != sizes.size()) {
        cerr << "Tree height " << (tree.empty() ? 0 : tree.size() - 1)
             << " does not match H = " << H << endl;
        return false;
    }
    for (size_t d = 0; d < tree.size(); d++) {
        if (tree[d].size() != sizes[d]) {
            cerr << "Layer " << d << " holds " << tree[d].size() << " nodes, expected " << sizes[d] << endl;
            return false;
        }
    }

    uint64_t leaf_count = sizes.back();
    set<uint32_t> target;
    for (uint32_t i : challenge) {
        if (i >= leaf_count) {
            cerr << "Invalid challenge index: " << i << " (max " << leaf_count - 1 << ")" << endl;
            return false;
        }
        target.insert(i);
    }

    // A single-leaf tree has no layer to traverse; the root itself is the only
    // thing that can be revealed
    if (H == 0) {
        OpeningStep step;
        if (target.empty()) {
            step.indices.push_back(0);
            step.values.push_back(tree[0][0]);
        }
        if (!step.indices.empty() || keep_empty_steps) proof.push_back(move(step));
        return true;
    }

    for (uint32_t L = H; L >= 1; L--) {
        OpeningStep step;
        step.layer = L;

        if (target.empty()) {
            // Nothing is hidden: the whole of layer 1 covers every leaf
            if (L == 1) {
                for (uint32_t k = 0; k < sizes[1]; k++) {
                    step.indices.push_back(k);
                    step.values.push_back(tree[1][k]);
                }
            }
        } else {
            set<uint32_t> parents;
            for (uint32_t i : target) {
                uint32_t sib = i ^ 1;
                if (sib < sizes[L] && !target.count(sib)) {
                    step.indices.push_back(sib);
                }
                parents.insert(i >> 1);
            }
            // siblings of ascending targets come out ascending and distinct
            for (uint32_t k : step.indices) step.values.push_back(tree[L][k]);
            target = move(parents);
        }

        if (verbose) cout << "  Layer " << L << ": revealed " << step.indices.size() << " node(s)" << endl;
        if (!step.indices.empty() || keep_empty_steps) proof.push_back(move(step));
    }

    if (verbose) cout << "Proof carries " << proof_size(proof) << " node value(s)" << endl;
    return true;
}

// Re-expand a revealed node down to the leaf layer, applying the same
// truncation as build(): a subtree that reaches the global end of an
// abandon layer loses its last child there.
void GGM::expand_to_leaves(const Bytes& node, uint32_t layer, uint64_t index,
                           uint64_t& first_leaf, vector<Bytes>& leaves) const {
    vector<Bytes> level{node};
    uint64_t lo = index, hi = index;
    for (uint32_t d = layer; d < H; d++) {
        vector<Bytes> next;
        next.reserve(2 * level.size());
        for (const Bytes& x : level) {
            Bytes l, r;
            split(x, l, r);
            next.push_back(move(l));
            next.push_back(move(r));
        }
        cleanse_layer(level);

        uint64_t lo2 = 2 * lo, hi2 = 2 * hi + 1;
        uint64_t full = 2 * sizes[d];
        if (sizes[d + 1] < full && hi2 == full - 1) {
            OPENSSL_cleanse(next.back().data(), next.back().size());
            next.pop_back();
            hi2--;
        }
        level = move(next);
        lo = lo2;
        hi = hi2;
    }
    first_leaf = lo;
    leaves = move(level);
}

bool GGM::check_step_layers(const Proof& proof) const {
    uint32_t top = H == 0 ? 0 : H;
    uint32_t bottom = H == 0 ? 0 : 1;

    if (keep_empty_steps) {
        size_t expected = top - bottom + 1;
        if (proof.size() != expected) {
            cerr << "Malformed proof: " << proof.size() << " steps, expected " << expected << endl;
            return false;
        }
        for (size_t k = 0; k < proof.size(); k++) {
            if (proof[k].layer != top - k) {
                cerr << "Malformed proof: step " << k << " is for layer " << proof[k].layer
                     << ", expected " << top - k << endl;
                return false;
            }
        }
        return true;
    }

    for (size_t k = 0; k < proof.size(); k++) {
        uint32_t L = proof[k].layer;
        if (L > top || L < bottom || (k > 0 && L >= proof[k - 1].layer)) {
            cerr << "Malformed proof: step " << k << " has out-of-order layer " << L << endl;
            return false;
        }
    }
    return true;
}

// GGM.Verify: recover every leaf that the proof reveals. Leaves in the
// challenge set stay unset.
bool GGM::verify(const Proof& proof, Recovered& leaves) const {
    if (verbose) cout << "\n=== GGM.Verify(M=" << M << ", N=" << N << ", steps=" << proof.size() << ") ===" << endl;

    leaves.clear();
    if (!check_step_layers(proof)) return false;

    uint64_t total = sizes.back();
    Recovered out(total);
    size_t recovered = 0;

    for (const OpeningStep& step : proof) {
        uint32_t L = step.layer;
        if (step.indices.size() != step.values.size()) {
            cerr << "Malformed proof: layer " << L << " has " << step.indices.size()
                 << " indices but " << step.values.size() << " values" << endl;
            return false;
        }
        for (size_t k = 0; k < step.indices.size(); k++) {
            uint32_t i = step.indices[k];
            if (k > 0 && i <= step.indices[k - 1]) {
                cerr << "Malformed proof: indices at layer " << L << " are not strictly increasing" << endl;
                return false;
            }
            if (i >= sizes[L]) {
                cerr << "Proof corrupt: index " << i << " out of range at layer " << L
                     << " (size " << sizes[L] << ")" << endl;
                return false;
            }
            if (step.values[k].size() != NODE_SIZE) {
                cerr << "Malformed proof: node value of " << step.values[k].size() << " bytes" << endl;
                return false;
            }

            uint64_t base = 0;
            vector<Bytes> subtree;
            expand_to_leaves(step.values[k], L, i, base, subtree);
            for (size_t off = 0; off < subtree.size(); off++) {
                uint64_t gi = base + off;
                if (gi >= total) {
                    cerr << "Proof corrupt: leaf index " << gi << " out of range 0.." << total - 1 << endl;
                    return false;
                }
                if (out[gi]) {
                    if (*out[gi] != subtree[off]) {
                        cerr << "Proof corrupt: conflicting values for leaf " << gi << endl;
                        return false;
                    }
                    continue;
                }
                out[gi] = move(subtree[off]);
                recovered++;
            }
        }
    }

    leaves = move(out);
    if (verbose) cout << "✓ Recovered " << recovered << " of " << total << " leaves" << endl;
    return true;
}

// step_count, then per step: layer, count, indices[count], values[count]
Bytes GGM::serialize_proof(const Proof& proof) {
    Bytes out;
    put_u32(out, static_cast<uint32_t>(proof.size()));
    for (const OpeningStep& step : proof) {
        put_u32(out, step.layer);
        put_u32(out, static_cast<uint32_t>(step.indices.size()));
        for (uint32_t i : step.indices) put_u32(out, i);
        for (const Bytes& v : step.values) {
            if (v.size() != NODE_SIZE) {
                throw invalid_argument("Proof node value must be " + to_string(NODE_SIZE) + " bytes");
            }
            out.insert(out.end(), v.begin(), v.end());
        }
    }
    return out;
}

bool GGM::deserialize_proof(const Bytes& data, Proof& proof) {
    proof.clear();
    size_t pos = 0;
    uint32_t step_count = 0;
    if (!get_u32(data, pos, step_count) || step_count > (data.size() - pos) / 8) {
        cerr << "Malformed proof encoding: bad step count" << endl;
        return false;
    }

    Proof out(step_count);
    for (OpeningStep& step : out) {
        uint32_t count = 0;
        if (!get_u32(data, pos, step.layer) || !get_u32(data, pos, count) ||
            count > (data.size() - pos) / (4 + NODE_SIZE)) {
            cerr << "Malformed proof encoding: truncated step header" << endl;
            return false;
        }
        step.indices.resize(count);
        for (uint32_t& i : step.indices) {
            if (!get_u32(data, pos, i)) {
                cerr << "Malformed proof encoding: truncated indices" << endl;
                return false;
            }
        }
        step.values.reserve(count);
        for (uint32_t k = 0; k < count; k++) {
            step.values.emplace_back(data.begin() + pos, data.begin() + pos + NODE_SIZE);
            pos += NODE_SIZE;
        }
    }
    if (pos != data.size()) {
        cerr << "Malformed proof encoding: " << data.size() - pos << " trailing bytes" << endl;
        return false;
    }

    proof = move(out);
    return true;
}

size_t GGM::proof_size(const Proof& proof) {
    size_t n = 0;
    for (const OpeningStep& step : proof) n += step.values.size();
    return n;
}

// Parses a hex string, ignoring whitespace; returns empty on malformed input
Bytes hex_to_bytes(const string &hex) {
    Bytes out;
    if (hex.empty()) return out;
    string s = hex;
    s.erase(remove_if(s.begin(), s.end(), [](unsigned char c) { return isspace(c); }), s.end());
    if (s.size() % 2 != 0) return out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        unsigned char a = static_cast<unsigned char>(s[i]);
        unsigned char b = static_cast<unsigned char>(s[i+1]);
        if (!isxdigit(a) || !isxdigit(b)) return Bytes();
        uint8_t hi = static_cast<uint8_t>(isdigit(a) ? a - '0' : tolower(a) - 'a' + 10);
        uint8_t lo = static_cast<uint8_t>(isdigit(b) ? b - '0' : tolower(b) - 'a' + 10);
        out.push_back(static_cast<u8>((hi << 4) | lo));
    }
    return out;
}

void print_bytes(const Bytes& data) {
    for (u8 byte : data) {
        cout << hex << setw(2) << setfill('0')
                  << static_cast<int>(byte);
    }
    cout << dec << endl;
}

uint32_t GGM::get_M() const {
    return M;
}

uint32_t GGM::get_N() const {
    return N;
}

uint32_t GGM::get_height() const {
    return H;
}

uint64_t GGM::get_leaf_count() const {
    return sizes.back();
}

const vector<uint64_t>& GGM::get_layer_sizes() const {
    return sizes;
}

void GGM::set_verbose(bool v) {
    verbose = v;
}
