#include "ggm.hpp"
#include <openssl/crypto.h>
#include <openssl/rand.h>
using namespace std;

static uint32_t random_u32() {
    unsigned char buf[4];
    if (RAND_bytes(buf, sizeof(buf)) <= 0) {
        throw runtime_error("Failed to generate random bytes");
    }
    return (static_cast<uint32_t>(buf[0]) << 24) |
           (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) |
           static_cast<uint32_t>(buf[3]);
}

// One hidden leaf per column j: j + r*M with r uniform in 0..N-1
static vector<uint32_t> random_challenge(uint32_t M, uint32_t N) {
    vector<uint32_t> A;
    A.reserve(M);
    for (uint32_t j = 0; j < M; j++) {
        A.push_back(j + (random_u32() % N) * M);
    }
    return A;
}

static bool run_once(const GGM& ggm, const Bytes& seed) {
    GGM::Tree tree;
    if (!ggm.build(seed, tree)) return false;

    vector<uint32_t> A = random_challenge(ggm.get_M(), ggm.get_N());
    cout << "\nChallenge set A:";
    for (uint32_t a : A) cout << " " << a;
    cout << endl;

    GGM::Proof proof;
    if (!ggm.open(tree, A, proof)) {
        GGM::wipe(tree);
        return false;
    }

    cout << "\n[Octopus Proof]" << endl;
    for (const GGM::OpeningStep& step : proof) {
        cout << "  Layer " << step.layer << ":";
        if (step.indices.empty()) cout << " (empty)";
        cout << endl;
        for (size_t k = 0; k < step.indices.size(); k++) {
            cout << "    [" << step.indices[k] << "] ";
            print_bytes(step.values[k]);
        }
    }
    cout << "Revealed nodes: " << GGM::proof_size(proof)
         << ", encoded size: " << GGM::serialize_proof(proof).size() << " bytes" << endl;

    GGM::Recovered leaves;
    if (!ggm.verify(proof, leaves)) {
        GGM::wipe(tree);
        return false;
    }

    set<uint32_t> hidden(A.begin(), A.end());
    const GGM::Layer& expected = tree.back();
    bool ok = true;
    for (uint32_t i = 0; i < leaves.size(); i++) {
        bool should_hide = hidden.count(i) > 0;
        if (should_hide != !leaves[i] || (leaves[i] && *leaves[i] != expected[i])) {
            cerr << "Leaf " << i << " does not match the tree" << endl;
            ok = false;
        }
    }
    GGM::wipe(tree);

    if (ok) cout << "✓ All " << leaves.size() - hidden.size() << " unchallenged leaves recovered" << endl;
    return ok;
}

static void run_trials(const GGM& ggm, uint32_t trials) {
    double nodes = 0, bytes = 0;
    for (uint32_t t = 0; t < trials; t++) {
        Bytes seed = GGM::generate_seed();
        GGM::Tree tree;
        GGM::Proof proof;
        if (!ggm.build(seed, tree) ||
            !ggm.open(tree, random_challenge(ggm.get_M(), ggm.get_N()), proof)) {
            GGM::wipe(tree);
            cerr << "Trial " << t << " failed" << endl;
            return;
        }
        GGM::wipe(tree);
        nodes += GGM::proof_size(proof);
        bytes += GGM::serialize_proof(proof).size();
    }
    cout << fixed << setprecision(2);
    cout << "\n[Benchmark: " << trials << " trials, M = " << ggm.get_M() << ", N = " << ggm.get_N() << "]\n";
    cout << "  Average revealed nodes: " << nodes / trials << "\n";
    cout << "  Average proof size:     " << bytes / trials << " bytes\n";
    cout << "  Per-leaf paths would need up to " << uint64_t(ggm.get_M()) * ggm.get_height() << " nodes\n";
    cout << defaultfloat;
}

// Interactive demo for GGM tree commitment with batched octopus opening
int main() {
    cout << "\n╔═══════════════════════════════════════╗\n";
    cout << "║   GGM Octopus Opening Demo (C++)      ║\n";
    cout << "╚═══════════════════════════════════════╝\n";

    uint32_t M = 0, N = 0;
    cout << "\n[Parameter Selection]\n";
    cout << "  1) Random M and N\n";
    cout << "  2) Manual M and N\n";
    cout << "Choice: ";
    int choice = 1;
    if (!(cin >> choice)) return 0;

    if (choice == 2) {
        cout << "M (>= 1): ";
        cin >> M;
        cout << "N (>= 1): ";
        cin >> N;
    } else {
        M = 1 + random_u32() % 64;
        N = 1 + random_u32() % 64;
    }

    string dummy;
    getline(cin, dummy);

    unique_ptr<GGM> ggm;
    try {
        ggm = make_unique<GGM>(M, N);
    } catch (const exception& e) {
        cerr << e.what() << "\n";
        return -1;
    }
    ggm->set_verbose(true);

    cout << "\n[Active Parameters]\n";
    cout << "  M = " << ggm->get_M() << ", N = " << ggm->get_N() << "\n";
    cout << "  H = " << ggm->get_height() << " (" << ggm->get_leaf_count() << " leaves)\n";

    cout << "\nRoot seed (hex, empty for random): ";
    string seedhex;
    getline(cin, seedhex);
    Bytes seed = hex_to_bytes(seedhex);
    if (seed.size() != GGM::NODE_SIZE) {
        if (!seedhex.empty()) cout << "Seed must be " << GGM::NODE_SIZE << " bytes; using a random one\n";
        seed = GGM::generate_seed();
    }
    cout << "Seed: ";
    print_bytes(seed);

    while (true) {
        cout << "\n[Main Menu]\n";
        cout << "  1) Build, open and verify\n";
        cout << "  2) Average proof size over random trials\n";
        cout << "  3) Regenerate seed\n";
        cout << "  4) Exit\n";
        cout << "Choice: ";
        int sel = 1;
        if (!(cin >> sel)) break;
        getline(cin, dummy);

        if (sel == 4) break;

        if (sel == 3) {
            seed = GGM::generate_seed();
            cout << "Seed: ";
            print_bytes(seed);
            continue;
        }

        if (sel == 2) {
            cout << "Trials: ";
            uint32_t trials = 0;
            if (!(cin >> trials)) break;
            getline(cin, dummy);
            if (trials == 0) continue;
            ggm->set_verbose(false);
            run_trials(*ggm, trials);
            ggm->set_verbose(true);
            continue;
        }

        if (!run_once(*ggm, seed)) {
            cout << "\n[ERROR] Opening round failed\n";
        }
    }

    OPENSSL_cleanse(seed.data(), seed.size());
    cout << "\nExiting...\n";
    return 0;
}
