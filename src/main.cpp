#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/LedgerStore.hpp"
#include "tacmesh/NodeConfig.hpp"
#include "tacmesh/NodeRuntime.hpp"
#include "tacmesh/Signer.hpp"

static std::atomic<bool> g_running(true);

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

static void usage() {
    std::cerr << "Usage:\n"
              << "  tacmesh_node run <config-file>\n"
              << "  tacmesh_node keygen <seed-file>\n";
}

static bool readSeed(const std::string& path, std::vector<uint8_t>& seed) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: Cannot open key file " << path << std::endl;
        return false;
    }
    std::string hex;
    in >> hex;
    try {
        seed = tacmesh::CryptoBase::hexDecode(hex);
    } catch (const std::exception& e) {
        std::cerr << "Error: Key file " << path << " is not hex: " << e.what() << std::endl;
        return false;
    }
    if (seed.size() != tacmesh::SEED_SIZE) {
        std::cerr << "Error: Key file " << path << " must hold a " << tacmesh::SEED_SIZE << "-byte seed" << std::endl;
        return false;
    }
    return true;
}

static int keygen(const std::string& path) {
    std::vector<uint8_t> seed(tacmesh::SEED_SIZE);
    if (!tacmesh::CryptoBase::randomBytes(seed)) {
        std::cerr << "Error: Cannot draw random seed" << std::endl;
        return 1;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        std::cerr << "Error: Cannot write " << path << std::endl;
        return 1;
    }
    out << tacmesh::CryptoBase::hexEncode(seed) << "\n";
    out.close();

    tacmesh::KeyRing ring;
    tacmesh::Ed25519Signer signer("keygen", seed, ring);
    tacmesh::CryptoBase::secureClean(seed);
    std::cout << "Seed written to " << path << std::endl;
    std::cout << "Public key: " << tacmesh::CryptoBase::base64Encode(signer.publicKey()) << std::endl;
    return 0;
}

// send <TYPE> <destination|*> <text...>
static void handleCommand(const std::string& line, tacmesh::NodeRuntime& runtime) {
    std::istringstream in(line);
    std::string verb;
    std::string typeName;
    std::string destination;
    in >> verb;
    if (verb.empty()) return;
    if (verb != "send") {
        std::cerr << "Error: Unknown command " << verb << std::endl;
        return;
    }
    in >> typeName >> destination;
    tacmesh::MessageType type;
    if (!tacmesh::messageTypeFromString(typeName, type) || destination.empty()) {
        std::cerr << "Error: Usage: send <CHAT|COMMAND|ALERT|STATUS> <node|*> <text>" << std::endl;
        return;
    }
    if (destination == "*") destination.clear();

    std::string text;
    std::getline(in >> std::ws, text);
    try {
        std::string id = runtime.submit(type, std::vector<uint8_t>(text.begin(), text.end()), destination);
        std::cout << "Submitted " << id << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
}

static int run(const std::string& configPath) {
    tacmesh::NodeConfig config;
    if (!tacmesh::loadConfigFile(configPath, config)) {
        return 1;
    }

    tacmesh::KeyRing ring;
    for (const auto& key : config.keys) {
        if (!ring.addKeyEncoded(key.first, key.second)) {
            std::cerr << "Error: Bad public key for " << key.first << std::endl;
            return 1;
        }
    }

    std::unique_ptr<tacmesh::Ed25519Signer> signer;
    if (!config.keyFile.empty()) {
        std::vector<uint8_t> seed;
        if (!readSeed(config.keyFile, seed)) return 1;
        signer = std::make_unique<tacmesh::Ed25519Signer>(config.nodeId, seed, ring);
        tacmesh::CryptoBase::secureClean(seed);
    } else {
        std::cerr << "Warning: No key_file configured, using a throwaway key pair" << std::endl;
        signer = std::make_unique<tacmesh::Ed25519Signer>(config.nodeId, ring);
    }

    tacmesh::LedgerStore store(config.dataDir);
    if (!store.initialize()) {
        std::cerr << "Error: Failed to initialize storage at " << config.dataDir << std::endl;
        return 1;
    }

    tacmesh::NodeRuntime runtime(config, *signer, store);
    runtime.agent().setEventHandler([](const tacmesh::NodeEvent& event) {
        std::cout << event.toString() << std::endl;
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!runtime.start()) {
        return 1;
    }

    std::cout << "Node running. Type 'send <TYPE> <node|*> <text>' or press Ctrl+C to exit." << std::endl;
    std::thread console([&runtime] {
        std::string line;
        while (g_running && std::getline(std::cin, line)) {
            handleCommand(line, runtime);
        }
    });
    // getline cannot be interrupted; the thread ends with the process
    console.detach();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down..." << std::endl;
    runtime.stop();
    return 0;
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);

    if (argc < 3) {
        usage();
        return 1;
    }

    if (!tacmesh::CryptoBase::initialize()) {
        std::cerr << "Failed to initialize crypto (sodium)." << std::endl;
        return 1;
    }

    const std::string command = argv[1];
    if (command == "keygen") return keygen(argv[2]);
    if (command == "run") return run(argv[2]);

    usage();
    return 1;
}
