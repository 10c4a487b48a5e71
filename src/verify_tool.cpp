#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <boost/json.hpp>
#include "input_validator.hpp"
#include "proof_codec.hpp"
#include "verifier.hpp"

using namespace fairdraw;

// Offline proof checker: fairdraw_verify <proof.json> [entries.json] [--json]
// Exit status 0 when the proof verifies, 1 when it does not, 2 on usage or I/O errors.

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int main(int argc, char* argv[]) {
    std::vector<std::string> paths;
    bool json_output = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            json_output = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " <proof.json> [entries.json] [--json]\n";
            return 0;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.empty() || paths.size() > 2) {
        std::cerr << "Usage: " << argv[0] << " <proof.json> [entries.json] [--json]\n";
        return 2;
    }

    FairnessProof proof;
    std::vector<Entry> entries;
    bool strong = paths.size() == 2;

    try {
        proof = codec::proof_from_json(InputValidator::safe_parse_json(read_file(paths[0]), 64));
        if (strong) {
            entries = codec::entries_from_json(InputValidator::safe_parse_json(read_file(paths[1]), 64));
        }
    } catch (const std::exception& e) {
        std::cerr << "[!] " << e.what() << std::endl;
        return 2;
    }

    VerificationResult result = strong ? Verifier::verify(proof, entries) : Verifier::verify(proof);

    if (json_output) {
        std::cout << boost::json::serialize(codec::to_json(result)) << std::endl;
        return result.valid ? 0 : 1;
    }

    std::cout << "[*] Giveaway: " << proof.giveaway_id << std::endl;
    std::cout << "[*] Mode: " << verification_mode_name(result.mode)
              << (result.maximality_checked ? " (maximality checked)" : " (maximality NOT checked)") << std::endl;
    std::cout << "[*] Claimed winner: " << proof.winner_entry_id << std::endl;
    std::cout << "[*] Commitment: " << proof.commitment << std::endl;
    std::cout << "[*] SHA256(seed): " << result.computed_commitment << std::endl;
    std::cout << "[*] Keyed value: " << proof.winner_keyed_value << std::endl;
    std::cout << "[*] Recomputed:  " << result.computed_keyed_value << std::endl;
    if (strong && result.maximality_checked) {
        std::cout << "[*] Expected winner: " << result.expected_winner_entry_id << std::endl;
    }

    if (result.valid) {
        std::cout << "[+] VALID" << std::endl;
        return 0;
    }

    std::cout << "[-] INVALID" << std::endl;
    for (auto reason : result.reasons) {
        std::cout << "    - " << failure_reason_name(reason) << std::endl;
    }
    return 1;
}
