#include "airmesh/core/config.hpp"
#include "airmesh/crypto/curve25519.hpp"
#include <cctype>
#include <iostream>
#include <string>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [COMMAND]\n"
              << "\n"
              << "Generate airmesh identity keys.\n"
              << "\n"
              << "Commands:\n"
              << "  genkey      Generate a new private key\n"
              << "  pubkey      Derive public key from private key (reads from stdin)\n"
              << "  keypair     Generate and print both private and public keys\n"
              << "  deviceid    Derive the default device id from a private key (reads from stdin)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " genkey > private.key\n"
              << "  " << program << " pubkey < private.key > public.key\n"
              << "  " << program << " deviceid < private.key\n"
              << "  " << program << " keypair\n";
}

std::optional<airmesh::crypto::X25519KeyPair> read_private_key() {
    std::string private_key_b64;
    if (!std::getline(std::cin, private_key_b64)) {
        std::cerr << "Error: Failed to read private key from stdin\n";
        return std::nullopt;
    }

    // Trim whitespace
    while (!private_key_b64.empty() && std::isspace(static_cast<unsigned char>(private_key_b64.back()))) {
        private_key_b64.pop_back();
    }

    auto keypair = airmesh::crypto::X25519KeyPair::from_base64(private_key_b64);
    if (!keypair) {
        std::cerr << "Error: Invalid private key\n";
    }
    return keypair;
}

int cmd_genkey() {
    auto keypair = airmesh::crypto::X25519KeyPair::generate();
    std::cout << keypair.private_key_base64() << "\n";
    return 0;
}

int cmd_pubkey() {
    auto keypair = read_private_key();
    if (!keypair) {
        return 1;
    }
    std::cout << keypair->public_key_base64() << "\n";
    return 0;
}

int cmd_deviceid() {
    auto keypair = read_private_key();
    if (!keypair) {
        return 1;
    }
    std::cout << airmesh::core::default_device_id(keypair->public_key()) << "\n";
    return 0;
}

int cmd_keypair() {
    auto keypair = airmesh::crypto::X25519KeyPair::generate();

    std::cout << "Private key: " << keypair.private_key_base64() << "\n";
    std::cout << "Public key:  " << keypair.public_key_base64() << "\n";
    std::cout << "Device id:   " << airmesh::core::default_device_id(keypair.public_key()) << "\n";

    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    try {
        if (command == "genkey") {
            return cmd_genkey();
        } else if (command == "pubkey") {
            return cmd_pubkey();
        } else if (command == "keypair") {
            return cmd_keypair();
        } else if (command == "deviceid") {
            return cmd_deviceid();
        } else if (command == "-h" || command == "--help" || command == "help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown command: " << command << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
