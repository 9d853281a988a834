#include "airmesh/core/config.hpp"
#include "airmesh/core/node.hpp"
#include "airmesh/net/loopback_transport.hpp"
#include "airmesh/util/logger.hpp"
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]\n"
              << "\n"
              << "Secure session and message routing core for offline mesh devices.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --verbose           Enable verbose logging\n"
              << "  -d, --debug             Enable debug logging\n"
              << "  --generate-config       Print a sample node configuration\n"
              << "  --check-config <file>   Validate a configuration file\n"
              << "  --simulate [<file>]     Run two nodes over an in-process transport,\n"
              << "                          establish a session and exchange a chat message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " --generate-config > node.conf\n"
              << "  " << program << " --check-config node.conf\n"
              << "  " << program << " --simulate node.conf\n";
}

std::optional<airmesh::core::NodeConfig> load_config(const std::string& path) {
    if (path.empty()) {
        return airmesh::core::NodeConfig{};
    }
    auto config = airmesh::core::NodeConfig::parse_file(path);
    if (!config) {
        LOG_FATAL("Failed to parse configuration file: {}", path);
    }
    return config;
}

int run_check_config(const std::string& path) {
    auto config = load_config(path);
    if (!config) {
        return 1;
    }

    auto runtime = airmesh::core::RuntimeConfig::resolve(*config);
    if (!runtime) {
        LOG_FATAL("Invalid configuration: {}", path);
        return 1;
    }

    std::cout << "Configuration OK\n";
    std::cout << "  Display name: " << runtime->display_name << "\n";
    std::cout << "  Device id:    " << runtime->device_id << "\n";
    std::cout << "  Public key:   " << runtime->keypair.public_key_base64() << "\n";
    std::cout << "  Connections:  " << runtime->connection.max_connections << " max\n";
    std::cout << "  Rekey after:  " << runtime->session.rekey_after_messages << " messages or "
              << runtime->session.rekey_after_time.count() << "s\n";
    return 0;
}

template<typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

int run_simulation(const std::string& path) {
    auto config = load_config(path);
    if (!config) {
        return 1;
    }

    // Both nodes share the file's policies but get their own identities
    config->private_key_base64.clear();
    config->device_id.reset();
    config->display_name.clear();

    auto alice_config = airmesh::core::RuntimeConfig::resolve(*config);
    auto bob_config = airmesh::core::RuntimeConfig::resolve(*config);
    if (!alice_config || !bob_config) {
        LOG_FATAL("Invalid configuration");
        return 1;
    }

    std::mutex mutex;
    std::condition_variable received_cv;
    std::optional<airmesh::mesh::FeatureMessage> received;

    airmesh::net::LoopbackHub hub;
    auto alice_link = hub.create_endpoint("alice");
    auto bob_link = hub.create_endpoint("bob");

    airmesh::core::MeshNode alice(*alice_config, *alice_link);
    airmesh::core::MeshNode bob(*bob_config, *bob_link);

    bob.router().channel(airmesh::mesh::FeatureRoute::Chat).subscribe(
        [&](const airmesh::mesh::FeatureMessage& message) {
            std::lock_guard lock(mutex);
            received = message;
            received_cv.notify_all();
        });

    alice.start();
    bob.start();

    const auto session_timeout = alice_config->handshake.response_timeout * alice_config->handshake.max_attempts
                               + alice_config->probe.probe_timeout + std::chrono::seconds(5);
    bool established = wait_until([&] {
        return alice.has_session("bob") && bob.has_session("alice");
    }, std::chrono::duration_cast<std::chrono::milliseconds>(session_timeout));

    if (!established) {
        LOG_ERROR("Simulation: no session between alice and bob");
        alice.stop();
        bob.stop();
        return 1;
    }
    std::cout << "Session established between alice and bob\n";

    const std::string text = "hello from alice";
    auto sent = alice.send("bob", airmesh::protocol::MessageType::Chat,
                           {reinterpret_cast<const uint8_t*>(text.data()), text.size()});
    if (!sent) {
        LOG_ERROR("Simulation: send failed: {}", airmesh::mesh::to_string(sent.error()));
        alice.stop();
        bob.stop();
        return 1;
    }

    bool delivered = false;
    {
        std::unique_lock lock(mutex);
        delivered = received_cv.wait_for(lock, std::chrono::seconds(5), [&] { return received.has_value(); });
    }

    int status = 1;
    if (delivered) {
        std::string body(received->payload.begin(), received->payload.end());
        std::cout << "bob received from " << received->sender_id
                  << (received->encrypted ? " (encrypted): " : ": ") << body << "\n";
        status = body == text && received->encrypted ? 0 : 1;
    } else {
        LOG_ERROR("Simulation: chat message never arrived");
    }

    auto stats = bob.stats();
    std::cout << "bob: " << stats.router.received << " frames received, "
              << stats.router.crypto_rejected << " rejected, "
              << stats.router.flood_dropped << " throttled, "
              << stats.sessions << " session(s)\n";

    alice.stop();
    bob.stop();
    return status;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    airmesh::util::LogLevel log_level = airmesh::util::LogLevel::Info;
    bool generate_config = false;
    bool check_config = false;
    bool simulate = false;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            log_level = airmesh::util::LogLevel::Debug;
        } else if (arg == "-d" || arg == "--debug") {
            log_level = airmesh::util::LogLevel::Trace;
        } else if (arg == "--generate-config") {
            generate_config = true;
        } else if (arg == "--check-config" && i + 1 < argc) {
            check_config = true;
            config_path = argv[++i];
        } else if (arg == "--simulate") {
            simulate = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                config_path = argv[++i];
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    airmesh::util::Logger::instance().set_level(log_level);

    try {
        if (generate_config) {
            std::cout << airmesh::core::NodeConfig::generate_sample();
            return 0;
        }
        if (check_config) {
            return run_check_config(config_path);
        }
        if (simulate) {
            return run_simulation(config_path);
        }
    } catch (const std::exception& e) {
        LOG_FATAL("Error: {}", e.what());
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
