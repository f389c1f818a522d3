#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <flexdisco/flexdisco_io.hpp>

using namespace flexdisco;

// Helper function to print a field, "-" when the radio did not send it
static std::string show(const DeviceAnnouncement::FieldValue& value) {
    return value.value_or("-");
}

void printRadio(const DeviceAnnouncement& radio) {
    std::cout << "******************************************\n";
    std::cout << "Radio found: " << show(radio.model()) << "\n";
    std::cout << "Radio Serial Number: " << show(radio.serial()) << "\n";
    std::cout << "Radio License: " << show(radio.radio_license_id()) << "\n";
    std::cout << "Radio Licensed for SmartSDR version: " << show(radio.max_licensed_version())
              << "\n";
    std::cout << "Radio Registered to: " << show(radio.callsign()) << "\n";
    std::cout << "Software version: " << show(radio.version()) << "\n";
    std::cout << "Radio IP Address: " << show(radio.ip()) << "\n";
    if (is_available(radio)) {
        std::cout << "Radio is " << show(radio.status()) << "\n";
    } else {
        std::cout << "Radio is in use\n";
        std::cout << "Connected IP Address: " << show(radio.inuse_ip()) << "\n";
        std::cout << "Connected Hostname: " << show(radio.inuse_host()) << "\n";
    }
    for (const auto& note : radio.diagnostics()) {
        std::cout << note.message() << ": " << note.key << " = " << note.value << "\n";
    }
    std::cout << "*******************************************\n\n";
}

int main(int argc, char* argv[]) {
    std::string bind_address = default_bind_address;
    uint16_t port = default_discovery_port;
    std::chrono::milliseconds timeout = default_receive_timeout;

    if (argc > 1) {
        bind_address = argv[1];
    }
    if (argc > 2) {
        auto parsed = parse_port(argv[2]);
        if (!parsed) {
            std::cerr << "Error: invalid port '" << argv[2] << "' (expected 0-65535)\n";
            return 1;
        }
        port = *parsed;
    }
    if (argc > 3) {
        timeout = std::chrono::seconds(std::strtol(argv[3], nullptr, 10));
    }

    std::cout << "FLEXDISCO Discovery Monitor\n";
    std::cout << "===========================\n";
    std::cout << "Listening on " << (bind_address.empty() ? "0.0.0.0" : bind_address) << ":"
              << port << "\n\n";

    try {
        DiscoveryListener listener(bind_address, port, timeout);

        while (true) {
            auto result = listener.receive_one();
            if (!result) {
                std::cerr << "Discarded datagram: " << utils::error_message(result.error())
                          << "\n";
            } else if (*result) {
                printRadio(**result);
            } else {
                std::cout << "No packet found\n";
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    } catch (const SetupError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
