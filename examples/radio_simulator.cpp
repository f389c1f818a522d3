#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include <flexdisco/flexdisco_io.hpp>

using namespace flexdisco;

int main(int argc, char* argv[]) {
    std::string target = argc > 1 ? argv[1] : "255.255.255.255";

    auto radio = DeviceAnnouncement::Builder{}
                     .set(AnnouncementField::discovery_protocol_version, "3.0.0.2")
                     .set(AnnouncementField::model, "FLEX-6600")
                     .set(AnnouncementField::serial, "1234-5678-9012-3456")
                     .set(AnnouncementField::version, "3.4.23.11090")
                     .set(AnnouncementField::nickname, "Shack")
                     .set(AnnouncementField::callsign, "N0CALL")
                     .set(AnnouncementField::ip, "192.168.1.50")
                     .set(AnnouncementField::port, "4992")
                     .set(AnnouncementField::status, "Available")
                     .set(AnnouncementField::max_licensed_version, "v3")
                     .set(AnnouncementField::radio_license_id, "00-1C-2D-05-1A-2B")
                     .set(AnnouncementField::requires_additional_license, "0")
                     .set(AnnouncementField::fpc_mac, "")
                     .build();

    try {
        AnnouncementBroadcaster broadcaster(target, default_discovery_port);
        std::cout << "Announcing " << *radio.model() << " to " << target << ":"
                  << default_discovery_port << "\n";

        while (true) {
            if (!broadcaster.send(radio)) {
                std::cerr << "Send failed: " << broadcaster.transport_status().message() << "\n";
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    } catch (const SetupError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
