/**
 * @file media_relay_cli.cpp
 * @brief Command line front-end for the media relay
 *
 * This example demonstrates how to:
 * - Build a relay client for a mounted card and a local storage folder
 * - List and download media from the card
 * - Relay card media to a processing node
 * - Fetch a processed result back from the node
 */

#include <kcenon/media_relay/media_relay.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::media_relay;

namespace {

void print_usage(const char* program) {
    std::cout << "media_relay " << version::to_string() << std::endl;
    std::cout << "Usage: " << program << " <command> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  list <media_root>" << std::endl;
    std::cout << "  download <media_root> <storage_root> <file>..." << std::endl;
    std::cout << "  relay <media_root> <storage_root> <node[,node...]> <file>..." << std::endl;
    std::cout << "  fetch <storage_root> <node[,node...]> <remote_name> <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment: RELAY_TOKEN, RELAY_SESSION, RELAY_PORT (default 8000)" << std::endl;
}

auto split_addresses(const std::string& list) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

auto env_or(const char* name, const std::string& fallback) -> std::string {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : fallback;
}

void print_progress(const char* label, const transfer_state& state) {
    std::cout << "\r[" << label << "] " << state.transferred_files() << "/"
              << state.total_files() << " files, " << state.transferred_bytes() << "/"
              << state.total_bytes() << " bytes (" << static_cast<int>(state.percent_complete())
              << "%) " << state.speed() << " B/s" << std::flush;
}

/**
 * @brief Block until both legs are idle or a leg is paused
 */
auto wait_idle(relay_client& client) -> bool {
    while (true) {
        auto down = client.download_status();
        auto up = client.upload_status();
        if (!down.is_active() && !up.is_active()) {
            std::cout << std::endl;
            return true;
        }
        if (down.paused == pause_reason::user || up.paused == pause_reason::user) {
            std::cout << std::endl << "Transfer paused after an error" << std::endl;
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

auto build_client(const std::string& media_root, const std::string& storage_root)
    -> result<relay_client> {
    auto port = static_cast<uint16_t>(std::stoi(env_or("RELAY_PORT", "8000")));
    auto notifier = std::make_shared<log_notifier>([](const user_error& err) {
        std::cerr << std::endl << "[" << err.title << "] " << err.message << std::endl;
    });

    return relay_client::builder()
        .with_media_root(media_root)
        .with_storage_root(storage_root)
        .with_node(port, env_or("RELAY_TOKEN", ""), env_or("RELAY_SESSION", ""))
        .with_reconnect(true)
        .with_notifier(notifier)
        .build();
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "list") {
        auto scratch = std::filesystem::temp_directory_path() / "media_relay_cli";
        auto client_result = build_client(argv[2], scratch.string());
        if (!client_result.has_value()) {
            std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
            return 1;
        }
        auto& client = client_result.value();
        if (auto started = client.start(); !started) {
            std::cerr << "Failed to start: " << started.error().message << std::endl;
            return 1;
        }

        auto files = client.list_device();
        if (!files.has_value()) {
            std::cerr << "Cannot list device: " << files.error().message << std::endl;
            return 1;
        }
        for (const auto& file : files.value()) {
            std::cout << file.name << "\t" << file.size << (file.valid ? "" : "\t(invalid)")
                      << std::endl;
        }
        return 0;
    }

    if (command == "download") {
        if (argc < 5) {
            print_usage(argv[0]);
            return 1;
        }
        auto client_result = build_client(argv[2], argv[3]);
        if (!client_result.has_value()) {
            std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
            return 1;
        }
        auto& client = client_result.value();
        if (auto started = client.start(); !started) {
            std::cerr << "Failed to start: " << started.error().message << std::endl;
            return 1;
        }

        client.set_device_available(true);
        client.on_download_progress(
            [](const transfer_state& state) { print_progress("Download", state); });

        std::vector<std::string> names(argv + 4, argv + argc);
        if (auto queued = client.download(names); !queued) {
            std::cerr << "Download rejected: " << queued.error().message << std::endl;
            return 1;
        }
        return wait_idle(client) ? 0 : 1;
    }

    if (command == "relay") {
        if (argc < 6) {
            print_usage(argv[0]);
            return 1;
        }
        auto client_result = build_client(argv[2], argv[3]);
        if (!client_result.has_value()) {
            std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
            return 1;
        }
        auto& client = client_result.value();
        if (auto started = client.start(); !started) {
            std::cerr << "Failed to start: " << started.error().message << std::endl;
            return 1;
        }

        std::cout << "Probing nodes..." << std::endl;
        auto host = client.connect(split_addresses(argv[4]));
        if (!host.has_value()) {
            std::cerr << "No node answered: " << host.error().message << std::endl;
            return 1;
        }
        std::cout << "Connected to " << host.value() << std::endl;

        client.set_device_available(true);
        client.on_upload_progress(
            [](const transfer_state& state) { print_progress("Upload", state); });

        std::vector<std::string> names(argv + 5, argv + argc);
        if (auto queued = client.upload_from_device(names); !queued) {
            std::cerr << "Relay rejected: " << queued.error().message << std::endl;
            client.disconnect();
            return 1;
        }
        bool ok = wait_idle(client);
        client.disconnect();
        return ok ? 0 : 1;
    }

    if (command == "fetch") {
        if (argc < 6) {
            print_usage(argv[0]);
            return 1;
        }
        // No card is read; the storage folder stands in as the media root.
        auto client_result = build_client(argv[2], argv[2]);
        if (!client_result.has_value()) {
            std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
            return 1;
        }
        auto& client = client_result.value();
        if (auto started = client.start(); !started) {
            std::cerr << "Failed to start: " << started.error().message << std::endl;
            return 1;
        }

        auto host = client.connect(split_addresses(argv[3]));
        if (!host.has_value()) {
            std::cerr << "No node answered: " << host.error().message << std::endl;
            return 1;
        }

        std::filesystem::path destination = argv[5];
        client.fetch_result(argv[4], destination);

        // The fetch runs on the server queue. A failure removes the partial
        // file and is reported by the notifier, so wait for a settled size.
        std::uintmax_t last_size = 0;
        int stable = 0;
        for (int i = 0; i < 600; ++i) {
            std::error_code ec;
            auto size = std::filesystem::file_size(destination, ec);
            stable = (!ec && size > 0 && size == last_size) ? stable + 1 : 0;
            last_size = ec ? 0 : size;
            if (stable >= 10) {
                std::cout << "Saved " << destination.string() << " (" << size << " bytes)"
                          << std::endl;
                client.disconnect();
                return 0;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        std::cerr << "Timed out waiting for " << argv[4] << std::endl;
        client.disconnect();
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
