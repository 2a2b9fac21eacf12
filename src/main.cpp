#include <iostream>
#include <boost/asio.hpp>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <thread>
#include "chunkflow/hex.hpp"
#include "config.hpp"
#include "node.hpp"
#include "orchestrator.hpp"
#include "remote_storage_server.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " --upload <config> <file> [mime_type] [owner_scope]\n"
              << "  " << program << " --resume <config> <checksum> <file>\n"
              << "  " << program << " --servers <config>\n"
              << "  " << program << " --partials <config> [owner_scope]\n"
              << "  " << program << " --forget <config> <checksum>\n"
              << "  " << program << " --serve <node_config>" << std::endl;
}

// Everything an uploader command needs, wired from one config file
struct UploaderStack {
    explicit UploaderStack(const std::string& config_path)
        : config(chunkflow::load_uploader_config(config_path)),
          settings(chunkflow::settings_from_config(config)),
          ledger(config.ledger_dir()),
          accountant(config.usage_path()) {
        for (const auto& endpoint : config.servers()) {
            registry.add_server(std::make_shared<chunkflow::RemoteStorageServer>(
                endpoint.id(), endpoint.host(), static_cast<unsigned short>(endpoint.port()),
                settings.request_timeout));
        }
        for (const auto& account : config.accounts()) {
            accountant.upsert(account);
        }
        reporter.add_listener(std::make_shared<chunkflow::ConsoleProgressListener>());
        orchestrator = std::make_unique<chunkflow::UploadOrchestrator>(
            settings, registry, ledger, accountant, reporter);
    }

    chunkflow::UploaderConfig config;
    chunkflow::UploadSettings settings;
    chunkflow::ServerRegistry registry;
    chunkflow::PartialUploadLedger ledger;
    chunkflow::CapacityAccountant accountant;
    chunkflow::ProgressReporter reporter;
    std::unique_ptr<chunkflow::UploadOrchestrator> orchestrator;
};

std::string make_session_id() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "cli_" + std::to_string(millis);
}

// Runs one upload while SIGINT / SIGTERM cancel it
template <typename Upload>
chunkflow::UploadOutcome run_cancellable(UploaderStack& stack, const std::string& session_id, Upload upload) {
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int /*signal*/) {
        if (!ec) {
            std::cout << "[CLI] Interrupted, cancelling " << session_id << std::endl;
            stack.orchestrator->cancel_upload(session_id);
        }
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    chunkflow::UploadOutcome outcome = upload();

    signals.cancel();
    signal_context.stop();
    signal_thread.join();
    stack.reporter.flush();
    return outcome;
}

int report(const chunkflow::UploadOutcome& outcome) {
    std::cout << "[CLI] Session " << outcome.session_id << ": " << chunkflow::to_string(outcome.status)
              << " (" << outcome.completed_chunks << "/" << outcome.total_chunks << " chunks, "
              << outcome.skipped_chunks << " already stored)" << std::endl;
    std::cout << "[CLI] Checksum: " << outcome.checksum << std::endl;
    if (outcome.status != chunkflow::SessionStatus::COMPLETED) {
        std::cerr << "[CLI] Reason: " << chunkflow::to_string(outcome.reason) << ": " << outcome.error << std::endl;
        return 1;
    }
    for (const auto& placement : outcome.placements) {
        std::cout << "  chunk " << placement.chunk_index() << " -> " << placement.server_id()
                  << " " << placement.storage_locator() << std::endl;
    }
    return 0;
}

}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::string command = argv[1];

        if (command == "--serve") {
            chunkflow::StorageNodeConfig node_config = chunkflow::load_node_config(argv[2]);
            boost::asio::io_context io_context;
            chunkflow::StorageNode node(io_context, node_config);
            node.listen(static_cast<unsigned short>(node_config.port()));

            boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
            signals.async_wait([&](const boost::system::error_code&, int) {
                std::cout << "[Node] Shutting down." << std::endl;
                node.stop();
            });
            io_context.run();
            return 0;
        }

        UploaderStack stack(argv[2]);

        if (command == "--upload") {
            if (argc < 4) {
                print_usage(argv[0]);
                return 1;
            }
            std::string path = argv[3];
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                std::cerr << "Cannot open " << path << std::endl;
                return 1;
            }
            uint64_t size = std::filesystem::file_size(path);

            chunkflow::UploadOptions options;
            options.session_id = make_session_id();
            options.owner_scope = argc > 5 ? argv[5] : "";
            std::string mime_type = argc > 4 ? argv[4] : "application/octet-stream";
            std::string file_name = std::filesystem::path(path).filename().string();

            stack.registry.refresh();
            auto outcome = run_cancellable(stack, options.session_id, [&]() {
                return stack.orchestrator->start_upload(file, file_name, mime_type, size, options);
            });
            return report(outcome);
        } else if (command == "--resume") {
            if (argc < 5) {
                print_usage(argv[0]);
                return 1;
            }
            std::string checksum = argv[3];
            if (!chunkflow::util::is_checksum(checksum)) {
                std::cerr << "Invalid checksum: expected 64 lowercase hex characters" << std::endl;
                return 1;
            }
            std::ifstream file(argv[4], std::ios::binary);
            if (!file.is_open()) {
                std::cerr << "Cannot open " << argv[4] << std::endl;
                return 1;
            }

            chunkflow::UploadOptions options;
            options.session_id = make_session_id();

            stack.registry.refresh();
            auto outcome = run_cancellable(stack, options.session_id, [&]() {
                return stack.orchestrator->resume_upload(checksum, file, options);
            });
            return report(outcome);
        } else if (command == "--servers") {
            auto servers = stack.orchestrator->list_available_servers();
            std::cout << servers.size() << " of " << stack.registry.size() << " server(s) available" << std::endl;
            for (const auto& server : servers) {
                std::cout << "  " << server.id << " @ " << server.endpoint
                          << " region=" << (server.region.empty() ? "-" : server.region)
                          << " load=" << server.current_load << "/" << server.max_load
                          << " free=" << server.capabilities.free_space
                          << " rt=" << std::fixed << std::setprecision(1) << server.response_time_ms << "ms"
                          << " success=" << std::setprecision(2) << server.success_rate << std::endl;
            }
        } else if (command == "--partials") {
            std::string owner = argc > 3 ? argv[3] : "";
            auto entries = stack.orchestrator->list_partial_uploads(owner);
            std::cout << entries.size() << " partial upload(s)" << std::endl;
            for (const auto& entry : entries) {
                std::cout << "  " << entry.checksum() << " " << entry.file_name() << " "
                          << entry.completed_chunks_size() << "/" << entry.total_chunks() << " chunks"
                          << (entry.owner_scope().empty() ? "" : " owner=" + entry.owner_scope()) << std::endl;
            }
        } else if (command == "--forget") {
            if (argc < 4) {
                print_usage(argv[0]);
                return 1;
            }
            if (!stack.orchestrator->delete_partial_upload(argv[3])) {
                std::cerr << "No partial upload for " << argv[3] << std::endl;
                return 1;
            }
            std::cout << "Forgot partial upload " << argv[3] << std::endl;
        } else {
            print_usage(argv[0]);
            return 1;
        }

    } catch (std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
