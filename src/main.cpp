/**
 * SoulSync Queue - download queue engine for slskd
 *
 * Main entry point. Loads configuration, starts the engine against the
 * configured slskd instance and reads queue commands from stdin.
 *
 * @version 1.0.0
 * @license MIT
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/Config.hpp"
#include "core/Engine.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/completion/FileOrganizer.hpp"
#include "core/transfer/CredentialProvider.hpp"
#include "core/transfer/SlskdTransferService.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using namespace soulsync;
using utils::StringUtils;

// Set from the signal handler; the command loop polls it
std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_stopRequested = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

/**
 * Load configuration, writing the defaults on first run
 */
bool loadConfiguration(const fs::path& configPath) {
    auto& config = core::Config::instance();

    try {
        if (fs::exists(configPath)) {
            if (!config.load(configPath.string())) {
                std::cerr << "Invalid configuration file: " << configPath.string() << std::endl;
                return false;
            }
        } else {
            config.setDefaults();
            if (!config.save(configPath.string())) {
                std::cerr << "Cannot write default configuration to " << configPath.string() << std::endl;
            }
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return false;
    }
}

/**
 * Lines typed on stdin, handed from the reader thread to the command loop
 */
class CommandQueue {
public:
    void push(std::string line) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lines.push_back(std::move(line));
        }
        m_cv.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_one();
    }

    // Returns false on timeout, or once closed and drained
    bool pop(std::string& line, std::chrono::milliseconds timeout, bool& closed) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return m_closed || !m_lines.empty(); });

        closed = m_closed && m_lines.empty();
        if (m_lines.empty()) return false;

        line = std::move(m_lines.front());
        m_lines.pop_front();
        return true;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_lines;
    bool m_closed{false};
};

/**
 * Parse "add <username> <remote path> [| title | artist | album | track]"
 */
std::optional<core::queue::DownloadRequest> parseAddCommand(const std::string& args) {
    auto parts = StringUtils::split(args, '|');
    if (parts.empty()) return std::nullopt;

    const std::string head = StringUtils::trim(parts[0]);
    const auto space = head.find(' ');
    if (space == std::string::npos) return std::nullopt;

    core::queue::DownloadRequest request;
    request.username = head.substr(0, space);
    request.filePath = StringUtils::trim(head.substr(space + 1));
    if (request.filePath.empty()) return std::nullopt;

    if (parts.size() > 1) request.title = StringUtils::trim(parts[1]);
    if (parts.size() > 2) request.artist = StringUtils::trim(parts[2]);
    if (parts.size() > 3 && !StringUtils::trim(parts[3]).empty()) {
        request.album = StringUtils::trim(parts[3]);
    }
    if (parts.size() > 4) {
        try {
            request.trackNumber = std::stoi(StringUtils::trim(parts[4]));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    // Metadata supplied means the file should be organized once done
    request.runPostProcessing = parts.size() > 1;

    if (request.title.empty()) {
        request.title = fs::path(StringUtils::baseName(request.filePath)).stem().string();
    }
    return request;
}

void printStatus(const core::Engine& engine) {
    auto snapshot = engine.snapshot();
    std::cout << snapshot.toJson().dump(2) << std::endl;
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  add <user> <remote path> [| title | artist | album | track]\n"
              << "  cancel <id>\n"
              << "  retry <id>\n"
              << "  clear\n"
              << "  bulk on|off\n"
              << "  status\n"
              << "  quit\n"
              << std::endl;
}

/**
 * Run one command line
 * @return false when the user asked to quit
 */
bool handleCommand(core::Engine& engine, const std::string& line) {
    const std::string trimmed = StringUtils::trim(line);
    if (trimmed.empty()) return true;

    const auto space = trimmed.find(' ');
    const std::string command = StringUtils::toLower(trimmed.substr(0, space));
    const std::string args = space == std::string::npos ? "" : StringUtils::trim(trimmed.substr(space + 1));

    if (command == "quit" || command == "exit") {
        return false;
    } else if (command == "add") {
        auto request = parseAddCommand(args);
        if (!request) {
            std::cout << "usage: add <user> <remote path> [| title | artist | album | track]" << std::endl;
        } else if (auto item = engine.addDownload(*request)) {
            std::cout << item->id() << std::endl;
        }
    } else if (command == "cancel") {
        std::cout << (engine.cancelDownload(args) ? "cancelled" : "not cancellable") << std::endl;
    } else if (command == "retry") {
        auto item = engine.retryDownload(args);
        std::cout << (item ? item->id() : std::string("not retryable")) << std::endl;
    } else if (command == "clear") {
        std::cout << "cleared " << engine.clearCompleted() << std::endl;
    } else if (command == "bulk") {
        engine.setBulkOperation(StringUtils::toLower(args) == "on");
    } else if (command == "status") {
        printStatus(engine);
    } else {
        printHelp();
    }
    return true;
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    fs::path configPath = fs::current_path() / "soulsync-queue.json";
    bool debugMode = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "SoulSync Queue - download queue engine for slskd\n"
                      << "\nUsage: " << argv[0] << " [options]\n"
                      << "\nOptions:\n"
                      << "  -c, --config <path>  Configuration file (default ./soulsync-queue.json)\n"
                      << "  -d, --debug          Enable debug logging\n"
                      << "  -h, --help           Show this help message\n"
                      << "  -v, --version        Show version information\n"
                      << std::endl;
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << core::Engine::getName() << " v" << core::Engine::getVersion() << std::endl;
            return 0;
        }
    }

    if (!loadConfiguration(configPath)) {
        return 1;
    }

    auto& config = core::Config::instance();

    auto level = core::Logger::levelFromString(config.get<std::string>("logging.level", "info"));
    core::Logger::instance().initialize(
        debugMode ? core::LogLevel::Debug : level,
        config.get<std::string>("logging.directory", ""),
        config.get<bool>("logging.file", true)
    );

    SOULSYNC_LOG_INFO("{} v{} starting (config {})",
        core::Engine::getName(), core::Engine::getVersion(), configPath.string());

    setupSignalHandlers();

    try {
        core::transfer::SlskdSettings slskd;
        slskd.baseUrl = config.get<std::string>("slskd.url", slskd.baseUrl);
        slskd.timeoutSeconds = config.get<int>("slskd.timeoutSeconds", slskd.timeoutSeconds);
        slskd.connectTimeoutSeconds = config.get<int>("slskd.connectTimeoutSeconds", slskd.connectTimeoutSeconds);

        auto credentials = std::make_shared<core::transfer::StaticCredentialProvider>(
            config.get<std::string>("slskd.apiKey", ""));
        auto service = std::make_shared<core::transfer::SlskdTransferService>(slskd, credentials);

        auto organizer = std::make_shared<core::completion::FileOrganizer>(
            config.get<std::string>("library.downloadDir", "./downloads"),
            config.get<std::string>("library.transferDir", "./Transfer"));

        core::Engine engine(core::EngineSettings::fromConfig(config), service, organizer);

        engine.subscribe(core::events::QueueUpdated, [](const core::json& data) {
            const auto& changes = data.value("changes", core::json::array());
            for (const auto& change : changes) {
                SOULSYNC_LOG_INFO("{}: {} -> {}",
                    change.value("id", ""), change.value("from", ""), change.value("to", ""));
            }
        });
        engine.subscribe(core::events::DownloadOrganized, [](const core::json& data) {
            SOULSYNC_LOG_INFO("Organized {} into {}", data.value("id", ""), data.value("path", ""));
        });

        if (!engine.start()) {
            SOULSYNC_LOG_CRITICAL("Failed to start engine");
            return 1;
        }

        // std::getline cannot be interrupted, so the reader is detached on exit
        auto commands = std::make_shared<CommandQueue>();
        std::thread reader([commands]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                commands->push(line);
            }
            commands->close();
        });
        reader.detach();

        printHelp();

        while (!g_stopRequested) {
            std::string line;
            bool closed = false;
            if (commands->pop(line, std::chrono::milliseconds(250), closed)) {
                if (!handleCommand(engine, line)) break;
            } else if (closed) {
                break;
            }
        }

        if (g_stopRequested) {
            SOULSYNC_LOG_INFO("Received signal, shutting down gracefully...");
        }

        engine.shutdown();
        config.save();

        SOULSYNC_LOG_INFO("SoulSync Queue shutdown complete");
        core::Logger::instance().flush();
        return 0;

    } catch (const std::exception& e) {
        SOULSYNC_LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }
}
