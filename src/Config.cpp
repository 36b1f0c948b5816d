#include "Config.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace rendezvous {

    namespace {

        uint64_t parseNumber(const std::string& option, const std::string& value, uint64_t min, uint64_t max) {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
            }

            uint64_t number = 0;
            try {
                number = std::stoull(value);
            } catch (const std::out_of_range&) {
                throw std::invalid_argument("Value for " + option + " is out of range: " + value);
            }

            if (number < min || number > max) {
                throw std::invalid_argument("Value for " + option + " must be between " +
                                            std::to_string(min) + " and " + std::to_string(max));
            }
            return number;
        }

    } // namespace

    RelayConfig parseCommandLine(int argc, const char* const argv[]) {
        RelayConfig config;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;
            bool hasValue = false;

            const auto eq = arg.find('=');
            if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                hasValue = true;
            }

            auto takeValue = [&]() -> std::string {
                if (hasValue) return value;
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                config.showHelp = true;
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--port") {
                config.port = static_cast<uint16_t>(parseNumber(arg, takeValue(), 0, std::numeric_limits<uint16_t>::max()));
            } else if (arg == "--identity") {
                config.identityPath = takeValue();
                if (config.identityPath.empty()) {
                    throw std::invalid_argument("--identity needs a non-empty path");
                }
            } else if (arg == "--max-reservations") {
                config.maxReservations = static_cast<uint32_t>(parseNumber(arg, takeValue(), 0, std::numeric_limits<uint32_t>::max()));
            } else if (arg == "--discovery") {
                const std::string mode = takeValue();
                auto parsed = parseDiscoveryMode(mode);
                if (!parsed) {
                    throw std::invalid_argument("Unknown discovery mode '" + mode + "' (expected rooms or broadcast)");
                }
                config.discoveryMode = *parsed;
            } else if (arg == "--threads") {
                config.workerThreads = static_cast<size_t>(parseNumber(arg, takeValue(), 1, 64));
            } else if (arg == "--sweep-interval") {
                config.sweepInterval = std::chrono::seconds(parseNumber(arg, takeValue(), 0, 86400));
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        }

        return config;
    }

    std::string usage(const std::string& program) {
        std::ostringstream out;
        out << "Usage: " << program << " [options]\n"
            << "\n"
            << "  --port <n>              TCP port for the WebSocket listeners (default " << DEFAULT_PORT << ")\n"
            << "  --identity <path>       identity key file (default " << DEFAULT_IDENTITY_PATH << ")\n"
            << "  --max-reservations <n>  relay reservation slots (default " << DEFAULT_MAX_RESERVATIONS << ")\n"
            << "  --discovery <mode>      rooms or broadcast (default rooms)\n"
            << "  --threads <n>           network worker threads (default " << DEFAULT_WORKER_THREADS << ")\n"
            << "  --sweep-interval <s>    prune expired room entries every s seconds, 0 = on registration only\n"
            << "  --verbose               debug logging\n"
            << "  --help                  show this text\n";
        return out.str();
    }

} // namespace rendezvous
