#include "rpipe/core/config.hpp"
#include "rpipe/core/logging.hpp"
#include "rpipe/events/components.hpp"
#include "rpipe/events/event_bus.hpp"
#include "rpipe/parity/par2_engine.hpp"
#include "rpipe/replay/replay.hpp"
#include "rpipe/store/object_store.hpp"
#include "rpipe/transfer/sender.hpp"
#include "rpipe/verify/repair.hpp"
#include "rpipe/verify/verifier.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

constexpr int kExitUsage = 2;

enum class Mode {
    Send,
    Verify,
    Replay
};

void print_usage(const char* program) {
    std::cerr
        << "Usage: " << program << " [options] <destination>\n"
        << "\n"
        << "Reads stdin and stores it at <destination> as checksummed chunks,\n"
        << "or with -r writes the stored stream back to stdout.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --chunksize N   chunk size in bytes [" << rpipe::SessionConfig::kDefaultChunkSize << "]\n"
        << "  -b, --blocksize N   read/write block size [" << rpipe::SessionConfig::kDefaultBlockSize << "]\n"
        << "  -t, --tempdir DIR   scratch directory [/tmp]\n"
        << "  -j, --jobs N        concurrent uploads [" << rpipe::SessionConfig::kDefaultJobs << "]\n"
        << "  -r, --replay        write the stored stream to stdout\n"
        << "  -n, --nocheck       skip checksum verification\n"
        << "      --verify        only check the integrity of the stored stream\n"
        << "      --par           create and upload parity for every chunk\n"
        << "      --repair        repair corrupted chunks from parity\n"
        << "      --local         destination is a local directory\n"
        << "      --config FILE   JSON configuration file\n"
        << "  -v, --verbose       debug logging\n"
        << "  -h, --help          show this help\n";
}

std::optional<std::size_t> parse_size(const std::string& flag, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const auto value = std::stoull(text, &consumed);
        if (consumed == text.size()) {
            return static_cast<std::size_t>(value);
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    spdlog::error("Invalid value for {}: {}", flag, text);
    return std::nullopt;
}

int fail_with(const rpipe::Error& error) {
    spdlog::error("{}", error.to_string());
    return rpipe::exit_code_for(error);
}

} // namespace

int main(int argc, char* argv[]) {
    if (auto res = rpipe::init_logging("info"); res.is_error()) {
        std::cerr << res.error().to_string() << "\n";
        return 1;
    }

    rpipe::SessionConfig config;
    Mode mode = Mode::Send;
    bool verbose = false;
    bool destination_given = false;

    // The config file is applied first so flags override it wherever they
    // appear on the command line
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            if (auto res = rpipe::load_config_file(argv[i + 1], config); res.is_error()) {
                return fail_with(res.error());
            }
        }
    }
    if (config.verify_only) {
        mode = Mode::Verify;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--chunksize") && has_value) {
            auto value = parse_size(arg, argv[++i]);
            if (!value) {
                return kExitUsage;
            }
            config.chunk_size = *value;
        } else if ((arg == "-b" || arg == "--blocksize") && has_value) {
            auto value = parse_size(arg, argv[++i]);
            if (!value) {
                return kExitUsage;
            }
            config.block_size = *value;
        } else if ((arg == "-j" || arg == "--jobs") && has_value) {
            auto value = parse_size(arg, argv[++i]);
            if (!value) {
                return kExitUsage;
            }
            config.jobs = *value;
        } else if ((arg == "-t" || arg == "--tempdir") && has_value) {
            config.scratch_dir = argv[++i];
        } else if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "-r" || arg == "--replay") {
            mode = Mode::Replay;
        } else if (arg == "-n" || arg == "--nocheck") {
            config.skip_checksum = true;
        } else if (arg == "--verify") {
            mode = Mode::Verify;
        } else if (arg == "--par") {
            config.create_parity = true;
        } else if (arg == "--repair") {
            config.attempt_repair = true;
        } else if (arg == "--local") {
            config.backend = rpipe::StoreBackend::Local;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown or incomplete option: {}", arg);
            print_usage(argv[0]);
            return kExitUsage;
        } else if (destination_given) {
            spdlog::error("Unexpected argument: {}", arg);
            return kExitUsage;
        } else {
            config.destination = arg;
            destination_given = true;
        }
    }

    config.verify_only = mode == Mode::Verify;
    if (mode == Mode::Verify && config.skip_checksum) {
        spdlog::error("--verify and --nocheck cannot be combined");
        return kExitUsage;
    }

    if (auto res = rpipe::init_logging(verbose ? "debug" : config.log_level); res.is_error()) {
        return fail_with(res.error());
    }
    if (auto res = config.validate(); res.is_error()) {
        print_usage(argv[0]);
        return fail_with(res.error());
    }

    spdlog::debug("destination={} backend={} chunk={} block={} jobs={} scratch={}",
                  config.destination, rpipe::backend_name(config.backend), config.chunk_size,
                  config.block_size, config.jobs, config.scratch_dir.string());

    rpipe::events::EventBus bus;
    rpipe::events::LoggerComponent logger(bus);
    rpipe::events::MetricsComponent metrics(bus);

    auto store = rpipe::store::make_store(config);
    rpipe::parity::Par2Engine engine(config.par2_binary, config.parity_redundancy);
    rpipe::verify::RepairCoordinator repair(config, *store, engine, &bus);

    int status = 0;
    switch (mode) {
        case Mode::Verify: {
            rpipe::verify::IntegrityVerifier verifier(config, *store, &repair, &bus);
            auto res = verifier.check();
            if (res.is_error()) {
                status = fail_with(res.error());
            } else {
                spdlog::info("Success. Checksums match.");
            }
            break;
        }
        case Mode::Replay: {
            rpipe::replay::ReplayEngine replayer(config, *store, &repair, &bus);
            auto res = replayer.replay(std::cout);
            if (res.is_error()) {
                status = fail_with(res.error());
            } else if (!res.value().mismatched_chunks.empty() || !res.value().total_matched) {
                spdlog::warn("Replay finished with {} mismatched chunks", res.value().mismatched_chunks.size());
            }
            break;
        }
        case Mode::Send: {
            rpipe::transfer::Sender sender(config, *store, &repair, &bus);
            auto res = sender.send(std::cin);
            if (res.is_error()) {
                status = rpipe::exit_code_for(res.error());
            }
            break;
        }
    }

    metrics.print_stats();
    return status;
}
