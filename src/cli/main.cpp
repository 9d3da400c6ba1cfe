#include "config.hpp"
#include "dispatch/dispatcher.hpp"
#include "engine/local_engine.hpp"
#include "net/curl_transport.hpp"
#include "platform/platform_paths.hpp"
#include "provider/cloud_provider.hpp"
#include "provider/local_provider.hpp"

#include <future>
#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] FILE...", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH     Config file path");
    std::println(stderr, "  -p, --provider NAME   cloud or local (overrides config)");
    std::println(stderr, "  -m, --mime TYPE       MIME type of the audio files");
    std::println(stderr, "      --prompt TEXT     Hint passed to the cloud model");
    std::println(stderr, "  -v, --verbose         Enable verbose logging");
    std::println(stderr, "  -h, --help            Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string provider_name;
    TranscriptionRequest base;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--provider" || arg == "-p") && i + 1 < argc) {
            provider_name = argv[++i];
        } else if ((arg == "--mime" || arg == "-m") && i + 1 < argc) {
            base.mime_type = argv[++i];
        } else if (arg == "--prompt" && i + 1 < argc) {
            base.prompt_hint = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg.starts_with("-")) {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!provider_name.empty() &&
        !parse_provider_kind(provider_name, config.providers.provider)) {
        std::println(stderr, "Unknown provider: {}", provider_name);
        return 1;
    }

    CurlTransport transport(CurlTransport::Options{
        .connect_timeout_s = config.http.connect_timeout_s,
        .read_timeout_s = config.http.read_timeout_s,
    });
    CloudProvider cloud(transport);
    LocalProvider local(LocalEngineHandle::shared(), platform::models_dir());

    std::vector<std::future<Outcome>> pending;
    {
        ProviderDispatcher dispatcher(cloud, local, config.dispatch.workers,
                                      config.dispatch.queue_capacity, verbose);
        for (auto& file : files) {
            TranscriptionRequest request = base;
            request.file_path = file;
            pending.push_back(dispatcher.prompt(std::move(request), config.providers));
        }
        // Dispatcher teardown waits for the queued jobs.
    }

    int rc = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        auto outcome = pending[i].get();
        if (files.size() > 1) {
            std::println("{}: {}", files[i], describe(outcome));
        } else {
            std::println("{}", describe(outcome));
        }

        if (std::holds_alternative<RateLimited>(outcome)) {
            rc = 2;
        } else if (std::holds_alternative<TranscriptionFailed>(outcome) && rc == 0) {
            rc = 1;
        }
    }
    return rc;
}
