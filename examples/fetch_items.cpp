/**
 * @file fetch_items.cpp
 * @brief Fetch a set of resources in parallel through a configured client
 *
 * Reads a YAML client configuration, builds one request builder from it
 * and fetches every path given on the command line at once with
 * fork_join. Prints one status line per path followed by the metrics
 * collected in the process.
 *
 * Usage:
 *   restful_fetch client.yaml /items/1 /items/2 /items/3
 */

#include <restful/client/concurrent.hpp>
#include <restful/client/config_loader.hpp>
#include <restful/common/debug.hpp>
#include <restful/common/metrics.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace restful;
using namespace restful::client;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> <path>..." << std::endl;
        return 2;
    }

    common::debug::init_logging();

    auto loaded = ClientConfigLoader::load_file(argv[1]);
    if (!loaded) {
        std::cerr << loaded.error().to_string() << std::endl;
        return 1;
    }
    const auto& config = loaded.value();
    if (config.log_level) {
        common::debug::Logger::instance().set_level(*config.log_level);
    }

    auto resources          = ClientResources::create();
    resources.retry_limiter = std::make_shared<common::ConcurrencyLimiter>(
        config.retry.limiter_capacity);

    RequestBuilder builder(config.make_builder_config(), resources);

    std::vector<std::string> paths(argv + 2, argv + argc);
    std::vector<std::shared_ptr<FutureResponse>> futures;

    fork_join(builder, [&](Concurrent& c) {
        for (const auto& path : paths) {
            futures.push_back(c.get(path));
        }
    });

    int failures = 0;
    for (size_t i = 0; i < paths.size(); ++i) {
        auto response = futures[i]->peek();
        std::cout << paths[i] << ": ";
        if (response->has_error()) {
            std::cout << response->error->summary();
            ++failures;
        } else {
            std::cout << response->status_code << " (" << response->body.size() << " bytes"
                      << (response->from_cache() ? ", cached" : "") << ")";
        }
        std::cout << "\n";
    }

    std::cout << "\n" << common::metrics::MetricRegistry::instance().prometheus_export();
    return failures == 0 ? 0 : 1;
}
