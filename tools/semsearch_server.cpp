#include "semsearch/embed/embedding_backend.hpp"
#include "semsearch/index/hnsw_io.hpp"
#include "semsearch/serve/batch_scheduler.hpp"
#include "semsearch/serve/inference_service.hpp"
#include "semsearch/serve/server_config.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <pthread.h>

#include <grpcpp/grpcpp.h>

namespace {
static int fail(const semsearch::core::error& e) {
    std::cerr << "error: " << semsearch::core::describe(e) << "\n";
    return 1;
}
} // namespace

int main(int argc, char** argv) {
    auto config = semsearch::serve::parse_server_args(argc, argv);
    if (!config) {
        std::cerr << semsearch::serve::server_usage();
        return fail(config.error());
    }
    if (config->show_help) {
        std::cout << semsearch::serve::server_usage();
        return 0;
    }

    // Block termination signals before any thread starts; one watcher thread receives them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        return fail(semsearch::core::error{semsearch::core::error_code::internal,
                                           "cannot block termination signals", "server"});
    }

    semsearch::index::LoadOptions load_opts;
    load_opts.expected_dim = config->embedding_dim;
    load_opts.use_mmap = config->use_mmap;
    auto loaded = semsearch::index::load_index(config->index_path, load_opts);
    if (!loaded) return fail(loaded.error());
    auto index = std::make_shared<const semsearch::index::HnswIndex>(std::move(*loaded));
    if (config->verbose) {
        std::cerr << "[server] loaded " << index->size() << " vectors (dim=" << index->dimension()
                  << ", metric=" << semsearch::kernels::to_string(index->metric())
                  << ", quantized=" << (index->is_quantized() ? "yes" : "no")
                  << ", mmap=" << (config->use_mmap ? "yes" : "no") << ")" << std::endl;
    }

    auto backend = std::make_shared<semsearch::embed::HashingEmbedder>(config->embedding_dim);
    auto created = semsearch::serve::BatchScheduler::create(index, backend, config->scheduler);
    if (!created) return fail(created.error());
    std::shared_ptr<semsearch::serve::BatchScheduler> scheduler = std::move(*created);

    semsearch::serve::InferenceServiceImpl service(scheduler);
    grpc::ServerBuilder builder;
    int bound_port = 0;
    builder.AddListeningPort(config->listen_address, grpc::InsecureServerCredentials(), &bound_port);
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server || bound_port == 0) {
        return fail(semsearch::core::error{semsearch::core::error_code::unavailable,
                                           "cannot listen on " + config->listen_address, "server"});
    }
    std::cout << "semsearch server listening on " << config->listen_address << std::endl;

    std::thread watcher([&server, &signals, verbose = config->verbose] {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0) {
            std::cerr << "[server] sigwait failed, shutting down" << std::endl;
        } else if (verbose) {
            std::cerr << "[server] signal " << sig << ", shutting down" << std::endl;
        }
        server->Shutdown();
    });

    server->Wait();
    watcher.join();
    scheduler->shutdown();

    if (config->verbose) {
        const auto stats = scheduler->stats();
        std::cerr << "[server] served " << stats.requests << " requests in " << stats.batches
                  << " batches (" << stats.failed_batches << " failed)" << std::endl;
    }
    return 0;
}
