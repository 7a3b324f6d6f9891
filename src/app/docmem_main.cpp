// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 docmem contributors

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <docmem/app/services.h>
#include <docmem/config/config_helpers.h>
#include <docmem/pipeline/constants.h>
#include <docmem/pipeline/pipeline_worker.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stopRequested{false};

void stop_handler(int) {
    g_stopRequested = true;
}

void setup_logging(const std::string& cliLevel) {
    auto console = spdlog::stderr_color_mt("docmem");
    spdlog::set_default_logger(console);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    std::string level = cliLevel;
    if (level.empty()) {
        level = docmem::config::get_env("DOCMEM_LOG_LEVEL").value_or("info");
    }
    spdlog::set_level(spdlog::level::from_str(level));
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        docmem::config::trim(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

int report(const docmem::Error& error) {
    spdlog::error("{}", error.message);
    std::cerr << "Error: " << error.message << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"docmem - durable document ingestion pipeline"};
    app.require_subcommand(1);

    std::string configPath;
    std::string logLevel;
    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");

    // ingest
    auto* ingest = app.add_subcommand("ingest", "Upload files and schedule their ingestion");
    std::vector<std::string> ingestFiles;
    std::string ingestIndex;
    std::string ingestId;
    std::vector<std::string> ingestTags;
    std::string ingestSteps;
    std::string ingestText;
    ingest->add_option("files", ingestFiles, "Files to ingest");
    ingest->add_option("--index", ingestIndex, "Target index")
        ->default_val(docmem::pipeline::kDefaultIndex);
    ingest->add_option("--id", ingestId, "Document id (generated when omitted)");
    ingest->add_option("--tag", ingestTags, "Tag as key=value (repeatable)");
    ingest->add_option("--steps", ingestSteps, "Comma separated pipeline steps");
    ingest->add_option("--text", ingestText, "Ingest this text instead of files");

    // status
    auto* status = app.add_subcommand("status", "Print the pipeline status of a document");
    std::string statusIndex;
    std::string statusId;
    status->add_option("--index", statusIndex, "Index")
        ->default_val(docmem::pipeline::kDefaultIndex);
    status->add_option("--id", statusId, "Document id")->required();

    // delete
    auto* remove = app.add_subcommand("delete", "Schedule deletion of a document or an index");
    std::string deleteIndex;
    std::string deleteId;
    remove->add_option("--index", deleteIndex, "Index")->required();
    remove->add_option("--id", deleteId, "Document id (deletes the whole index when omitted)");

    // worker
    auto* worker = app.add_subcommand("worker", "Process queued pipeline operations");
    int workerThreads = 0;
    bool once = false;
    worker->add_option("--threads", workerThreads, "Worker threads (default from config)");
    worker->add_flag("--once", once, "Exit when no operation is claimable");

    CLI11_PARSE(app, argc, argv);

    setup_logging(logLevel);

    auto cfg = docmem::config::DocMemConfig::load(docmem::config::get_config_path(configPath));
    if (!cfg) {
        return report(cfg.error());
    }
    auto services = docmem::app::openServices(cfg.value());
    if (!services) {
        return report(services.error());
    }
    auto& svc = services.value();

    if (*ingest) {
        docmem::pipeline::ImportRequest request;
        request.index = ingestIndex;
        request.document_id = ingestId;
        request.steps = split_list(ingestSteps);
        for (const auto& tag : ingestTags) {
            auto eq = tag.find('=');
            if (eq == std::string::npos || eq == 0) {
                return report(docmem::Error{docmem::ErrorCode::InvalidArgument,
                                            "Tags must be key=value, got '" + tag + "'"});
            }
            request.tags[tag.substr(0, eq)].push_back(tag.substr(eq + 1));
        }
        if (!ingestText.empty()) {
            request.files.push_back({"content.txt", ingestText, "text/plain"});
        }
        for (const auto& path : ingestFiles) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return report(docmem::Error{docmem::ErrorCode::FileNotFound,
                                            "Cannot read " + path});
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            request.files.push_back(
                {std::filesystem::path(path).filename().string(), buffer.str(), {}});
        }

        auto documentId = svc.orchestrator->importDocument(std::move(request));
        if (!documentId) {
            return report(documentId.error());
        }
        std::cout << documentId.value() << std::endl;
        return 0;
    }

    if (*status) {
        auto snapshot = svc.orchestrator->readPipelineStatus(statusIndex, statusId);
        if (!snapshot) {
            return report(snapshot.error());
        }
        if (!snapshot.value()) {
            return report(docmem::Error{docmem::ErrorCode::NotFound,
                                        "No pipeline for " + statusIndex + "/" + statusId});
        }
        docmem::pipeline::json out = *snapshot.value();
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (*remove) {
        auto result = deleteId.empty() ? svc.orchestrator->deleteIndex(deleteIndex)
                                       : svc.orchestrator->deleteDocument(deleteIndex, deleteId);
        if (!result) {
            return report(result.error());
        }
        std::cout << "Deletion scheduled" << std::endl;
        return 0;
    }

    // worker
    docmem::pipeline::PipelineWorker pipelineWorker(svc.orchestrator, svc.queue, svc.config.queue);
    if (once) {
        auto processed = pipelineWorker.drain();
        if (!processed) {
            return report(processed.error());
        }
        spdlog::info("Processed {} operation(s)", processed.value());
        return 0;
    }

    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);
    const auto threads =
        static_cast<std::size_t>(workerThreads > 0 ? workerThreads : svc.config.worker.threads);
    try {
        pipelineWorker.start(threads);
    } catch (const std::exception& e) {
        return report(docmem::Error{docmem::ErrorCode::InternalError, e.what()});
    }
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    pipelineWorker.stop();
    pipelineWorker.join();

    auto stats = pipelineWorker.stats();
    spdlog::info("Worker stopped: {} claimed, {} completed, {} retried, {} poisoned", stats.claimed,
                 stats.completed, stats.retried, stats.poisoned);
    return 0;
}
